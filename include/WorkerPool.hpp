#ifndef INVOICE_WORKER_POOL_HPP
#define INVOICE_WORKER_POOL_HPP

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace invoice {

/**
 * @brief Fixed-size pool of worker threads fed from a FIFO queue
 *
 * The destructor finishes every queued task before joining the workers.
 */
class WorkerPool {
public:
  /**
   * @param threads Number of workers; 0 = hardware concurrency
   */
  explicit WorkerPool(size_t threads = 0) {
    if (threads == 0) {
      threads = std::max(1u, std::thread::hardware_concurrency());
    }
    m_workers.reserve(threads);

    for (size_t i = 0; i < threads; ++i) {
      m_workers.emplace_back([this] {
        while (true) {
          std::function<void()> task;

          {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock,
                             [this] { return m_stop || !m_tasks.empty(); });

            if (m_stop && m_tasks.empty()) {
              return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
          }

          task();
        }
      });
    }
  }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  ~WorkerPool() {
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_stop = true;
    }
    m_condition.notify_all();
    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  /**
   * @brief Queue a callable and get a future for its result
   *
   * Exceptions thrown by the callable are delivered through the future.
   */
  template <class F>
  auto submit(F &&f) -> std::future<std::invoke_result_t<F>> {
    using Result = std::invoke_result_t<F>;
    auto task =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    std::future<Result> result = task->get_future();
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_tasks.emplace([task] { (*task)(); });
    }
    m_condition.notify_one();
    return result;
  }

  size_t size() const { return m_workers.size(); }

private:
  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;
  std::mutex m_mutex;
  std::condition_variable m_condition;
  std::atomic<bool> m_stop{false};
};

} // namespace invoice

#endif // INVOICE_WORKER_POOL_HPP
