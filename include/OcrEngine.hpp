#ifndef INVOICE_OCR_ENGINE_HPP
#define INVOICE_OCR_ENGINE_HPP

#include "InvoiceTypes.hpp"

#include <opencv2/opencv.hpp>

#include <vector>

namespace invoice {

/**
 * @brief Character recognition capability
 *
 * recognize() is called concurrently from the page workers, so
 * implementations must be safe to share between threads.
 */
class OcrEngine {
public:
  virtual ~OcrEngine() = default;

  /**
   * @brief Prepare the engine
   * @return false if the engine cannot be used
   */
  virtual bool initialize() = 0;

  /**
   * @brief Recognize the words in an image
   * @param image BGR or gray image
   * @return Words with confidence (0-100) and boxes relative to @p image
   * @throws std::runtime_error if recognition fails
   */
  virtual std::vector<OcrToken> recognize(const cv::Mat &image) = 0;
};

} // namespace invoice

#endif // INVOICE_OCR_ENGINE_HPP
