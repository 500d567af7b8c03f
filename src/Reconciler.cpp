#include "Reconciler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <future>
#include <iostream>
#include <map>
#include <set>
#include <thread>

namespace invoice {

namespace {

// Separates equal confidences in favour of lower ids without outweighing
// any real confidence difference
const double kTieBreakEpsilon = 1e-6;

bool isEligible(const Candidate &candidate) {
  return candidate.amount.has_value() && !candidate.boilerplate;
}

int groupKey(const Candidate &candidate) {
  return candidate.duplicateGroup >= 0 ? candidate.duplicateGroup
                                       : candidate.id;
}

void addWarning(std::vector<Warning> *warnings, ErrorCategory category,
                const std::string &message) {
  if (warnings != nullptr) {
    warnings->push_back({category, 0, message});
  }
}

} // anonymous namespace

Reconciler::Reconciler(const ReconcileConfig &config,
                       std::shared_ptr<SelectionSolver> solver)
    : m_config(config), m_solver(std::move(solver)) {}

const ReconcileConfig &Reconciler::getConfig() const { return m_config; }

std::vector<int>
Reconciler::bestPerGroup(const std::vector<Candidate> &candidates) {
  std::map<int, const Candidate *> best;
  for (const auto &candidate : candidates) {
    if (!isEligible(candidate)) {
      continue;
    }
    const Candidate *&current = best[groupKey(candidate)];
    if (current == nullptr) {
      current = &candidate;
      continue;
    }
    double mine = candidate.confidence.value_or(-1.0);
    double theirs = current->confidence.value_or(-1.0);
    if (mine > theirs || (mine == theirs && candidate.id < current->id)) {
      current = &candidate;
    }
  }

  std::vector<int> ids;
  for (const auto &entry : best) {
    ids.push_back(entry.second->id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

SelectionModel Reconciler::buildModel(const std::vector<Candidate> &candidates,
                                      double target) const {
  std::vector<const Candidate *> eligible;
  for (const auto &candidate : candidates) {
    if (isEligible(candidate)) {
      eligible.push_back(&candidate);
    }
  }
  std::sort(eligible.begin(), eligible.end(),
            [](const Candidate *a, const Candidate *b) { return a->id < b->id; });

  SelectionModel model;
  model.target = target;
  model.penaltyWeight = m_config.penaltyWeight;
  const size_t count = eligible.size();
  for (size_t rank = 0; rank < count; ++rank) {
    const Candidate &candidate = *eligible[rank];
    SelectionItem item;
    item.id = candidate.id;
    item.weight = candidate.confidence.value_or(0.0) +
                  kTieBreakEpsilon * static_cast<double>(count - rank);
    item.amount = *candidate.amount;
    item.group = groupKey(candidate);
    model.items.push_back(item);
  }
  return model;
}

SolverOutcome Reconciler::runSolver(const SelectionModel &model) const {
  const int limit = std::max(1, m_config.solverTimeoutSeconds);

  // The solve owns its inputs so an abandoned call can finish safely
  auto solver = m_solver;
  auto sharedModel = std::make_shared<SelectionModel>(model);
  std::packaged_task<SolverOutcome()> task(
      [solver, sharedModel, limit]() { return solver->solve(*sharedModel, limit); });
  std::future<SolverOutcome> result = task.get_future();
  std::thread(std::move(task)).detach();

  if (result.wait_for(std::chrono::seconds(limit)) !=
      std::future_status::ready) {
    SolverOutcome timedOut;
    timedOut.status = SolverOutcome::Status::Infeasible;
    timedOut.message =
        "solver did not finish within " + std::to_string(limit) + " s";
    return timedOut;
  }

  try {
    return result.get();
  } catch (const std::exception &e) {
    SolverOutcome failed;
    failed.status = SolverOutcome::Status::Error;
    failed.message = std::string("solver failed: ") + e.what();
    return failed;
  }
}

ReconciliationResult
Reconciler::reconcile(const std::vector<Candidate> &candidates,
                      std::optional<double> target,
                      std::vector<Warning> *warnings) const {
  ReconciliationResult result;

  std::map<int, const Candidate *> byId;
  for (const auto &candidate : candidates) {
    if (isEligible(candidate)) {
      byId[candidate.id] = &candidate;
    }
  }

  if (!target) {
    result.selectedIds = bestPerGroup(candidates);
  } else if (byId.empty()) {
    // Nothing to choose from; the deviation is the whole target
  } else if (!m_solver) {
    addWarning(warnings, ErrorCategory::SolverUnavailable,
               "No solver configured; using the best candidate per group");
    result.status = ReconciliationResult::Status::Infeasible;
    result.selectedIds = bestPerGroup(candidates);
  } else {
    SelectionModel model = buildModel(candidates, *target);
    SolverOutcome outcome = runSolver(model);
    result.solverName = m_solver->name();

    if (outcome.status == SolverOutcome::Status::Optimal) {
      // Reject selections that break the model's constraints
      std::set<int> groups;
      bool valid = true;
      for (int id : outcome.selectedIds) {
        auto it = byId.find(id);
        if (it == byId.end() || !groups.insert(groupKey(*it->second)).second) {
          valid = false;
          break;
        }
      }
      if (!valid) {
        outcome.status = SolverOutcome::Status::Error;
        outcome.message = "solver returned an invalid selection";
      }
    }

    switch (outcome.status) {
    case SolverOutcome::Status::Optimal:
      result.selectedIds = outcome.selectedIds;
      std::sort(result.selectedIds.begin(), result.selectedIds.end());
      break;
    case SolverOutcome::Status::Unavailable:
      std::cerr << "Solver unavailable: " << outcome.message << std::endl;
      addWarning(warnings, ErrorCategory::SolverUnavailable,
                 "Solver unavailable; using the best candidate per group");
      result.status = ReconciliationResult::Status::Infeasible;
      result.selectedIds = bestPerGroup(candidates);
      break;
    case SolverOutcome::Status::Infeasible:
    case SolverOutcome::Status::Error:
    default:
      std::cerr << "Solver gave no usable solution: " << outcome.message
                << std::endl;
      addWarning(warnings, ErrorCategory::SolverInfeasible,
                 "No optimal selection found; using the best candidate per "
                 "group");
      result.status = ReconciliationResult::Status::Infeasible;
      result.selectedIds = bestPerGroup(candidates);
      break;
    }
  }

  long long cents = 0;
  for (int id : result.selectedIds) {
    cents += toCents(*byId.at(id)->amount);
  }
  result.selectedTotal = static_cast<double>(cents) / 100.0;
  if (target) {
    long long deviationCents = cents - toCents(*target);
    result.deviation = static_cast<double>(deviationCents) / 100.0;
    result.withinTolerance =
        std::llabs(deviationCents) <= toCents(m_config.tolerance);
  }
  return result;
}

} // namespace invoice
