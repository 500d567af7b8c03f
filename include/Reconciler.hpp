#ifndef INVOICE_RECONCILER_HPP
#define INVOICE_RECONCILER_HPP

#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"
#include "SelectionSolver.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace invoice {

/**
 * @brief Chooses the line items that make up the invoice
 *
 * Without a target total every duplicate group contributes its most
 * confident member. With a target the choice is an optimization: maximize
 * the summed confidence of the selection minus a penalty per unit of
 * deviation from the target, with at most one member per duplicate group.
 * Solver failures never propagate; they degrade to the per-group selection
 * with status Infeasible and a warning.
 *
 * Example usage:
 * @code
 * auto solver = std::make_shared<invoice::CbcCommandSolver>();
 * invoice::Reconciler reconciler(invoice::ReconcileConfig(), solver);
 * std::vector<invoice::Warning> warnings;
 * auto result = reconciler.reconcile(candidates, 480.0, &warnings);
 * @endcode
 */
class Reconciler {
public:
  Reconciler(const ReconcileConfig &config,
             std::shared_ptr<SelectionSolver> solver);

  /**
   * @brief Select candidates, optionally matching a target total
   * @param candidates Candidates annotated with duplicate groups
   * @param target Reported grand total, if any
   * @param warnings Receives solver degradation warnings (may be null)
   */
  ReconciliationResult reconcile(const std::vector<Candidate> &candidates,
                                 std::optional<double> target,
                                 std::vector<Warning> *warnings = nullptr) const;

  /**
   * @brief Most confident member of every duplicate group
   *
   * Ties go to the lowest id. Candidates without amount or flagged as
   * boilerplate are not eligible.
   *
   * @return Ascending candidate ids
   */
  static std::vector<int>
  bestPerGroup(const std::vector<Candidate> &candidates);

  /**
   * @brief Build the optimization model for eligible candidates
   */
  SelectionModel buildModel(const std::vector<Candidate> &candidates,
                            double target) const;

  const ReconcileConfig &getConfig() const;

private:
  SolverOutcome runSolver(const SelectionModel &model) const;

  ReconcileConfig m_config;
  std::shared_ptr<SelectionSolver> m_solver;
};

} // namespace invoice

#endif // INVOICE_RECONCILER_HPP
