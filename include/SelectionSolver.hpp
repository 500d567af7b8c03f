#ifndef INVOICE_SELECTION_SOLVER_HPP
#define INVOICE_SELECTION_SOLVER_HPP

#include <optional>
#include <string>
#include <vector>

namespace invoice {

/**
 * @brief One selectable line item in the optimization model
 */
struct SelectionItem {
  int id = 0;          ///< Candidate id
  double weight = 0.0; ///< Objective reward for including the item
  double amount = 0.0; ///< Contribution to the selected total
  int group = -1;      ///< Duplicate group, at most one member is chosen
};

/**
 * @brief Binary selection problem handed to a solver
 *
 * maximize   sum(weight_i * x_i) - penaltyWeight * (over + under)
 * subject to sum(x_i for i in group g) <= 1            for every group g
 *            sum(amount_i * x_i) - over + under = target (when present)
 *            x_i binary, over >= 0, under >= 0
 */
struct SelectionModel {
  std::vector<SelectionItem> items;
  std::optional<double> target;
  double penaltyWeight = 10.0;
};

/**
 * @brief What a solver reported for a model
 */
struct SolverOutcome {
  enum class Status {
    Optimal,     ///< Proven optimal selection
    Infeasible,  ///< No solution (includes hitting the time limit)
    Unavailable, ///< The solver cannot run on this machine
    Error        ///< The solver ran but its result is unusable
  };

  Status status = Status::Error;
  std::vector<int> selectedIds; ///< Candidate ids with x_i = 1
  double objectiveValue = 0.0;
  std::string message; ///< Diagnostic for logs
};

/**
 * @brief Optimization capability consumed by the reconciler
 */
class SelectionSolver {
public:
  virtual ~SelectionSolver() = default;

  /**
   * @brief Short solver name reported with the reconciliation result
   */
  virtual std::string name() const = 0;

  /**
   * @brief Solve a selection model
   *
   * Implementations report failures through the outcome status. The call
   * may block; callers enforce their own wall-clock limit on top of
   * @p timeLimitSeconds.
   */
  virtual SolverOutcome solve(const SelectionModel &model,
                              int timeLimitSeconds) = 0;
};

/**
 * @brief Write a model in CPLEX LP format
 *
 * Item i is the binary variable x<i>; the deviation slacks are "over" and
 * "under". Group constraints are emitted only for groups with two or more
 * items.
 */
std::string toLpFormat(const SelectionModel &model);

/**
 * @brief Read a CBC solution file ("solu" output) for a model
 *
 * The first line carries the status ("Optimal - objective value 270.0",
 * "Infeasible - ...", "Stopped on time - ..."); each further line is
 * "<index> <name> <value> <reduced cost>", optionally prefixed by "**".
 */
SolverOutcome parseCbcSolution(const std::string &text,
                               const SelectionModel &model);

/**
 * @brief Runs the COIN-OR CBC command-line solver
 *
 * The binary is taken from the constructor argument, else INVOICE_CBC_PATH,
 * else "cbc" on the PATH.
 */
class CbcCommandSolver : public SelectionSolver {
public:
  CbcCommandSolver();
  explicit CbcCommandSolver(const std::string &binaryPath);

  std::string name() const override;
  SolverOutcome solve(const SelectionModel &model,
                      int timeLimitSeconds) override;

  /**
   * @brief Whether the configured binary can be executed
   */
  bool isAvailable() const;

  const std::string &getBinaryPath() const;

private:
  std::string m_binaryPath;
};

} // namespace invoice

#endif // INVOICE_SELECTION_SOLVER_HPP
