#include <catch2/catch_all.hpp>

#include "SelectionSolver.hpp"

using namespace invoice;
using Catch::Matchers::ContainsSubstring;

namespace {

SelectionModel sampleModel() {
  SelectionModel model;
  model.items = {{7, 90.0, 100.0, 7}, {8, 80.0, 100.0, 7}, {9, 70.0, 50.0, 9}};
  model.target = 150.0;
  model.penaltyWeight = 10.0;
  return model;
}

} // namespace

TEST_CASE("toLpFormat writes objective, constraints and binaries", "[solver]") {
  std::string lp = toLpFormat(sampleModel());

  REQUIRE_THAT(lp, ContainsSubstring("Maximize\n obj: 90.00000000 x0 + "
                                     "80.00000000 x1 + 70.00000000 x2 - "
                                     "10.00000000 over - 10.00000000 under\n"));
  REQUIRE_THAT(lp, ContainsSubstring(
                       " g7: 1.00000000 x0 + 1.00000000 x1 <= 1\n"));
  REQUIRE_THAT(lp, ContainsSubstring(
                       " total: 100.00000000 x0 + 100.00000000 x1 + "
                       "50.00000000 x2 - 1.00000000 over + 1.00000000 under "
                       "= 150.00000000\n"));
  REQUIRE_THAT(lp, ContainsSubstring("Binary\n x0\n x1\n x2\nEnd\n"));
  REQUIRE_THAT(lp, ContainsSubstring(" over >= 0\n"));

  // Single-member groups need no row
  REQUIRE(lp.find(" g9:") == std::string::npos);
}

TEST_CASE("toLpFormat without target or groups still has a row",
          "[solver]") {
  SelectionModel model;
  model.items = {{0, 50.0, 10.0, 0}, {1, 40.0, 20.0, 1}};

  std::string lp = toLpFormat(model);
  REQUIRE_THAT(lp, ContainsSubstring(
                       " count: 1.00000000 x0 + 1.00000000 x1 <= 2\n"));
  REQUIRE(lp.find("over") == lp.find("over >= 0"));
  REQUIRE(lp.find(" total:") == std::string::npos);
}

TEST_CASE("parseCbcSolution reads an optimal solution", "[solver]") {
  const std::string solution =
      "Optimal - objective value 160.00000000\n"
      "      0 x0                     1                      -90\n"
      "      1 x1                     0                      -80\n"
      "**    2 x2                     1                      -70\n"
      "      3 over                   0                       10\n";

  SolverOutcome outcome = parseCbcSolution(solution, sampleModel());
  REQUIRE(outcome.status == SolverOutcome::Status::Optimal);
  REQUIRE(outcome.selectedIds == std::vector<int>{7, 9});
  REQUIRE(outcome.objectiveValue == Catch::Approx(160.0));
}

TEST_CASE("parseCbcSolution maps failure states", "[solver]") {
  auto model = sampleModel();

  auto infeasible =
      parseCbcSolution("Infeasible - objective value 0.00000000\n", model);
  REQUIRE(infeasible.status == SolverOutcome::Status::Infeasible);
  REQUIRE(infeasible.selectedIds.empty());

  auto stopped = parseCbcSolution(
      "Stopped on time - objective value 120.00000000\n"
      "      0 x0                     1                      -90\n",
      model);
  REQUIRE(stopped.status == SolverOutcome::Status::Infeasible);
  REQUIRE_THAT(stopped.message, ContainsSubstring("time limit"));

  REQUIRE(parseCbcSolution("", model).status == SolverOutcome::Status::Error);
  REQUIRE(parseCbcSolution("Segmentation fault\n", model).status ==
          SolverOutcome::Status::Error);
}

TEST_CASE("parseCbcSolution ignores unknown variables", "[solver]") {
  const std::string solution = "Optimal - objective value 90\n"
                               "      0 x0    1   0\n"
                               "      1 x17   1   0\n"
                               "      2 under 4   0\n"
                               "   garbage line\n";
  auto outcome = parseCbcSolution(solution, sampleModel());
  REQUIRE(outcome.status == SolverOutcome::Status::Optimal);
  REQUIRE(outcome.selectedIds == std::vector<int>{7});
}

TEST_CASE("CbcCommandSolver reports a missing binary as unavailable",
          "[solver]") {
  CbcCommandSolver solver("/nonexistent/bin/cbc");
  REQUIRE(solver.getBinaryPath() == "/nonexistent/bin/cbc");
  REQUIRE(solver.name() == "cbc");
  REQUIRE_FALSE(solver.isAvailable());

  auto outcome = solver.solve(sampleModel(), 5);
  REQUIRE(outcome.status == SolverOutcome::Status::Unavailable);
}
