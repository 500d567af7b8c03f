#include "SelectionSolver.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>

namespace invoice {

namespace fs = std::filesystem;

namespace {

std::string formatNumber(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(8) << value;
  return out.str();
}

// Appends " + 3.5 x1" / " - 3.5 x1", or "3.5 x1" for the first term
void appendTerm(std::ostringstream &out, double coefficient,
                const std::string &variable, bool &first) {
  if (coefficient == 0.0) {
    return;
  }
  if (first) {
    if (coefficient < 0) {
      out << "- ";
    }
  } else {
    out << (coefficient < 0 ? " - " : " + ");
  }
  out << formatNumber(std::abs(coefficient)) << " " << variable;
  first = false;
}

std::string variableName(size_t index) { return "x" + std::to_string(index); }

bool commandExists(const std::string &command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string runCommand(const std::string &command, int &exitCode) {
  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    exitCode = -1;
    return "";
  }
  std::string out;
  char buf[4096];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0)
      out.append(buf, n);
    if (n < sizeof(buf))
      break;
  }
  exitCode = pclose(pipe);
  return out;
}

// Removes the model and solution files when the solve ends
struct ScratchFiles {
  fs::path model;
  fs::path solution;

  ~ScratchFiles() {
    std::error_code ec;
    fs::remove(model, ec);
    fs::remove(solution, ec);
  }
};

std::string uniqueStem() {
  static std::atomic<unsigned long> counter{0};
  auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  return "invoice_selection_" + std::to_string(ticks) + "_" +
         std::to_string(counter++);
}

} // anonymous namespace

std::string toLpFormat(const SelectionModel &model) {
  std::ostringstream out;
  out << "\\ Invoice line item selection\n";

  out << "Maximize\n obj: ";
  bool first = true;
  for (size_t i = 0; i < model.items.size(); ++i) {
    appendTerm(out, model.items[i].weight, variableName(i), first);
  }
  if (model.target) {
    appendTerm(out, -model.penaltyWeight, "over", first);
    appendTerm(out, -model.penaltyWeight, "under", first);
  }
  if (first) {
    // An objective needs at least one term
    out << "0 " << (model.items.empty() ? "over" : variableName(0));
  }
  out << "\n";

  out << "Subject To\n";
  std::map<int, std::vector<size_t>> groups;
  for (size_t i = 0; i < model.items.size(); ++i) {
    if (model.items[i].group >= 0) {
      groups[model.items[i].group].push_back(i);
    }
  }
  bool anyConstraint = false;
  for (const auto &group : groups) {
    if (group.second.size() < 2) {
      continue;
    }
    out << " g" << group.first << ": ";
    bool firstTerm = true;
    for (size_t index : group.second) {
      appendTerm(out, 1.0, variableName(index), firstTerm);
    }
    out << " <= 1\n";
    anyConstraint = true;
  }
  if (model.target) {
    out << " total: ";
    bool firstTerm = true;
    for (size_t i = 0; i < model.items.size(); ++i) {
      appendTerm(out, model.items[i].amount, variableName(i), firstTerm);
    }
    appendTerm(out, -1.0, "over", firstTerm);
    appendTerm(out, 1.0, "under", firstTerm);
    out << " = " << formatNumber(*model.target) << "\n";
    anyConstraint = true;
  }
  if (!anyConstraint) {
    // The format requires one row; this one never binds
    out << " count: ";
    bool firstTerm = true;
    for (size_t i = 0; i < model.items.size(); ++i) {
      appendTerm(out, 1.0, variableName(i), firstTerm);
    }
    if (firstTerm) {
      out << "0 over";
    }
    out << " <= " << model.items.size() << "\n";
  }

  out << "Bounds\n";
  out << " over >= 0\n";
  out << " under >= 0\n";

  if (!model.items.empty()) {
    out << "Binary\n";
    for (size_t i = 0; i < model.items.size(); ++i) {
      out << " " << variableName(i) << "\n";
    }
  }
  out << "End\n";
  return out.str();
}

SolverOutcome parseCbcSolution(const std::string &text,
                               const SelectionModel &model) {
  SolverOutcome outcome;
  std::istringstream in(text);
  std::string statusLine;
  if (!std::getline(in, statusLine)) {
    outcome.status = SolverOutcome::Status::Error;
    outcome.message = "empty solution file";
    return outcome;
  }

  std::string lowered = statusLine;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
  auto objectivePos = lowered.find("objective value");
  if (objectivePos != std::string::npos) {
    std::istringstream value(
        statusLine.substr(objectivePos + std::string("objective value").size()));
    value >> outcome.objectiveValue;
  }

  if (lowered.rfind("optimal", 0) == 0) {
    outcome.status = SolverOutcome::Status::Optimal;
  } else if (lowered.find("infeasible") != std::string::npos ||
             lowered.find("unbounded") != std::string::npos) {
    outcome.status = SolverOutcome::Status::Infeasible;
    outcome.message = statusLine;
    return outcome;
  } else if (lowered.find("stopped") != std::string::npos) {
    outcome.status = SolverOutcome::Status::Infeasible;
    outcome.message = "time limit reached: " + statusLine;
    return outcome;
  } else {
    outcome.status = SolverOutcome::Status::Error;
    outcome.message = "unrecognized solver status: " + statusLine;
    return outcome;
  }

  std::string line;
  while (std::getline(in, line)) {
    auto start = line.find_first_not_of(" \t*");
    if (start == std::string::npos) {
      continue;
    }
    std::istringstream fields(line.substr(start));
    long index = 0;
    std::string name;
    double value = 0.0;
    if (!(fields >> index >> name >> value)) {
      continue;
    }
    if (name.size() < 2 || name[0] != 'x' || value < 0.5) {
      continue;
    }
    char *end = nullptr;
    unsigned long item = std::strtoul(name.c_str() + 1, &end, 10);
    if (*end != '\0' || item >= model.items.size()) {
      continue;
    }
    outcome.selectedIds.push_back(model.items[item].id);
  }
  std::sort(outcome.selectedIds.begin(), outcome.selectedIds.end());
  return outcome;
}

CbcCommandSolver::CbcCommandSolver() : CbcCommandSolver(std::string()) {}

CbcCommandSolver::CbcCommandSolver(const std::string &binaryPath)
    : m_binaryPath(binaryPath) {
  if (m_binaryPath.empty()) {
    const char *envPath = std::getenv("INVOICE_CBC_PATH");
    m_binaryPath = (envPath != nullptr && *envPath != '\0') ? envPath : "cbc";
  }
}

std::string CbcCommandSolver::name() const { return "cbc"; }

const std::string &CbcCommandSolver::getBinaryPath() const {
  return m_binaryPath;
}

bool CbcCommandSolver::isAvailable() const {
  if (m_binaryPath.find('/') == std::string::npos) {
    return commandExists(m_binaryPath);
  }
  std::error_code ec;
  auto status = fs::status(m_binaryPath, ec);
  if (ec || !fs::is_regular_file(status)) {
    return false;
  }
  return (status.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

SolverOutcome CbcCommandSolver::solve(const SelectionModel &model,
                                      int timeLimitSeconds) {
  SolverOutcome outcome;
  if (!isAvailable()) {
    outcome.status = SolverOutcome::Status::Unavailable;
    outcome.message = "solver binary not found: " + m_binaryPath;
    return outcome;
  }

  ScratchFiles files;
  std::error_code ec;
  fs::path directory = fs::temp_directory_path(ec);
  if (ec) {
    outcome.status = SolverOutcome::Status::Error;
    outcome.message = "no temporary directory: " + ec.message();
    return outcome;
  }
  const std::string stem = uniqueStem();
  files.model = directory / (stem + ".lp");
  files.solution = directory / (stem + ".sol");

  {
    std::ofstream lp(files.model);
    if (!lp) {
      outcome.status = SolverOutcome::Status::Error;
      outcome.message = "cannot write model file " + files.model.string();
      return outcome;
    }
    lp << toLpFormat(model);
  }

  std::string cmd = "\"" + m_binaryPath + "\" \"" + files.model.string() +
                    "\" sec " + std::to_string(std::max(1, timeLimitSeconds)) +
                    " solve solu \"" + files.solution.string() + "\" 2>&1";
  int exitCode = 0;
  std::string output = runCommand(cmd, exitCode);
  if (exitCode != 0) {
    outcome.status = SolverOutcome::Status::Error;
    outcome.message = "solver exited with status " + std::to_string(exitCode) +
                      ": " + output.substr(0, 200);
    return outcome;
  }

  std::ifstream solution(files.solution);
  if (!solution) {
    outcome.status = SolverOutcome::Status::Error;
    outcome.message = "solver wrote no solution file";
    return outcome;
  }
  std::stringstream contents;
  contents << solution.rdbuf();
  return parseCbcSolution(contents.str(), model);
}

} // namespace invoice
