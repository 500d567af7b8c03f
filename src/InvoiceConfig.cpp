#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace invoice {

const char *categoryName(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::None:
    return "none";
  case ErrorCategory::Download:
    return "download";
  case ErrorCategory::Render:
    return "render";
  case ErrorCategory::DetectionEmpty:
    return "detection_empty";
  case ErrorCategory::Parse:
    return "parse";
  case ErrorCategory::Ocr:
    return "ocr";
  case ErrorCategory::SolverUnavailable:
    return "solver_unavailable";
  case ErrorCategory::SolverInfeasible:
    return "solver_infeasible";
  case ErrorCategory::Internal:
  default:
    return "internal";
  }
}

long long toCents(double value) { return std::llround(value * 100.0); }

void PipelineConfig::validate() const {
  if (dpi <= 0) {
    throw std::invalid_argument("dpi must be positive");
  }
  if (workerThreads < 0) {
    throw std::invalid_argument("workerThreads must not be negative");
  }
  if (downloadTimeoutSeconds <= 0 || documentTimeoutSeconds <= 0) {
    throw std::invalid_argument("timeouts must be positive");
  }
  if (downloadTimeoutSeconds >= documentTimeoutSeconds) {
    throw std::invalid_argument(
        "download timeout must be shorter than the document timeout");
  }
  if (detection.thresholdBlockSize < 3 || detection.thresholdBlockSize % 2 == 0) {
    throw std::invalid_argument("thresholdBlockSize must be odd and >= 3");
  }
  if (detection.ruleKernelLength < 2) {
    throw std::invalid_argument("ruleKernelLength must be >= 2");
  }
  if (segmentation.ruleFraction <= 0 || segmentation.ruleFraction > 1) {
    throw std::invalid_argument("ruleFraction must be in (0, 1]");
  }
  if (dedupe.bandFraction <= 0 || dedupe.bandFraction >= 0.5) {
    throw std::invalid_argument("bandFraction must be in (0, 0.5)");
  }
  if (dedupe.similarityThreshold < 0 || dedupe.similarityThreshold > 100) {
    throw std::invalid_argument("similarityThreshold must be in [0, 100]");
  }
  if (reconcile.tolerance < 0 || reconcile.penaltyWeight < 0) {
    throw std::invalid_argument("tolerance and penaltyWeight must be >= 0");
  }
  if (reconcile.solverTimeoutSeconds <= 0) {
    throw std::invalid_argument("solverTimeoutSeconds must be positive");
  }
  if (totalSearchFraction <= 0 || totalSearchFraction > 1) {
    throw std::invalid_argument("totalSearchFraction must be in (0, 1]");
  }
}

void PipelineConfig::applyEnvironment() {
  const char *debugDir = std::getenv("INVOICE_DEBUG_DIR");
  if (debugDir != nullptr && *debugDir != '\0') {
    debugImageDir = debugDir;
  }
}

} // namespace invoice
