#ifndef INVOICE_TYPES_HPP
#define INVOICE_TYPES_HPP

#include <opencv2/opencv.hpp>

#include <optional>
#include <string>
#include <vector>

namespace invoice {

/**
 * @brief A single word recognized by the OCR engine
 */
struct OcrToken {
  std::string text;     ///< Recognized text
  float confidence = 0; ///< Engine confidence (0-100, negative = unknown)
  cv::Rect boundingBox; ///< Box relative to the image passed to the engine
};

/**
 * @brief Half-open pixel interval [start, end) along one axis
 */
struct Band {
  int start = 0;
  int end = 0;

  int length() const { return end - start; }
  double center() const { return (start + end) / 2.0; }
};

/**
 * @brief A detected table structure on one page
 */
struct TableRegion {
  cv::Rect boundingBox; ///< Region in page coordinates
  cv::Mat structureMask; ///< Rule pixels (255) cropped to the region
};

/**
 * @brief Intersection of one row band and one column band
 */
struct Cell {
  int row = 0;
  int column = 0;
  cv::Rect rect;               ///< Cell rectangle in page coordinates
  std::vector<OcrToken> tokens; ///< Tokens in page coordinates
};

/**
 * @brief Candidate invoice line item
 *
 * Amount and confidence are optional: an unparsable amount is "absent",
 * never zero. Filtering and dedupe annotate copies through the boilerplate
 * flag and the duplicate group; the description and amount only change
 * during continuation-row merging.
 */
struct Candidate {
  int id = 0;
  std::string description;
  std::optional<double> amount;
  std::optional<double> confidence; ///< Mean token confidence (0-100)
  int page = 1;                      ///< 1-indexed page number
  cv::Rect boundingBox;              ///< Page coordinates
  int duplicateGroup = -1;           ///< Lowest member id, -1 = ungrouped
  bool boilerplate = false; ///< Lies in a repeated header/footer band
};

/**
 * @brief Category attached to errors and warnings
 */
enum class ErrorCategory {
  None,
  Download,          ///< Document could not be retrieved (fatal)
  Render,            ///< Document could not be rasterized (fatal)
  DetectionEmpty,    ///< No table found on a page
  Parse,             ///< A row amount could not be parsed
  Ocr,               ///< OCR failed for a page
  SolverUnavailable, ///< Solver binary missing
  SolverInfeasible,  ///< No solution, solver error or timeout
  Internal           ///< Unexpected failure (fatal)
};

/**
 * @brief Machine-readable name of a category ("download", "render", ...)
 */
const char *categoryName(ErrorCategory category);

/**
 * @brief Non-fatal condition reported next to partial results
 */
struct Warning {
  ErrorCategory category = ErrorCategory::None;
  int page = 0; ///< 1-indexed page, 0 = whole document
  std::string message;
};

/**
 * @brief Outcome of the reconciliation step
 */
struct ReconciliationResult {
  enum class Status { Ok, Infeasible };

  Status status = Status::Ok;
  std::vector<int> selectedIds; ///< Ascending candidate ids
  double selectedTotal = 0.0;   ///< Rounded to cents
  double deviation = 0.0;       ///< selectedTotal - target (0 without target)
  bool withinTolerance = true;
  std::string solverName; ///< Empty when no solver was involved
};

/**
 * @brief Round a currency value to whole cents
 */
long long toCents(double value);

} // namespace invoice

#endif // INVOICE_TYPES_HPP
