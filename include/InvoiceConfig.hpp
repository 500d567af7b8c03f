#ifndef INVOICE_CONFIG_HPP
#define INVOICE_CONFIG_HPP

#include <string>

namespace invoice {

/**
 * @brief Geometry preprocessing switches
 */
struct PreprocessConfig {
  bool deskew = true;                ///< Rotate pages by the detected skew
  double minSkewDegrees = 0.5;       ///< Smaller skew angles are ignored
  bool correctIllumination = true;   ///< Flatten uneven lighting (LAB L)
  bool enhanceContrast = true;       ///< Apply CLAHE to the L channel
  double claheClipLimit = 2.0;       ///< CLAHE clip limit
  int claheTileSize = 8;             ///< CLAHE tile grid size
};

/**
 * @brief Table region detection parameters
 */
struct DetectionConfig {
  int thresholdBlockSize = 11;   ///< Adaptive threshold neighbourhood (odd)
  double thresholdOffset = 3.0;  ///< Constant subtracted from the mean
  int ruleKernelLength = 25;     ///< Length of the rule-isolating kernels
  int openIterations = 2;        ///< Opening iterations for rule isolation
  int closeIterations = 5;       ///< 5x5 closing iterations
  int dilateSize = 10;           ///< Bridging kernel size
  int dilateIterations = 2;      ///< Bridging iterations
  int minTableArea = 3000;       ///< Minimum region area in px^2
  double overlapIoU = 0.5;       ///< Regions overlapping more collapse
};

/**
 * @brief Grid segmentation parameters
 */
struct SegmentationConfig {
  double ruleFraction = 0.5; ///< Profile fraction of the extent for a rule
  int minRowHeight = 12;     ///< Thinner row bands are noise
  int minColumnWidth = 10;   ///< Narrower column bands are noise
  int cellInset = 2;         ///< Pixels trimmed from each cell edge for OCR
};

/**
 * @brief Candidate assembly and continuation-row merge parameters
 */
struct AssemblyConfig {
  int alignmentTolerance = 20;   ///< Max left-edge offset for continuation
  int maxContinuationGap = 40;   ///< Max vertical gap for continuation
  int minContinuationGap = -5;   ///< Allowed overlap between rows
  bool skipSummaryRows = true;   ///< Drop "total", "balance", ... rows
  bool textFallback = false;     ///< Token-layout assembly without tables
  float fallbackMinConfidence = 30.0f; ///< Token floor for the fallback
  int fallbackRowThreshold = 20; ///< Vertical clustering distance
};

/**
 * @brief Boilerplate filter and fuzzy dedupe parameters
 */
struct DedupeConfig {
  double bandFraction = 0.15;      ///< Height of the top/bottom bands
  double bandSimilarity = 0.75;    ///< NCC threshold for repeated bands
  int minRepeatPages = 2;          ///< Pages sharing a band to exclude it
  double similarityThreshold = 88; ///< Token-set similarity for duplicates
};

/**
 * @brief Reconciliation parameters
 */
struct ReconcileConfig {
  double tolerance = 5.0;     ///< Acceptable |deviation| in currency units
  double penaltyWeight = 10.0; ///< Objective cost of one unit of deviation
  int solverTimeoutSeconds = 30;
  double trustedDeviationRatio = 0.02; ///< Detected totals closer are kept
  double ignoredDeviationRatio = 0.5;  ///< Detected totals further are dropped
};

/**
 * @brief Whole-pipeline configuration
 *
 * Read-only once processing starts; safe to share between documents.
 */
struct PipelineConfig {
  PreprocessConfig preprocess;
  DetectionConfig detection;
  SegmentationConfig segmentation;
  AssemblyConfig assembly;
  DedupeConfig dedupe;
  ReconcileConfig reconcile;

  double dpi = 300.0;               ///< Rendering resolution
  int workerThreads = 0;            ///< 0 = hardware concurrency
  int downloadTimeoutSeconds = 20;  ///< Remote retrieval budget
  int documentTimeoutSeconds = 120; ///< Whole-document budget
  bool detectReportedTotal = true;  ///< OCR the page bottoms for a total
  double totalSearchFraction = 0.4; ///< Lower page fraction searched
  bool verbose = false;             ///< DEBUG: messages on stderr
  std::string debugImageDir;        ///< Debug images (empty = disabled)

  /**
   * @brief Check the configuration for inconsistent values
   * @throws std::invalid_argument describing the first problem found
   */
  void validate() const;

  /**
   * @brief Apply INVOICE_DEBUG_DIR when set
   */
  void applyEnvironment();
};

} // namespace invoice

#endif // INVOICE_CONFIG_HPP
