#ifndef INVOICE_EXTRACTOR_HPP
#define INVOICE_EXTRACTOR_HPP

#include "BoilerplateFilter.hpp"
#include "CandidateAssembler.hpp"
#include "Deduplicator.hpp"
#include "DocumentSource.hpp"
#include "GridSegmenter.hpp"
#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"
#include "OcrEngine.hpp"
#include "PagePreprocessor.hpp"
#include "PageRenderer.hpp"
#include "SelectionSolver.hpp"
#include "TableDetector.hpp"
#include "WorkerPool.hpp"

#include <opencv2/opencv.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace invoice {

/**
 * @brief Everything extracted from one page before cross-page filtering
 */
struct PageResult {
  int page = 1;                      ///< 1-indexed page number
  std::vector<Candidate> candidates; ///< Merged candidates, page-local ids
  std::vector<Warning> warnings;
  PageBandSample bands;     ///< Header/footer samples (empty if unprocessed)
  cv::Mat totalSearchArea;  ///< Lower part of the page (may be empty)
  int tableCount = 0;       ///< Regions detected on the page
};

/**
 * @brief Per-page results of a document, delivered lazily in page order
 *
 * The pages are processed concurrently; next() blocks until the next page
 * in order is ready. The pool that runs the pages must outlive the stream.
 */
class PageCandidateStream {
public:
  explicit PageCandidateStream(std::vector<std::future<PageResult>> pages);

  /**
   * @brief Wait for the next page
   * @param page Receives the result
   * @return false once every page has been delivered
   */
  bool next(PageResult &page);

  size_t pageCount() const { return m_pages.size(); }

private:
  std::vector<std::future<PageResult>> m_pages;
  size_t m_next;
};

/**
 * @brief Result of processing one document
 */
struct ExtractionResult {
  bool success = false;
  ErrorCategory errorCategory = ErrorCategory::None;
  std::string errorMessage; ///< Fixed per category, no internal details
  int pageCount = 0;
  std::vector<Candidate> candidates;  ///< All candidates, annotated
  std::optional<double> reportedTotal; ///< Total found on the document
  std::optional<double> targetTotal;   ///< Total the selection aimed for
  double tolerance = 0.0;              ///< Tolerance the selection used
  ReconciliationResult reconciliation;
  std::vector<Warning> warnings;
  double processingTimeMs = 0.0;

  /**
   * @brief Selected candidates in page order
   */
  std::vector<Candidate> selectedCandidates() const;
};

/**
 * @brief Runs the whole line item pipeline on a document
 *
 * Retrieval, rendering, per-page structure recovery and OCR (in parallel),
 * header/footer filtering, fuzzy dedupe and reconciliation. Document-level
 * failures are returned as unsuccessful results; page-level and solver
 * problems become warnings next to partial results.
 *
 * Example usage:
 * @code
 * invoice::PipelineConfig config;
 * auto ocr = std::make_shared<invoice::TesseractOcrEngine>();
 * ocr->initialize();
 * invoice::InvoiceExtractor extractor(
 *     config, std::make_shared<invoice::DefaultDocumentSource>(),
 *     std::make_shared<invoice::PopplerPageRenderer>(), ocr,
 *     std::make_shared<invoice::CbcCommandSolver>());
 * auto result = extractor.extract("invoice.pdf");
 * @endcode
 */
class InvoiceExtractor {
public:
  /**
   * Source and renderer are only needed by extract() and
   * extractFromBytes(); a null solver degrades every targeted selection.
   *
   * @throws std::invalid_argument if the configuration is inconsistent or
   * the OCR engine is missing
   */
  InvoiceExtractor(const PipelineConfig &config,
                   std::shared_ptr<DocumentSource> source,
                   std::shared_ptr<PageRenderer> renderer,
                   std::shared_ptr<OcrEngine> ocr,
                   std::shared_ptr<SelectionSolver> solver);

  /**
   * @brief Retrieve and process a document
   * @param location URL or local path
   * @param targetTotal Known grand total; overrides any detected total
   */
  ExtractionResult extract(const std::string &location,
                           std::optional<double> targetTotal = std::nullopt);

  /**
   * @brief Process document bytes that are already in memory
   */
  ExtractionResult
  extractFromBytes(const std::string &document,
                   std::optional<double> targetTotal = std::nullopt);

  /**
   * @brief Process already rendered pages
   */
  ExtractionResult
  extractFromPages(const std::vector<cv::Mat> &pages,
                   std::optional<double> targetTotal = std::nullopt);

  /**
   * @brief Start processing pages on a pool
   * @param pages Page images in order (kept alive by the stream's tasks)
   * @param pool Pool that runs the page tasks
   * @param deadline Pages not started before it are skipped with a warning
   */
  PageCandidateStream
  streamPages(const std::vector<cv::Mat> &pages, WorkerPool &pool,
              std::chrono::steady_clock::time_point deadline) const;

  /**
   * @brief Process one page
   *
   * Never throws: a failure anywhere in the page's analysis yields a page
   * without candidates and an Ocr warning.
   */
  PageResult processPage(const cv::Mat &page, int pageNumber,
                         std::chrono::steady_clock::time_point deadline) const;

  /**
   * @brief Fixed user-facing message for a failure category
   */
  static std::string sanitizedMessage(ErrorCategory category);

  const PipelineConfig &getConfig() const;

private:
  using Clock = std::chrono::steady_clock;

  ExtractionResult processBytes(const std::string &document,
                                std::optional<double> targetTotal,
                                Clock::time_point start);
  ExtractionResult runPipeline(const std::vector<cv::Mat> &pages,
                               std::optional<double> targetTotal,
                               Clock::time_point start);
  PageResult analyzePage(const cv::Mat &page, int pageNumber,
                         Clock::time_point deadline) const;
  std::optional<double> locateReportedTotal(
      const std::vector<PageResult> &pages,
      std::vector<Warning> &warnings) const;
  std::vector<OcrToken> recognizeCell(const cv::Mat &page,
                                      const cv::Rect &rect) const;
  void writeDebugImages(const cv::Mat &page, int pageNumber,
                        const std::vector<TableRegion> &regions,
                        const std::vector<GridLayout> &layouts) const;
  void debugLog(const std::string &message) const;
  static void fail(ExtractionResult &result, ErrorCategory category,
                   const std::string &message, const std::string &detail,
                   Clock::time_point start);

  PipelineConfig m_config;
  std::shared_ptr<DocumentSource> m_source;
  std::shared_ptr<PageRenderer> m_renderer;
  std::shared_ptr<OcrEngine> m_ocr;
  std::shared_ptr<SelectionSolver> m_solver;

  PagePreprocessor m_preprocessor;
  TableDetector m_detector;
  GridSegmenter m_segmenter;
  CandidateAssembler m_assembler;
  BoilerplateFilter m_boilerplate;
  Deduplicator m_deduplicator;
};

} // namespace invoice

#endif // INVOICE_EXTRACTOR_HPP
