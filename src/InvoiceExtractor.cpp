#include "InvoiceExtractor.hpp"
#include "InvoiceErrors.hpp"
#include "Reconciler.hpp"
#include "ReportedTotal.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

namespace invoice {

namespace {

// White margin around cell crops so glyphs do not touch the image edge
const int kCellBorder = 10;

double elapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // anonymous namespace

PageCandidateStream::PageCandidateStream(
    std::vector<std::future<PageResult>> pages)
    : m_pages(std::move(pages)), m_next(0) {}

bool PageCandidateStream::next(PageResult &page) {
  if (m_next >= m_pages.size()) {
    return false;
  }
  page = m_pages[m_next++].get();
  return true;
}

std::vector<Candidate> ExtractionResult::selectedCandidates() const {
  std::set<int> selected(reconciliation.selectedIds.begin(),
                         reconciliation.selectedIds.end());
  std::vector<Candidate> items;
  for (const auto &candidate : candidates) {
    if (selected.count(candidate.id) > 0) {
      items.push_back(candidate);
    }
  }
  return items;
}

InvoiceExtractor::InvoiceExtractor(const PipelineConfig &config,
                                   std::shared_ptr<DocumentSource> source,
                                   std::shared_ptr<PageRenderer> renderer,
                                   std::shared_ptr<OcrEngine> ocr,
                                   std::shared_ptr<SelectionSolver> solver)
    : m_config(config), m_source(std::move(source)),
      m_renderer(std::move(renderer)), m_ocr(std::move(ocr)),
      m_solver(std::move(solver)), m_preprocessor(config.preprocess),
      m_detector(config.detection), m_segmenter(config.segmentation),
      m_assembler(config.assembly), m_boilerplate(config.dedupe),
      m_deduplicator(config.dedupe) {
  m_config.validate();
  if (!m_ocr) {
    throw std::invalid_argument("An OCR engine is required");
  }
}

const PipelineConfig &InvoiceExtractor::getConfig() const { return m_config; }

std::string InvoiceExtractor::sanitizedMessage(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::Download:
    return "The document could not be retrieved";
  case ErrorCategory::Render:
    return "The document could not be rendered";
  case ErrorCategory::DetectionEmpty:
    return "No table structure was found";
  case ErrorCategory::Parse:
    return "A value could not be parsed";
  case ErrorCategory::Ocr:
    return "Text recognition failed";
  case ErrorCategory::SolverUnavailable:
    return "The optimization solver is unavailable";
  case ErrorCategory::SolverInfeasible:
    return "No optimal selection was found";
  case ErrorCategory::None:
    return "";
  case ErrorCategory::Internal:
  default:
    return "Internal error while processing the document";
  }
}

void InvoiceExtractor::fail(ExtractionResult &result, ErrorCategory category,
                            const std::string &message,
                            const std::string &detail,
                            Clock::time_point start) {
  std::cerr << "Error (" << categoryName(category) << "): " << detail
            << std::endl;
  result.success = false;
  result.errorCategory = category;
  result.errorMessage = message;
  result.processingTimeMs = elapsedMs(start);
}

void InvoiceExtractor::debugLog(const std::string &message) const {
  if (m_config.verbose) {
    std::cerr << "DEBUG: " << message << std::endl;
  }
}

ExtractionResult InvoiceExtractor::extract(const std::string &location,
                                           std::optional<double> targetTotal) {
  auto start = Clock::now();
  ExtractionResult result;

  if (!m_source) {
    fail(result, ErrorCategory::Internal,
         sanitizedMessage(ErrorCategory::Internal), "No document source",
         start);
    return result;
  }

  std::string document;
  try {
    debugLog("Retrieving " + location);
    document = m_source->fetch(location);
  } catch (const DocumentError &e) {
    fail(result, e.category(), sanitizedMessage(e.category()), e.what(),
         start);
    return result;
  } catch (const std::exception &e) {
    fail(result, ErrorCategory::Download,
         sanitizedMessage(ErrorCategory::Download), e.what(), start);
    return result;
  }

  return processBytes(document, targetTotal, start);
}

ExtractionResult
InvoiceExtractor::extractFromBytes(const std::string &document,
                                   std::optional<double> targetTotal) {
  return processBytes(document, targetTotal, Clock::now());
}

ExtractionResult
InvoiceExtractor::extractFromPages(const std::vector<cv::Mat> &pages,
                                   std::optional<double> targetTotal) {
  return runPipeline(pages, targetTotal, Clock::now());
}

ExtractionResult
InvoiceExtractor::processBytes(const std::string &document,
                               std::optional<double> targetTotal,
                               Clock::time_point start) {
  ExtractionResult result;
  if (!m_renderer) {
    fail(result, ErrorCategory::Internal,
         sanitizedMessage(ErrorCategory::Internal), "No page renderer", start);
    return result;
  }

  std::vector<cv::Mat> pages;
  try {
    pages = m_renderer->render(document, m_config.dpi);
  } catch (const RenderError &e) {
    std::string message =
        e.reason() == RenderError::Reason::Unavailable
            ? "Document rendering is not available"
            : "The document is not a readable PDF or image";
    fail(result, ErrorCategory::Render, message, e.what(), start);
    return result;
  } catch (const std::exception &e) {
    fail(result, ErrorCategory::Render,
         sanitizedMessage(ErrorCategory::Render), e.what(), start);
    return result;
  }

  if (pages.empty()) {
    fail(result, ErrorCategory::Render,
         sanitizedMessage(ErrorCategory::Render), "Renderer returned no pages",
         start);
    return result;
  }
  debugLog("Rendered " + std::to_string(pages.size()) + " page(s)");

  return runPipeline(pages, targetTotal, start);
}

PageCandidateStream InvoiceExtractor::streamPages(
    const std::vector<cv::Mat> &pages, WorkerPool &pool,
    std::chrono::steady_clock::time_point deadline) const {
  std::vector<std::future<PageResult>> futures;
  futures.reserve(pages.size());
  for (size_t i = 0; i < pages.size(); ++i) {
    cv::Mat page = pages[i];
    int pageNumber = static_cast<int>(i) + 1;
    futures.push_back(pool.submit([this, page, pageNumber, deadline]() {
      return processPage(page, pageNumber, deadline);
    }));
  }
  return PageCandidateStream(std::move(futures));
}

std::vector<OcrToken> InvoiceExtractor::recognizeCell(const cv::Mat &page,
                                                      const cv::Rect &rect) const {
  cv::Rect clipped = rect & cv::Rect(0, 0, page.cols, page.rows);
  if (clipped.width <= 0 || clipped.height <= 0) {
    return {};
  }

  // Add a white border for additional context
  cv::Mat bordered;
  cv::copyMakeBorder(page(clipped), bordered, kCellBorder, kCellBorder,
                     kCellBorder, kCellBorder, cv::BORDER_CONSTANT,
                     cv::Scalar(255, 255, 255));

  std::vector<OcrToken> tokens = m_ocr->recognize(bordered);
  for (auto &token : tokens) {
    token.boundingBox.x += clipped.x - kCellBorder;
    token.boundingBox.y += clipped.y - kCellBorder;
  }
  return tokens;
}

PageResult
InvoiceExtractor::processPage(const cv::Mat &page, int pageNumber,
                              std::chrono::steady_clock::time_point deadline) const {
  try {
    return analyzePage(page, pageNumber, deadline);
  } catch (const std::exception &e) {
    std::cerr << "Exception processing page " << pageNumber << ": "
              << e.what() << std::endl;
    PageResult result;
    result.page = pageNumber;
    result.warnings.push_back(
        {ErrorCategory::Ocr, pageNumber, sanitizedMessage(ErrorCategory::Ocr)});
    return result;
  }
}

PageResult
InvoiceExtractor::analyzePage(const cv::Mat &page, int pageNumber,
                              Clock::time_point deadline) const {
  PageResult result;
  result.page = pageNumber;

  // Unprocessed pages keep empty band samples, which never match
  if (Clock::now() >= deadline) {
    result.warnings.push_back(
        {ErrorCategory::Ocr, pageNumber,
         "Page not processed within the document time budget"});
    return result;
  }

  cv::Mat normalized = m_preprocessor.normalize(page);
  result.bands = m_boilerplate.sample(normalized);

  if (m_config.detectReportedTotal) {
    int top = static_cast<int>(normalized.rows *
                               (1.0 - m_config.totalSearchFraction));
    top = std::clamp(top, 0, normalized.rows - 1);
    result.totalSearchArea =
        normalized(cv::Rect(0, top, normalized.cols, normalized.rows - top))
            .clone();
  }

  std::vector<TableRegion> regions = m_detector.detect(normalized);
  result.tableCount = static_cast<int>(regions.size());
  debugLog("Page " + std::to_string(pageNumber) + ": " +
           std::to_string(regions.size()) + " table region(s)");

  std::vector<GridLayout> layouts;
  for (const auto &region : regions) {
    layouts.push_back(m_segmenter.segment(region.structureMask));
  }
  if (!m_config.debugImageDir.empty()) {
    writeDebugImages(normalized, pageNumber, regions, layouts);
  }

  std::vector<Candidate> raw;
  if (regions.empty()) {
    result.warnings.push_back(
        {ErrorCategory::DetectionEmpty, pageNumber, "No table found on page"});
    if (!m_config.assembly.textFallback) {
      return result;
    }

    std::vector<OcrToken> tokens;
    try {
      tokens = m_ocr->recognize(normalized);
    } catch (const std::exception &e) {
      std::cerr << "OCR failed on page " << pageNumber << ": " << e.what()
                << std::endl;
      result.warnings.push_back({ErrorCategory::Ocr, pageNumber,
                                 sanitizedMessage(ErrorCategory::Ocr)});
      return result;
    }
    AssemblyResult assembled =
        m_assembler.assembleFromPageTokens(tokens, pageNumber);
    raw = std::move(assembled.candidates);
    result.warnings.insert(result.warnings.end(), assembled.warnings.begin(),
                           assembled.warnings.end());
  }

  for (size_t r = 0; r < regions.size(); ++r) {
    if (Clock::now() >= deadline) {
      result.warnings.push_back(
          {ErrorCategory::Ocr, pageNumber,
           "Page processing stopped at the document time budget"});
      break;
    }

    std::vector<Cell> cells = m_segmenter.cellsFromGrid(regions[r], layouts[r]);
    try {
      for (auto &cell : cells) {
        cell.tokens = recognizeCell(normalized, cell.rect);
      }
    } catch (const std::exception &e) {
      std::cerr << "OCR failed on page " << pageNumber << ": " << e.what()
                << std::endl;
      result.warnings.push_back({ErrorCategory::Ocr, pageNumber,
                                 sanitizedMessage(ErrorCategory::Ocr)});
      return result;
    }

    AssemblyResult assembled = m_assembler.assembleFromCells(
        cells, pageNumber, static_cast<int>(raw.size()));
    raw.insert(raw.end(), assembled.candidates.begin(),
               assembled.candidates.end());
    result.warnings.insert(result.warnings.end(), assembled.warnings.begin(),
                           assembled.warnings.end());
  }

  result.candidates = m_assembler.mergeContinuationRows(raw);
  debugLog("Page " + std::to_string(pageNumber) + ": " +
           std::to_string(raw.size()) + " row(s), " +
           std::to_string(result.candidates.size()) + " candidate(s)");
  return result;
}

std::optional<double>
InvoiceExtractor::locateReportedTotal(const std::vector<PageResult> &pages,
                                      std::vector<Warning> &warnings) const {
  // Totals are usually printed at the end, so search the last page first
  for (auto it = pages.rbegin(); it != pages.rend(); ++it) {
    if (it->totalSearchArea.empty()) {
      continue;
    }
    std::vector<OcrToken> tokens;
    try {
      tokens = m_ocr->recognize(it->totalSearchArea);
    } catch (const std::exception &e) {
      std::cerr << "OCR failed while looking for the total on page "
                << it->page << ": " << e.what() << std::endl;
      warnings.push_back(
          {ErrorCategory::Ocr, it->page, sanitizedMessage(ErrorCategory::Ocr)});
      continue;
    }
    auto total = findReportedTotal(tokensToLines(tokens));
    if (total) {
      debugLog("Found reported total " + std::to_string(*total) + " on page " +
               std::to_string(it->page));
      return total;
    }
  }
  return std::nullopt;
}

ExtractionResult
InvoiceExtractor::runPipeline(const std::vector<cv::Mat> &pages,
                              std::optional<double> targetTotal,
                              Clock::time_point start) {
  ExtractionResult result;
  result.pageCount = static_cast<int>(pages.size());
  const auto deadline =
      start + std::chrono::seconds(m_config.documentTimeoutSeconds);

  try {
    std::vector<PageResult> pageResults;
    {
      WorkerPool pool(static_cast<size_t>(m_config.workerThreads));
      PageCandidateStream stream = streamPages(pages, pool, deadline);
      PageResult page;
      while (stream.next(page)) {
        pageResults.push_back(std::move(page));
      }
    }

    // Header/footer filtering needs every page, so it starts only here
    std::vector<Candidate> candidates;
    std::vector<PageBandSample> samples;
    int nextId = 0;
    for (auto &page : pageResults) {
      for (auto candidate : page.candidates) {
        candidate.id = nextId++;
        candidates.push_back(std::move(candidate));
      }
      result.warnings.insert(result.warnings.end(), page.warnings.begin(),
                             page.warnings.end());
      samples.push_back(page.bands);
    }

    auto bands = m_boilerplate.findRepeatedBands(samples);
    candidates = m_boilerplate.annotate(candidates, samples, bands);
    candidates = m_deduplicator.assignGroups(candidates);
    debugLog("Document: " + std::to_string(candidates.size()) +
             " candidate(s) after filtering and dedupe");

    ReconcileConfig reconcileConfig = m_config.reconcile;
    std::optional<double> target = targetTotal;
    if (!target && m_config.detectReportedTotal) {
      result.reportedTotal = locateReportedTotal(pageResults, result.warnings);
    }

    if (!target && result.reportedTotal) {
      // Ids are positions in candidates after renumbering
      long long sumCents = 0;
      for (int id : Reconciler::bestPerGroup(candidates)) {
        sumCents += toCents(*candidates[static_cast<size_t>(id)].amount);
      }
      const double sum = static_cast<double>(sumCents) / 100.0;
      const double reported = *result.reportedTotal;
      const double ratio = std::abs(reported - sum) / reported;

      if (sum <= 0) {
        debugLog("No amounts extracted; reported total not used");
      } else if (ratio <= reconcileConfig.trustedDeviationRatio) {
        target = reported;
      } else if (ratio > reconcileConfig.ignoredDeviationRatio) {
        result.warnings.push_back(
            {ErrorCategory::Parse, 0,
             "Detected total deviates too far from the extracted items and "
             "was ignored"});
      } else {
        target = reported;
        reconcileConfig.tolerance =
            std::max(reconcileConfig.tolerance, std::abs(reported - sum));
        debugLog("Tolerance raised to " +
                 std::to_string(reconcileConfig.tolerance));
      }
    }

    // The solve may use whatever is left of the document budget
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
                         deadline - Clock::now())
                         .count();
    reconcileConfig.solverTimeoutSeconds = static_cast<int>(std::max<long long>(
        1, std::min<long long>(reconcileConfig.solverTimeoutSeconds, remaining)));

    Reconciler reconciler(reconcileConfig, m_solver);
    result.reconciliation =
        reconciler.reconcile(candidates, target, &result.warnings);
    result.candidates = std::move(candidates);
    result.targetTotal = target;
    result.tolerance = reconcileConfig.tolerance;
    result.success = true;
  } catch (const DocumentError &e) {
    fail(result, e.category(), sanitizedMessage(e.category()), e.what(),
         start);
    return result;
  } catch (const std::exception &e) {
    fail(result, ErrorCategory::Internal,
         sanitizedMessage(ErrorCategory::Internal), e.what(), start);
    return result;
  }

  result.processingTimeMs = elapsedMs(start);
  return result;
}

void InvoiceExtractor::writeDebugImages(
    const cv::Mat &page, int pageNumber,
    const std::vector<TableRegion> &regions,
    const std::vector<GridLayout> &layouts) const {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(m_config.debugImageDir, ec);
  if (ec) {
    std::cerr << "Cannot create debug directory " << m_config.debugImageDir
              << ": " << ec.message() << std::endl;
    return;
  }

  cv::Mat overlay = page.clone();
  for (size_t r = 0; r < regions.size(); ++r) {
    const cv::Rect &box = regions[r].boundingBox;
    cv::rectangle(overlay, box, cv::Scalar(0, 200, 0), 3);
    if (r >= layouts.size()) {
      continue;
    }
    for (const auto &row : layouts[r].rows) {
      cv::line(overlay, cv::Point(box.x, box.y + row.start),
               cv::Point(box.x + box.width, box.y + row.start),
               cv::Scalar(0, 0, 255), 1);
    }
    for (const auto &column : layouts[r].columns) {
      cv::line(overlay, cv::Point(box.x + column.start, box.y),
               cv::Point(box.x + column.start, box.y + box.height),
               cv::Scalar(255, 0, 0), 1);
    }
  }

  const fs::path dir(m_config.debugImageDir);
  const std::string prefix = "page_" + std::to_string(pageNumber);
  try {
    cv::imwrite((dir / (prefix + "_normalized.png")).string(), page);
    cv::imwrite((dir / (prefix + "_tables.png")).string(), overlay);
  } catch (const cv::Exception &e) {
    std::cerr << "Failed to write debug images for page " << pageNumber
              << ": " << e.what() << std::endl;
  }
}

} // namespace invoice
