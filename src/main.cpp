#include "DocumentSource.hpp"
#include "InvoiceExtractor.hpp"
#include "PageRenderer.hpp"
#include "ResponseWriter.hpp"
#include "SelectionSolver.hpp"
#include "TesseractOcrEngine.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <document> [options]\n"
      << "\n<document> is a local PDF/image path or an http(s) URL.\n"
      << "\nOptions:\n"
      << "  -t, --total <amount>    Known grand total to reconcile against\n"
      << "      --tolerance <val>   Acceptable deviation from the total "
         "(default: 5)\n"
      << "      --penalty <val>     Objective cost per unit of deviation "
         "(default: 10)\n"
      << "      --similarity <val>  Duplicate similarity threshold 0-100 "
         "(default: 88)\n"
      << "      --dpi <val>         Rendering resolution (default: 300)\n"
      << "  -j, --threads <n>       Page workers (default: all cores)\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "      --tessdata <path>   Tessdata directory\n"
      << "      --cbc-path <path>   CBC solver binary (default: "
         "INVOICE_CBC_PATH or cbc)\n"
      << "      --text-fallback     Read line items from pages without "
         "tables\n"
      << "      --no-total-search   Do not look for a total on the pages\n"
      << "      --no-deskew         Skip skew correction\n"
      << "      --debug-dir <dir>   Write debug images to <dir>\n"
      << "  -c, --candidates        Print all candidates to stderr\n"
      << "      --compact           Print the response on one line\n"
      << "  -v, --verbose           Print progress messages to stderr\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " invoice.pdf\n"
      << "  " << programName << " invoice.pdf --total 480 --tolerance 2\n"
      << "  " << programName << " https://example.com/bill.pdf -v\n";
}

void printCandidates(const invoice::ExtractionResult &result) {
  std::cerr << std::setw(5) << "Id" << std::setw(6) << "Page" << std::setw(7)
            << "Group" << std::setw(8) << "Conf%" << std::setw(14) << "Amount"
            << "  Description\n";
  std::cerr << std::string(80, '-') << "\n";

  for (const auto &candidate : result.candidates) {
    std::ostringstream amount;
    if (candidate.amount) {
      amount << std::fixed << std::setprecision(2) << *candidate.amount;
    } else {
      amount << "-";
    }
    std::ostringstream confidence;
    if (candidate.confidence) {
      confidence << std::fixed << std::setprecision(1)
                 << *candidate.confidence;
    } else {
      confidence << "-";
    }

    std::cerr << std::setw(5) << candidate.id << std::setw(6)
              << candidate.page << std::setw(7) << candidate.duplicateGroup
              << std::setw(8) << confidence.str() << std::setw(14)
              << amount.str() << "  " << candidate.description
              << (candidate.boilerplate ? "  [header/footer]" : "") << "\n";
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string location;
  std::optional<double> targetTotal;
  invoice::PipelineConfig config;
  invoice::OcrConfig ocrConfig;
  std::string cbcPath;
  bool showCandidates = false;
  bool pretty = true;

  config.applyEnvironment();

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      auto value = [&]() -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(arg + " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-t" || arg == "--total") {
        targetTotal = std::stod(value());
      } else if (arg == "--tolerance") {
        config.reconcile.tolerance = std::stod(value());
      } else if (arg == "--penalty") {
        config.reconcile.penaltyWeight = std::stod(value());
      } else if (arg == "--similarity") {
        config.dedupe.similarityThreshold = std::stod(value());
      } else if (arg == "--dpi") {
        config.dpi = std::stod(value());
      } else if (arg == "-j" || arg == "--threads") {
        config.workerThreads = std::stoi(value());
      } else if (arg == "-l" || arg == "--language") {
        ocrConfig.language = value();
      } else if (arg == "--tessdata") {
        ocrConfig.tessDataPath = value();
      } else if (arg == "--cbc-path") {
        cbcPath = value();
      } else if (arg == "--text-fallback") {
        config.assembly.textFallback = true;
      } else if (arg == "--no-total-search") {
        config.detectReportedTotal = false;
      } else if (arg == "--no-deskew") {
        config.preprocess.deskew = false;
      } else if (arg == "--debug-dir") {
        config.debugImageDir = value();
      } else if (arg == "-c" || arg == "--candidates") {
        showCandidates = true;
      } else if (arg == "--compact") {
        pretty = false;
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg[0] != '-') {
        location = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
    config.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (location.empty()) {
    std::cerr << "Error: No document provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (config.verbose) {
    std::cerr << "DEBUG: Tesseract version: "
              << invoice::TesseractOcrEngine::getTesseractVersion() << "\n"
              << "DEBUG: OpenCV version: " << CV_VERSION << "\n";
  }

  // Each page worker borrows its own Tesseract instance
  ocrConfig.maxInstances = config.workerThreads;
  auto ocr = std::make_shared<invoice::TesseractOcrEngine>(ocrConfig);
  if (!ocr->initialize()) {
    std::cerr
        << "Failed to initialize OCR engine.\n"
        << "Make sure Tesseract is installed and tessdata is available.\n";
    return 1;
  }

  auto solver = std::make_shared<invoice::CbcCommandSolver>(cbcPath);
  if (!solver->isAvailable()) {
    std::cerr << "Solver not found at '" << solver->getBinaryPath()
              << "'; totals will be matched without optimization\n";
  }

  invoice::InvoiceExtractor extractor(
      config,
      std::make_shared<invoice::DefaultDocumentSource>(
          config.downloadTimeoutSeconds),
      std::make_shared<invoice::PopplerPageRenderer>(), ocr, solver);

  auto result = extractor.extract(location, targetTotal);

  if (showCandidates && result.success) {
    printCandidates(result);
  }
  std::cout << invoice::writeResponse(result, pretty) << std::endl;

  if (config.verbose) {
    std::cerr << "DEBUG: Processing time: " << std::fixed
              << std::setprecision(2) << result.processingTimeMs << " ms\n";
  }

  return result.success ? 0 : 2;
}
