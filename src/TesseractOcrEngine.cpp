#include "TesseractOcrEngine.hpp"

#include <tesseract/resultiterator.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace invoice {

namespace {

// Tesseract expects tightly described RGB buffers
cv::Mat toRgb(const cv::Mat &image) {
  cv::Mat rgbImage;
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }
  return rgbImage;
}

} // anonymous namespace

TesseractOcrEngine::TesseractOcrEngine()
    : m_config(), m_initialized(false), m_created(0) {}

TesseractOcrEngine::TesseractOcrEngine(const OcrConfig &config)
    : m_config(config), m_initialized(false), m_created(0) {}

TesseractOcrEngine::~TesseractOcrEngine() {
  for (auto &instance : m_idle) {
    instance->End();
  }
}

bool TesseractOcrEngine::initialize() {
  if (m_initialized) {
    return true;
  }

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    m_tessDataPath = m_config.tessDataPath;
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      m_tessDataPath = envPath;
    } else {
      // Priority 3: Let Tesseract use its compiled-in location
      std::cerr << "TESSDATA_PREFIX not set, using the Tesseract default"
                << std::endl;
    }
  }

  auto first = createInstance();
  if (!first) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_idle.push_back(std::move(first));
  m_created = 1;
  m_initialized = true;
  return true;
}

bool TesseractOcrEngine::isInitialized() const { return m_initialized; }

std::unique_ptr<tesseract::TessBaseAPI>
TesseractOcrEngine::createInstance() const {
  auto instance = std::make_unique<tesseract::TessBaseAPI>();
  const char *dataPath =
      m_tessDataPath.empty() ? nullptr : m_tessDataPath.c_str();
  if (instance->Init(dataPath, m_config.language.c_str()) != 0) {
    return nullptr;
  }
  instance->SetPageSegMode(m_config.pageSegMode);
  return instance;
}

std::unique_ptr<tesseract::TessBaseAPI> TesseractOcrEngine::acquire() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_returned.wait(lock, [this] {
    return !m_idle.empty() || m_config.maxInstances <= 0 ||
           m_created < m_config.maxInstances;
  });

  if (!m_idle.empty()) {
    auto instance = std::move(m_idle.back());
    m_idle.pop_back();
    return instance;
  }

  // Grow the pool; Init is slow, so run it unlocked
  m_created++;
  lock.unlock();
  auto instance = createInstance();
  if (!instance) {
    lock.lock();
    m_created--;
    m_returned.notify_one();
    throw std::runtime_error("Failed to initialize an additional Tesseract "
                             "instance");
  }
  return instance;
}

void TesseractOcrEngine::release(
    std::unique_ptr<tesseract::TessBaseAPI> instance) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_idle.push_back(std::move(instance));
  }
  m_returned.notify_one();
}

TesseractOcrEngine::Lease::Lease(TesseractOcrEngine &engine)
    : m_engine(engine), m_instance(engine.acquire()) {}

TesseractOcrEngine::Lease::~Lease() {
  m_instance->Clear();
  m_engine.release(std::move(m_instance));
}

std::vector<OcrToken> TesseractOcrEngine::recognize(const cv::Mat &image) {
  if (!m_initialized) {
    throw std::runtime_error(
        "OCR engine not initialized. Call initialize() first.");
  }

  std::vector<OcrToken> tokens;
  if (image.empty()) {
    return tokens;
  }

  Lease api(*this);
  cv::Mat rgbImage = toRgb(image);
  api->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                static_cast<int>(rgbImage.step));

  if (api->Recognize(nullptr) != 0) {
    throw std::runtime_error("Tesseract recognition failed");
  }

  tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
  std::unique_ptr<tesseract::ResultIterator> ri(api->GetIterator());
  if (ri != nullptr) {
    do {
      std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
      if (word != nullptr && word[0] != '\0') {
        OcrToken token;
        token.text = word.get();
        token.confidence = ri->Confidence(level);

        int x1, y1, x2, y2;
        ri->BoundingBox(level, &x1, &y1, &x2, &y2);
        token.boundingBox = cv::Rect(x1, y1, x2 - x1, y2 - y1);
        tokens.push_back(token);
      }
    } while (ri->Next(level));
  }
  return tokens;
}

std::string TesseractOcrEngine::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

} // namespace invoice
