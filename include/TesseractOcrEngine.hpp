#ifndef INVOICE_TESSERACT_OCR_ENGINE_HPP
#define INVOICE_TESSERACT_OCR_ENGINE_HPP

#include "OcrEngine.hpp"

#include <tesseract/baseapi.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace invoice {

/**
 * @brief Configuration for the Tesseract adapter
 */
struct OcrConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "eng+deu")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_SINGLE_BLOCK; ///< Cells are single uniform blocks
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX/default)
  int maxInstances = 0; ///< Engine instances in the pool (0 = unlimited)
};

/**
 * @brief OcrEngine backed by Tesseract
 *
 * A TessBaseAPI instance is not reentrant, so the adapter keeps a pool of
 * initialized instances and lends one to each recognize() call. Instances
 * are created on demand up to OcrConfig::maxInstances.
 *
 * Example usage:
 * @code
 * invoice::TesseractOcrEngine engine;
 * if (engine.initialize()) {
 *     auto tokens = engine.recognize(cellImage);
 * }
 * @endcode
 */
class TesseractOcrEngine : public OcrEngine {
public:
  TesseractOcrEngine();
  explicit TesseractOcrEngine(const OcrConfig &config);
  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine &) = delete;
  TesseractOcrEngine &operator=(const TesseractOcrEngine &) = delete;

  /**
   * @brief Initialize the first engine instance
   *
   * Tessdata is looked up in OcrConfig::tessDataPath, then in
   * TESSDATA_PREFIX, then in the library's compiled-in default.
   *
   * @return true if initialization was successful
   */
  bool initialize() override;

  /**
   * @brief Check if the engine is initialized
   */
  bool isInitialized() const;

  std::vector<OcrToken> recognize(const cv::Mat &image) override;

  /**
   * @brief Get Tesseract version string
   */
  static std::string getTesseractVersion();

private:
  /// Borrowed instance, handed back to the pool when the lease ends
  class Lease {
  public:
    explicit Lease(TesseractOcrEngine &engine);
    ~Lease();

    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    tesseract::TessBaseAPI *operator->() const { return m_instance.get(); }

  private:
    TesseractOcrEngine &m_engine;
    std::unique_ptr<tesseract::TessBaseAPI> m_instance;
  };

  std::unique_ptr<tesseract::TessBaseAPI> createInstance() const;
  std::unique_ptr<tesseract::TessBaseAPI> acquire();
  void release(std::unique_ptr<tesseract::TessBaseAPI> instance);

  OcrConfig m_config;
  std::string m_tessDataPath; ///< Resolved path, empty = library default
  bool m_initialized;

  std::mutex m_mutex;
  std::condition_variable m_returned;
  std::vector<std::unique_ptr<tesseract::TessBaseAPI>> m_idle;
  int m_created;
};

} // namespace invoice

#endif // INVOICE_TESSERACT_OCR_ENGINE_HPP
