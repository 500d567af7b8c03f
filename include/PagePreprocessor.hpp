#ifndef INVOICE_PAGE_PREPROCESSOR_HPP
#define INVOICE_PAGE_PREPROCESSOR_HPP

#include "InvoiceConfig.hpp"

#include <opencv2/opencv.hpp>

namespace invoice {

/**
 * @brief Normalizes raw page images for table detection and OCR
 *
 * Applies, in order and as configured: deskew, illumination correction and
 * CLAHE contrast enhancement. The output is always a 3-channel BGR image.
 */
class PagePreprocessor {
public:
  PagePreprocessor();
  explicit PagePreprocessor(const PreprocessConfig &config);

  /**
   * @brief Produce the analysis-ready version of a page
   * @param page Raw page image (gray, BGR or BGRA)
   * @return Normalized BGR image
   * @throws std::invalid_argument if the page is empty
   */
  cv::Mat normalize(const cv::Mat &page) const;

  /**
   * @brief Estimate the skew of dark content in degrees
   *
   * Uses the minimum-area rectangle around all dark pixels of an Otsu
   * binarization. The result is in (-45, 45]; 0 when there is no content.
   *
   * @param bgr BGR page image
   * @return Counter-clockwise rotation that straightens the page
   */
  static double estimateSkewAngle(const cv::Mat &bgr);

  const PreprocessConfig &getConfig() const;

private:
  cv::Mat deskew(const cv::Mat &bgr) const;
  cv::Mat correctIllumination(const cv::Mat &bgr) const;
  cv::Mat enhanceContrast(const cv::Mat &bgr) const;

  PreprocessConfig m_config;
};

} // namespace invoice

#endif // INVOICE_PAGE_PREPROCESSOR_HPP
