#ifndef INVOICE_PAGE_RENDERER_HPP
#define INVOICE_PAGE_RENDERER_HPP

#include <opencv2/opencv.hpp>

#include <string>
#include <vector>

namespace invoice {

/**
 * @brief Document rasterization capability
 */
class PageRenderer {
public:
  virtual ~PageRenderer() = default;

  /**
   * @brief Turn document bytes into page images
   * @param document Raw document bytes
   * @param dpi Rendering resolution
   * @return One BGR image per page, in page order (never empty)
   * @throws RenderError if the document cannot be rasterized
   */
  virtual std::vector<cv::Mat> render(const std::string &document,
                                      double dpi) = 0;
};

/**
 * @brief Renders PDFs with Poppler and decodes raster images with OpenCV
 *
 * Bytes that OpenCV can decode (PNG, JPEG, TIFF, ...) form a single page;
 * everything else is loaded as a PDF.
 */
class PopplerPageRenderer : public PageRenderer {
public:
  std::vector<cv::Mat> render(const std::string &document,
                              double dpi) override;

  /**
   * @brief Decode a raster image
   * @return The BGR image, or an empty Mat if the bytes are not an image
   */
  static cv::Mat decodeImage(const std::string &document);

private:
  std::vector<cv::Mat> renderPdf(const std::string &document,
                                 double dpi) const;
};

} // namespace invoice

#endif // INVOICE_PAGE_RENDERER_HPP
