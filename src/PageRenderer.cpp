#include "PageRenderer.hpp"
#include "InvoiceErrors.hpp"

#include <memory>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace invoice {

namespace {

// Copy a rendered Poppler image into an OpenCV BGR Mat
cv::Mat toMat(const poppler::image &popplerImage) {
  int width = popplerImage.width();
  int height = popplerImage.height();
  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA in memory
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    cv::Mat gray(height, width, CV_8UC1,
                 const_cast<char *>(popplerImage.const_data()),
                 popplerImage.bytes_per_row());
    cv::cvtColor(gray, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    break;
  }
  return mat;
}

} // anonymous namespace

cv::Mat PopplerPageRenderer::decodeImage(const std::string &document) {
  if (document.empty()) {
    return cv::Mat();
  }
  cv::Mat buffer(1, static_cast<int>(document.size()), CV_8UC1,
                 const_cast<char *>(document.data()));
  return cv::imdecode(buffer, cv::IMREAD_COLOR);
}

std::vector<cv::Mat> PopplerPageRenderer::render(const std::string &document,
                                                 double dpi) {
  if (document.empty()) {
    throw RenderError(RenderError::Reason::InvalidDocument,
                      "Document is empty");
  }

  cv::Mat image = decodeImage(document);
  if (!image.empty()) {
    return {image};
  }
  return renderPdf(document, dpi);
}

std::vector<cv::Mat> PopplerPageRenderer::renderPdf(const std::string &document,
                                                    double dpi) const {
  if (!poppler::page_renderer::can_render()) {
    throw RenderError(RenderError::Reason::Unavailable,
                      "Poppler was built without a rendering backend");
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
      document.data(), static_cast<int>(document.size())));
  if (!doc) {
    throw RenderError(RenderError::Reason::InvalidDocument,
                      "Bytes are neither an image nor a readable PDF");
  }
  if (doc->is_locked()) {
    throw RenderError(RenderError::Reason::InvalidDocument,
                      "PDF file is password protected");
  }

  int pageCount = doc->pages();
  if (pageCount < 1) {
    throw RenderError(RenderError::Reason::InvalidDocument, "PDF has no pages");
  }

  // Create page renderer with antialiasing
  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  std::vector<cv::Mat> pages;
  for (int pageIndex = 0; pageIndex < pageCount; ++pageIndex) {
    std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));
    if (!page) {
      throw RenderError(RenderError::Reason::InvalidDocument,
                        "Failed to open page " + std::to_string(pageIndex + 1));
    }

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
    if (!popplerImage.is_valid()) {
      throw RenderError(RenderError::Reason::InvalidDocument,
                        "Failed to render page " +
                            std::to_string(pageIndex + 1));
    }

    cv::Mat mat = toMat(popplerImage);
    if (mat.empty()) {
      throw RenderError(RenderError::Reason::InvalidDocument,
                        "Unsupported image format on page " +
                            std::to_string(pageIndex + 1));
    }
    pages.push_back(mat);
  }
  return pages;
}

} // namespace invoice
