#ifndef INVOICE_TABLE_DETECTOR_HPP
#define INVOICE_TABLE_DETECTOR_HPP

#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"

#include <opencv2/opencv.hpp>

#include <vector>

namespace invoice {

/**
 * @brief Locates ruled table structures on a page via line morphology
 *
 * Example usage:
 * @code
 * invoice::TableDetector detector;
 * for (const auto &region : detector.detect(normalizedPage)) {
 *   std::cout << region.boundingBox << std::endl;
 * }
 * @endcode
 */
class TableDetector {
public:
  TableDetector();
  explicit TableDetector(const DetectionConfig &config);

  /**
   * @brief Detect table regions on a normalized page
   *
   * An empty result is a normal outcome for pages without ruled tables.
   *
   * @param page Normalized page (BGR or gray)
   * @return Regions ordered top-to-bottom, then left-to-right
   * @throws std::invalid_argument if the page is empty
   */
  std::vector<TableRegion> detect(const cv::Mat &page) const;

  /**
   * @brief Isolate horizontal and vertical rule pixels
   * @param page Normalized page (BGR or gray)
   * @return Binary mask (0/255) of the union of both rule directions
   */
  cv::Mat extractRuleMask(const cv::Mat &page) const;

  /**
   * @brief Intersection over union of two rectangles
   */
  static double intersectionOverUnion(const cv::Rect &a, const cv::Rect &b);

  const DetectionConfig &getConfig() const;

private:
  DetectionConfig m_config;
};

} // namespace invoice

#endif // INVOICE_TABLE_DETECTOR_HPP
