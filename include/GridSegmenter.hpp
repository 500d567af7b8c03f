#ifndef INVOICE_GRID_SEGMENTER_HPP
#define INVOICE_GRID_SEGMENTER_HPP

#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"

#include <opencv2/opencv.hpp>

#include <vector>

namespace invoice {

/**
 * @brief Row and column bands of one table region
 */
struct GridLayout {
  std::vector<Band> rows;    ///< Top-to-bottom, region-relative
  std::vector<Band> columns; ///< Left-to-right, region-relative
};

/**
 * @brief Derives row/column bands from a table structure mask
 *
 * Rule lines show up as high-density runs in the projection profile of the
 * mask; bands are the strips between consecutive rules. A region without
 * usable rules along an axis yields a single band spanning that axis.
 */
class GridSegmenter {
public:
  GridSegmenter();
  explicit GridSegmenter(const SegmentationConfig &config);

  /**
   * @brief Segment a region into row and column bands
   * @param structureMask Region-local rule mask (non-zero = rule)
   * @return Layout with at least one row band and one column band
   * @throws std::invalid_argument if the mask is empty or not single-channel
   */
  GridLayout segment(const cv::Mat &structureMask) const;

  /**
   * @brief Bands between the rule runs of a projection profile
   * @param profile Rule pixel count per position along the axis
   * @param extent Size of the perpendicular axis
   * @param minLength Bands shorter than this are dropped
   */
  std::vector<Band> bandsFromProfile(const std::vector<int> &profile,
                                     int extent, int minLength) const;

  /**
   * @brief Build row-major cells in page coordinates
   * @param region Region the layout was computed for
   * @param layout Bands of that region
   */
  std::vector<Cell> cellsFromGrid(const TableRegion &region,
                                  const GridLayout &layout) const;

  const SegmentationConfig &getConfig() const;

private:
  SegmentationConfig m_config;
};

} // namespace invoice

#endif // INVOICE_GRID_SEGMENTER_HPP
