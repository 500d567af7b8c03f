#ifndef INVOICE_BOILERPLATE_FILTER_HPP
#define INVOICE_BOILERPLATE_FILTER_HPP

#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"

#include <opencv2/opencv.hpp>

#include <vector>

namespace invoice {

/**
 * @brief Downsampled top and bottom strips of one page
 *
 * Pages are reduced to these samples as soon as they are processed so the
 * cross-page comparison does not need the full page images.
 */
struct PageBandSample {
  cv::Mat top;       ///< Gray, resized to the common sample size
  cv::Mat bottom;    ///< Gray, resized to the common sample size
  cv::Size pageSize; ///< Size of the page the strips were taken from
};

/**
 * @brief Which bands of a page repeat across the document
 */
struct RepeatedBands {
  bool top = false;
  bool bottom = false;
};

/**
 * @brief Detects repeated headers/footers and flags candidates inside them
 *
 * The top and bottom strips of every page are compared with the strips at
 * the same position on the other pages via normalized cross-correlation. A
 * strip similar to the strips of enough other pages is boilerplate, and
 * candidates centered in it are excluded from dedupe and reconciliation.
 */
class BoilerplateFilter {
public:
  BoilerplateFilter();
  explicit BoilerplateFilter(const DedupeConfig &config);

  /**
   * @brief Take the band samples of a normalized page
   * @throws std::invalid_argument if the page is empty
   */
  PageBandSample sample(const cv::Mat &page) const;

  /**
   * @brief Classify the bands of every page
   * @param samples One sample per page, in page order
   * @return One entry per page; all false for single-page documents
   */
  std::vector<RepeatedBands>
  findRepeatedBands(const std::vector<PageBandSample> &samples) const;

  /**
   * @brief Flag candidates lying in repeated bands
   *
   * Copies are returned in input order; only the boilerplate flag changes.
   *
   * @param candidates Candidates of the whole document
   * @param samples Band samples in page order (page sizes are taken from
   * them)
   * @param bands Result of findRepeatedBands for the same samples
   */
  std::vector<Candidate>
  annotate(const std::vector<Candidate> &candidates,
           const std::vector<PageBandSample> &samples,
           const std::vector<RepeatedBands> &bands) const;

  /**
   * @brief Zero-mean normalized cross-correlation of two equal-size images
   *
   * Returns a value in [-1, 1]; 0 when either image is flat.
   */
  static double normalizedCorrelation(const cv::Mat &a, const cv::Mat &b);

private:
  DedupeConfig m_config;
};

} // namespace invoice

#endif // INVOICE_BOILERPLATE_FILTER_HPP
