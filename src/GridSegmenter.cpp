#include "GridSegmenter.hpp"

#include <cmath>
#include <stdexcept>

namespace invoice {

namespace {

std::vector<int> projectionProfile(const cv::Mat &binary, int dim) {
  // dim 1 reduces each row to one value, dim 0 each column
  cv::Mat sums;
  cv::reduce(binary, sums, dim, cv::REDUCE_SUM, CV_32S);
  std::vector<int> profile;
  sums.reshape(1, 1).copyTo(profile);
  return profile;
}

} // anonymous namespace

GridSegmenter::GridSegmenter() : m_config() {}

GridSegmenter::GridSegmenter(const SegmentationConfig &config)
    : m_config(config) {}

const SegmentationConfig &GridSegmenter::getConfig() const { return m_config; }

std::vector<Band> GridSegmenter::bandsFromProfile(
    const std::vector<int> &profile, int extent, int minLength) const {
  const int length = static_cast<int>(profile.size());
  const double threshold = m_config.ruleFraction * extent;

  std::vector<Band> rules;
  int runStart = -1;
  for (int i = 0; i < length; ++i) {
    bool isRule = profile[i] > 0 && profile[i] >= threshold;
    if (isRule && runStart < 0) {
      runStart = i;
    } else if (!isRule && runStart >= 0) {
      rules.push_back({runStart, i});
      runStart = -1;
    }
  }
  if (runStart >= 0) {
    rules.push_back({runStart, length});
  }

  // Fewer than two rules: the region edges stand in for the outer rules
  if (rules.size() < 2) {
    rules.insert(rules.begin(), Band{0, 0});
    rules.push_back(Band{length, length});
  }

  std::vector<Band> bands;
  for (size_t i = 0; i + 1 < rules.size(); ++i) {
    Band band{rules[i].end, rules[i + 1].start};
    if (band.length() >= minLength) {
      bands.push_back(band);
    }
  }

  if (bands.empty()) {
    bands.push_back({0, length});
  }
  return bands;
}

GridLayout GridSegmenter::segment(const cv::Mat &structureMask) const {
  if (structureMask.empty()) {
    throw std::invalid_argument("Structure mask is empty");
  }
  if (structureMask.channels() != 1) {
    throw std::invalid_argument("Structure mask must be single-channel");
  }

  cv::Mat binary;
  cv::compare(structureMask, 0, binary, cv::CMP_GT);
  binary.convertTo(binary, CV_8U, 1.0 / 255.0);

  GridLayout layout;
  layout.rows = bandsFromProfile(projectionProfile(binary, 1),
                                 structureMask.cols, m_config.minRowHeight);
  layout.columns = bandsFromProfile(projectionProfile(binary, 0),
                                    structureMask.rows,
                                    m_config.minColumnWidth);
  return layout;
}

std::vector<Cell> GridSegmenter::cellsFromGrid(const TableRegion &region,
                                               const GridLayout &layout) const {
  std::vector<Cell> cells;
  cells.reserve(layout.rows.size() * layout.columns.size());

  const cv::Rect &box = region.boundingBox;
  for (size_t r = 0; r < layout.rows.size(); ++r) {
    const Band &row = layout.rows[r];
    for (size_t c = 0; c < layout.columns.size(); ++c) {
      const Band &column = layout.columns[c];

      cv::Rect rect(box.x + column.start, box.y + row.start, column.length(),
                    row.length());
      int inset = m_config.cellInset;
      if (rect.width > 2 * inset && rect.height > 2 * inset) {
        rect.x += inset;
        rect.y += inset;
        rect.width -= 2 * inset;
        rect.height -= 2 * inset;
      }

      Cell cell;
      cell.row = static_cast<int>(r);
      cell.column = static_cast<int>(c);
      cell.rect = rect;
      cells.push_back(std::move(cell));
    }
  }
  return cells;
}

} // namespace invoice
