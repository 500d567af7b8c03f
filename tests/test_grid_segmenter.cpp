#include <catch2/catch_all.hpp>

#include "GridSegmenter.hpp"

#include <stdexcept>

using namespace invoice;

namespace {

// 4 rows of 60 px and 3 columns of 100 px separated by 2 px rules
cv::Mat ruledMask() {
  cv::Mat mask = cv::Mat::zeros(242, 302, CV_8UC1);
  for (int r = 0; r <= 4; ++r) {
    cv::rectangle(mask, cv::Rect(0, r * 60, 302, 2), cv::Scalar(255),
                  cv::FILLED);
  }
  for (int c = 0; c <= 3; ++c) {
    cv::rectangle(mask, cv::Rect(c * 100, 0, 2, 242), cv::Scalar(255),
                  cv::FILLED);
  }
  return mask;
}

} // namespace

TEST_CASE("segment finds the bands between rules", "[grid]") {
  GridSegmenter segmenter;
  GridLayout layout = segmenter.segment(ruledMask());

  REQUIRE(layout.rows.size() == 4);
  REQUIRE(layout.columns.size() == 3);

  for (int k = 0; k < 4; ++k) {
    REQUIRE(layout.rows[k].center() == Catch::Approx(k * 60 + 31).margin(2));
    REQUIRE(layout.rows[k].length() >= 56);
  }
  for (int k = 0; k < 3; ++k) {
    REQUIRE(layout.columns[k].center() ==
            Catch::Approx(k * 100 + 51).margin(2));
  }
}

TEST_CASE("segment falls back to one band per axis without rules", "[grid]") {
  GridSegmenter segmenter;
  cv::Mat mask = cv::Mat::zeros(50, 120, CV_8UC1);

  GridLayout layout = segmenter.segment(mask);
  REQUIRE(layout.rows.size() == 1);
  REQUIRE(layout.rows[0].start == 0);
  REQUIRE(layout.rows[0].end == 50);
  REQUIRE(layout.columns.size() == 1);
  REQUIRE(layout.columns[0].end == 120);
}

TEST_CASE("segment uses the region edges around a single rule", "[grid]") {
  GridSegmenter segmenter;
  cv::Mat mask = cv::Mat::zeros(100, 200, CV_8UC1);
  cv::rectangle(mask, cv::Rect(0, 49, 200, 2), cv::Scalar(255), cv::FILLED);

  GridLayout layout = segmenter.segment(mask);
  REQUIRE(layout.rows.size() == 2);
  REQUIRE(layout.rows[0].start == 0);
  REQUIRE(layout.rows[0].end == 49);
  REQUIRE(layout.rows[1].start == 51);
  REQUIRE(layout.rows[1].end == 100);
}

TEST_CASE("bandsFromProfile drops bands thinner than the minimum", "[grid]") {
  GridSegmenter segmenter;
  // Rules at 0, 5 and 40 in a 10 px wide region
  std::vector<int> profile(50, 0);
  profile[0] = 10;
  profile[5] = 10;
  profile[40] = 10;

  auto bands = segmenter.bandsFromProfile(profile, 10, 12);
  REQUIRE(bands.size() == 1);
  REQUIRE(bands[0].start == 6);
  REQUIRE(bands[0].end == 40);
}

TEST_CASE("cellsFromGrid builds inset row-major cells in page coordinates",
          "[grid]") {
  GridSegmenter segmenter;
  TableRegion region;
  region.boundingBox = cv::Rect(50, 40, 302, 242);
  region.structureMask = ruledMask();

  GridLayout layout = segmenter.segment(region.structureMask);
  auto cells = segmenter.cellsFromGrid(region, layout);

  REQUIRE(cells.size() == 12);
  REQUIRE(cells[0].row == 0);
  REQUIRE(cells[0].column == 0);
  REQUIRE(cells[1].column == 1);
  REQUIRE(cells[3].row == 1);

  const Band &row = layout.rows[0];
  const Band &column = layout.columns[0];
  REQUIRE(cells[0].rect.x == 50 + column.start + 2);
  REQUIRE(cells[0].rect.y == 40 + row.start + 2);
  REQUIRE(cells[0].rect.width == column.length() - 4);
  REQUIRE(cells[0].rect.height == row.length() - 4);
  REQUIRE(cells[0].tokens.empty());
}

TEST_CASE("segment rejects unusable masks", "[grid]") {
  GridSegmenter segmenter;
  REQUIRE_THROWS_AS(segmenter.segment(cv::Mat()), std::invalid_argument);
  REQUIRE_THROWS_AS(segmenter.segment(cv::Mat::zeros(10, 10, CV_8UC3)),
                    std::invalid_argument);
}
