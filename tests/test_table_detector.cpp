#include <catch2/catch_all.hpp>

#include "TableDetector.hpp"
#include "TestSupport.hpp"

#include <stdexcept>

using namespace invoice;

namespace {

cv::Mat blankPage() {
  return cv::Mat(600, 800, CV_8UC3, cv::Scalar(255, 255, 255));
}

bool contains(const cv::Rect &outer, const cv::Rect &inner) {
  return (outer & inner) == inner;
}

} // namespace

TEST_CASE("detect finds a ruled table", "[detect]") {
  cv::Mat page = blankPage();
  test::drawGrid(page, cv::Point(100, 100), {60, 60, 60, 60},
                 {150, 150, 150});

  TableDetector detector;
  auto regions = detector.detect(page);

  REQUIRE(regions.size() == 1);
  REQUIRE(contains(regions[0].boundingBox, cv::Rect(100, 100, 452, 242)));
  REQUIRE(regions[0].structureMask.size() == regions[0].boundingBox.size());
  REQUIRE(regions[0].structureMask.type() == CV_8UC1);
  REQUIRE(cv::countNonZero(regions[0].structureMask) > 0);
}

TEST_CASE("detect returns nothing for pages without rules", "[detect]") {
  TableDetector detector;
  REQUIRE(detector.detect(blankPage()).empty());

  // Short strokes are text, not rules
  cv::Mat page = blankPage();
  for (int i = 0; i < 10; ++i) {
    cv::rectangle(page, cv::Rect(100 + i * 30, 200, 12, 3),
                  cv::Scalar(0, 0, 0), cv::FILLED);
    cv::rectangle(page, cv::Rect(100 + i * 30, 230, 3, 12),
                  cv::Scalar(0, 0, 0), cv::FILLED);
  }
  REQUIRE(detector.detect(page).empty());
}

TEST_CASE("detect orders regions top to bottom", "[detect]") {
  cv::Mat page = blankPage();
  test::drawGrid(page, cv::Point(80, 380), {50, 50}, {200, 200});
  test::drawGrid(page, cv::Point(300, 60), {50, 50}, {200, 200});

  TableDetector detector;
  auto regions = detector.detect(page);

  REQUIRE(regions.size() == 2);
  REQUIRE(regions[0].boundingBox.y < regions[1].boundingBox.y);
  REQUIRE(contains(regions[0].boundingBox, cv::Rect(300, 60, 402, 102)));
  REQUIRE(contains(regions[1].boundingBox, cv::Rect(80, 380, 402, 102)));
}

TEST_CASE("detect accepts gray pages and rejects empty ones", "[detect]") {
  cv::Mat gray(600, 800, CV_8UC1, cv::Scalar(255));
  test::drawGrid(gray, cv::Point(100, 100), {60, 60}, {150, 150});

  TableDetector detector;
  REQUIRE(detector.detect(gray).size() == 1);
  REQUIRE_THROWS_AS(detector.detect(cv::Mat()), std::invalid_argument);
}

TEST_CASE("intersectionOverUnion", "[detect]") {
  cv::Rect a(0, 0, 10, 10);
  REQUIRE(TableDetector::intersectionOverUnion(a, a) == Catch::Approx(1.0));
  REQUIRE(TableDetector::intersectionOverUnion(a, cv::Rect(20, 20, 5, 5)) ==
          Catch::Approx(0.0));
  REQUIRE(TableDetector::intersectionOverUnion(a, cv::Rect(5, 0, 10, 10)) ==
          Catch::Approx(50.0 / 150.0));
}
