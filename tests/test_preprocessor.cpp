#include <catch2/catch_all.hpp>

#include "PagePreprocessor.hpp"

#include <cmath>
#include <stdexcept>

using namespace invoice;

namespace {

cv::Mat pageWithBlock(double angle) {
  cv::Mat page(600, 800, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::RotatedRect block(cv::Point2f(400, 300), cv::Size2f(400, 200),
                        static_cast<float>(angle));
  cv::Point2f corners[4];
  block.points(corners);
  std::vector<cv::Point> polygon;
  for (const auto &corner : corners) {
    polygon.push_back(cv::Point(cvRound(corner.x), cvRound(corner.y)));
  }
  cv::fillConvexPoly(page, polygon, cv::Scalar(0, 0, 0));
  return page;
}

} // namespace

TEST_CASE("normalize always returns a BGR page", "[preprocess]") {
  PreprocessConfig config;
  config.deskew = false;
  PagePreprocessor preprocessor(config);

  cv::Mat gray(300, 200, CV_8UC1, cv::Scalar(240));
  cv::Mat normalized = preprocessor.normalize(gray);
  REQUIRE(normalized.type() == CV_8UC3);
  REQUIRE(normalized.size() == gray.size());

  cv::Mat bgra(300, 200, CV_8UC4, cv::Scalar(240, 240, 240, 255));
  REQUIRE(preprocessor.normalize(bgra).type() == CV_8UC3);
}

TEST_CASE("normalize without enhancements copies the page", "[preprocess]") {
  PreprocessConfig config;
  config.deskew = false;
  config.correctIllumination = false;
  config.enhanceContrast = false;
  PagePreprocessor preprocessor(config);

  cv::Mat page = pageWithBlock(0.0);
  cv::Mat normalized = preprocessor.normalize(page);
  REQUIRE(cv::norm(page, normalized, cv::NORM_INF) == 0.0);
  REQUIRE(normalized.data != page.data);
}

TEST_CASE("estimateSkewAngle measures rotated content", "[preprocess]") {
  REQUIRE(PagePreprocessor::estimateSkewAngle(pageWithBlock(0.0)) ==
          Catch::Approx(0.0).margin(0.5));
  REQUIRE(std::abs(PagePreprocessor::estimateSkewAngle(pageWithBlock(5.0))) ==
          Catch::Approx(5.0).margin(0.5));

  cv::Mat blank(600, 800, CV_8UC3, cv::Scalar(255, 255, 255));
  REQUIRE(PagePreprocessor::estimateSkewAngle(blank) == Catch::Approx(0.0));
}

TEST_CASE("normalize deskews onto a larger canvas", "[preprocess]") {
  PagePreprocessor preprocessor;

  cv::Mat straight = preprocessor.normalize(pageWithBlock(0.0));
  REQUIRE(straight.size() == cv::Size(800, 600));

  cv::Mat page = pageWithBlock(5.0);
  cv::Mat normalized = preprocessor.normalize(page);
  REQUIRE(normalized.cols > page.cols);
  REQUIRE(normalized.rows > page.rows);
  REQUIRE(normalized.type() == CV_8UC3);
}

TEST_CASE("normalize rejects empty pages", "[preprocess]") {
  PagePreprocessor preprocessor;
  REQUIRE_THROWS_AS(preprocessor.normalize(cv::Mat()), std::invalid_argument);
}
