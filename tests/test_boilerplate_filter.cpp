#include <catch2/catch_all.hpp>

#include "BoilerplateFilter.hpp"
#include "TestSupport.hpp"

#include <stdexcept>

using namespace invoice;
using invoice::test::makeCandidate;

namespace {

cv::Mat page(bool withHeader) {
  cv::Mat image(1000, 700, CV_8UC3, cv::Scalar(255, 255, 255));
  if (withHeader) {
    // Logo block and letterhead lines in the top band
    cv::rectangle(image, cv::Rect(30, 20, 80, 80), cv::Scalar(0, 0, 0),
                  cv::FILLED);
    cv::rectangle(image, cv::Rect(150, 30, 300, 12), cv::Scalar(40, 40, 40),
                  cv::FILLED);
    cv::rectangle(image, cv::Rect(150, 70, 220, 10), cv::Scalar(40, 40, 40),
                  cv::FILLED);
  }
  return image;
}

Candidate at(int id, int page, int y) {
  Candidate candidate = makeCandidate(id, "Acme Corp", 10.0, 90.0, page);
  candidate.boundingBox = cv::Rect(150, y, 300, 20);
  return candidate;
}

} // namespace

TEST_CASE("sample reduces bands to the common size", "[boilerplate]") {
  BoilerplateFilter filter;
  PageBandSample sample = filter.sample(page(true));

  REQUIRE(sample.pageSize == cv::Size(700, 1000));
  REQUIRE(sample.top.size() == cv::Size(400, 60));
  REQUIRE(sample.bottom.size() == cv::Size(400, 60));
  REQUIRE(sample.top.type() == CV_8UC1);
  REQUIRE_THROWS_AS(filter.sample(cv::Mat()), std::invalid_argument);
}

TEST_CASE("normalizedCorrelation", "[boilerplate]") {
  cv::Mat a(60, 400, CV_8UC1, cv::Scalar(255));
  cv::rectangle(a, cv::Rect(10, 10, 100, 20), cv::Scalar(0), cv::FILLED);
  cv::Mat inverted = 255 - a;
  cv::Mat flat(60, 400, CV_8UC1, cv::Scalar(255));

  REQUIRE(BoilerplateFilter::normalizedCorrelation(a, a) ==
          Catch::Approx(1.0));
  REQUIRE(BoilerplateFilter::normalizedCorrelation(a, inverted) ==
          Catch::Approx(-1.0));
  REQUIRE(BoilerplateFilter::normalizedCorrelation(a, flat) ==
          Catch::Approx(0.0));
  REQUIRE(BoilerplateFilter::normalizedCorrelation(a, cv::Mat()) ==
          Catch::Approx(0.0));
}

TEST_CASE("a header on every page is boilerplate", "[boilerplate]") {
  BoilerplateFilter filter;
  std::vector<PageBandSample> samples = {filter.sample(page(true)),
                                         filter.sample(page(true)),
                                         filter.sample(page(true))};

  auto bands = filter.findRepeatedBands(samples);
  REQUIRE(bands.size() == 3);
  for (const auto &band : bands) {
    REQUIRE(band.top);
    REQUIRE_FALSE(band.bottom);
  }

  auto annotated = filter.annotate(
      {at(0, 1, 30), at(1, 1, 500), at(2, 2, 30), at(3, 3, 30)}, samples,
      bands);
  REQUIRE(annotated[0].boilerplate);
  REQUIRE_FALSE(annotated[1].boilerplate);
  REQUIRE(annotated[2].boilerplate);
  REQUIRE(annotated[3].boilerplate);
  REQUIRE(annotated[1].duplicateGroup == -1);
}

TEST_CASE("a header on one page of three is kept", "[boilerplate]") {
  BoilerplateFilter filter;
  std::vector<PageBandSample> samples = {filter.sample(page(true)),
                                         filter.sample(page(false)),
                                         filter.sample(page(false))};

  auto bands = filter.findRepeatedBands(samples);
  REQUIRE_FALSE(bands[0].top);

  auto annotated = filter.annotate({at(0, 1, 30)}, samples, bands);
  REQUIRE_FALSE(annotated[0].boilerplate);
}

TEST_CASE("single-page documents are never filtered", "[boilerplate]") {
  BoilerplateFilter filter;
  std::vector<PageBandSample> samples = {filter.sample(page(true))};

  auto bands = filter.findRepeatedBands(samples);
  REQUIRE(bands.size() == 1);
  REQUIRE_FALSE(bands[0].top);
  REQUIRE_FALSE(bands[0].bottom);

  RepeatedBands forced;
  forced.top = true;
  auto annotated = filter.annotate({at(0, 1, 30)}, samples, {forced});
  REQUIRE_FALSE(annotated[0].boilerplate);
}

TEST_CASE("minimum repeat count is configurable", "[boilerplate]") {
  DedupeConfig config;
  config.minRepeatPages = 3;
  BoilerplateFilter filter(config);
  std::vector<PageBandSample> samples = {filter.sample(page(true)),
                                         filter.sample(page(true)),
                                         filter.sample(page(false))};

  auto bands = filter.findRepeatedBands(samples);
  REQUIRE_FALSE(bands[0].top);
  REQUIRE_FALSE(bands[1].top);
}
