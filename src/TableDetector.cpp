#include "TableDetector.hpp"

#include <algorithm>
#include <stdexcept>

namespace invoice {

TableDetector::TableDetector() : m_config() {}

TableDetector::TableDetector(const DetectionConfig &config)
    : m_config(config) {}

const DetectionConfig &TableDetector::getConfig() const { return m_config; }

double TableDetector::intersectionOverUnion(const cv::Rect &a,
                                            const cv::Rect &b) {
  double intersection = (a & b).area();
  double unionArea = a.area() + b.area() - intersection;
  return unionArea > 0 ? intersection / unionArea : 0.0;
}

cv::Mat TableDetector::extractRuleMask(const cv::Mat &page) const {
  cv::Mat gray;
  if (page.channels() == 3) {
    cv::cvtColor(page, gray, cv::COLOR_BGR2GRAY);
  } else if (page.channels() == 4) {
    cv::cvtColor(page, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = page;
  }

  cv::Mat binary;
  cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY_INV, m_config.thresholdBlockSize,
                        m_config.thresholdOffset);

  // Long thin kernels keep only runs at least ruleKernelLength long
  cv::Mat horizontalKernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(m_config.ruleKernelLength, 1));
  cv::Mat horizontal;
  cv::morphologyEx(binary, horizontal, cv::MORPH_OPEN, horizontalKernel,
                   cv::Point(-1, -1), m_config.openIterations);

  cv::Mat verticalKernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(1, m_config.ruleKernelLength));
  cv::Mat vertical;
  cv::morphologyEx(binary, vertical, cv::MORPH_OPEN, verticalKernel,
                   cv::Point(-1, -1), m_config.openIterations);

  cv::Mat rules;
  cv::bitwise_or(horizontal, vertical, rules);
  return rules;
}

std::vector<TableRegion> TableDetector::detect(const cv::Mat &page) const {
  if (page.empty()) {
    throw std::invalid_argument("Input page is empty");
  }

  cv::Mat rules = extractRuleMask(page);

  cv::Mat structure;
  cv::Mat closeKernel =
      cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5));
  cv::morphologyEx(rules, structure, cv::MORPH_CLOSE, closeKernel,
                   cv::Point(-1, -1), m_config.closeIterations);
  cv::Mat dilateKernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(m_config.dilateSize, m_config.dilateSize));
  cv::dilate(structure, structure, dilateKernel, cv::Point(-1, -1),
             m_config.dilateIterations);

  cv::Mat labels, stats, centroids;
  int count = cv::connectedComponentsWithStats(structure, labels, stats,
                                               centroids, 8, CV_32S);

  std::vector<cv::Rect> boxes;
  for (int label = 1; label < count; ++label) {
    cv::Rect box(stats.at<int>(label, cv::CC_STAT_LEFT),
                 stats.at<int>(label, cv::CC_STAT_TOP),
                 stats.at<int>(label, cv::CC_STAT_WIDTH),
                 stats.at<int>(label, cv::CC_STAT_HEIGHT));
    if (box.area() >= m_config.minTableArea) {
      boxes.push_back(box);
    }
  }

  // Overlapping components collapse to the larger one
  std::sort(boxes.begin(), boxes.end(),
            [](const cv::Rect &a, const cv::Rect &b) {
              if (a.area() != b.area()) {
                return a.area() > b.area();
              }
              if (a.y != b.y) {
                return a.y < b.y;
              }
              return a.x < b.x;
            });
  std::vector<cv::Rect> kept;
  for (const auto &box : boxes) {
    bool overlaps = std::any_of(kept.begin(), kept.end(),
                                [&](const cv::Rect &other) {
                                  return intersectionOverUnion(box, other) >
                                         m_config.overlapIoU;
                                });
    if (!overlaps) {
      kept.push_back(box);
    }
  }

  std::sort(kept.begin(), kept.end(),
            [](const cv::Rect &a, const cv::Rect &b) {
              if (a.y != b.y) {
                return a.y < b.y;
              }
              return a.x < b.x;
            });

  std::vector<TableRegion> regions;
  regions.reserve(kept.size());
  for (const auto &box : kept) {
    TableRegion region;
    region.boundingBox = box;
    region.structureMask = rules(box).clone();
    regions.push_back(std::move(region));
  }
  return regions;
}

} // namespace invoice
