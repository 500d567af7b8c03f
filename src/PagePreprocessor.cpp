#include "PagePreprocessor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace invoice {

PagePreprocessor::PagePreprocessor() : m_config() {}

PagePreprocessor::PagePreprocessor(const PreprocessConfig &config)
    : m_config(config) {}

const PreprocessConfig &PagePreprocessor::getConfig() const { return m_config; }

cv::Mat PagePreprocessor::normalize(const cv::Mat &page) const {
  if (page.empty()) {
    throw std::invalid_argument("Page image is empty");
  }

  cv::Mat bgr;
  if (page.channels() == 1) {
    cv::cvtColor(page, bgr, cv::COLOR_GRAY2BGR);
  } else if (page.channels() == 4) {
    cv::cvtColor(page, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = page.clone();
  }

  if (m_config.deskew) {
    bgr = deskew(bgr);
  }
  if (m_config.correctIllumination) {
    bgr = correctIllumination(bgr);
  }
  if (m_config.enhanceContrast) {
    bgr = enhanceContrast(bgr);
  }
  return bgr;
}

double PagePreprocessor::estimateSkewAngle(const cv::Mat &bgr) {
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

  cv::Mat dark;
  cv::threshold(gray, dark, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

  std::vector<cv::Point> points;
  cv::findNonZero(dark, points);
  if (points.size() < 5) {
    return 0.0;
  }

  double angle = cv::minAreaRect(points).angle;

  // minAreaRect reports [-90, 0) on older OpenCV and (0, 90] on newer ones
  if (angle < -45.0) {
    angle += 90.0;
  } else if (angle > 45.0) {
    angle -= 90.0;
  }
  return angle;
}

cv::Mat PagePreprocessor::deskew(const cv::Mat &bgr) const {
  double angle = estimateSkewAngle(bgr);
  if (std::abs(angle) < m_config.minSkewDegrees) {
    return bgr;
  }

  cv::Point2f center(bgr.cols / 2.0f, bgr.rows / 2.0f);
  cv::Mat rotation = cv::getRotationMatrix2D(center, angle, 1.0);

  // Grow the canvas so no corner of the page is cut off
  double cosA = std::abs(rotation.at<double>(0, 0));
  double sinA = std::abs(rotation.at<double>(0, 1));
  int newWidth = static_cast<int>(bgr.rows * sinA + bgr.cols * cosA);
  int newHeight = static_cast<int>(bgr.rows * cosA + bgr.cols * sinA);
  rotation.at<double>(0, 2) += newWidth / 2.0 - center.x;
  rotation.at<double>(1, 2) += newHeight / 2.0 - center.y;

  cv::Mat rotated;
  cv::warpAffine(bgr, rotated, rotation, cv::Size(newWidth, newHeight),
                 cv::INTER_CUBIC, cv::BORDER_REPLICATE);
  return rotated;
}

cv::Mat PagePreprocessor::correctIllumination(const cv::Mat &bgr) const {
  cv::Mat lab;
  cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);
  std::vector<cv::Mat> channels;
  cv::split(lab, channels);

  int kernel = std::max(bgr.rows, bgr.cols) / 10;
  if (kernel % 2 == 0) {
    kernel += 1;
  }
  kernel = std::max(kernel, 51);

  cv::Mat lightness;
  channels[0].convertTo(lightness, CV_32F);
  cv::Mat background;
  cv::GaussianBlur(lightness, background, cv::Size(kernel, kernel), 0);
  background += 1e-6;

  cv::Mat corrected;
  cv::divide(lightness, background, corrected, 255.0);
  corrected.convertTo(channels[0], CV_8U); // saturates to [0, 255]

  cv::merge(channels, lab);
  cv::Mat result;
  cv::cvtColor(lab, result, cv::COLOR_Lab2BGR);
  return result;
}

cv::Mat PagePreprocessor::enhanceContrast(const cv::Mat &bgr) const {
  cv::Mat lab;
  cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);
  std::vector<cv::Mat> channels;
  cv::split(lab, channels);

  cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
      m_config.claheClipLimit,
      cv::Size(m_config.claheTileSize, m_config.claheTileSize));
  clahe->apply(channels[0], channels[0]);

  cv::merge(channels, lab);
  cv::Mat result;
  cv::cvtColor(lab, result, cv::COLOR_Lab2BGR);
  return result;
}

} // namespace invoice
