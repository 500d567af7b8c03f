#include "BoilerplateFilter.hpp"

#include <algorithm>
#include <stdexcept>

namespace invoice {

namespace {

// Common size every band strip is resampled to before comparison
const cv::Size kSampleSize(400, 60);

cv::Mat resampleStrip(const cv::Mat &gray, const cv::Rect &strip) {
  cv::Mat resized;
  cv::resize(gray(strip), resized, kSampleSize, 0, 0, cv::INTER_AREA);
  return resized;
}

} // anonymous namespace

BoilerplateFilter::BoilerplateFilter() : m_config() {}

BoilerplateFilter::BoilerplateFilter(const DedupeConfig &config)
    : m_config(config) {}

PageBandSample BoilerplateFilter::sample(const cv::Mat &page) const {
  if (page.empty()) {
    throw std::invalid_argument("Cannot sample bands of an empty page");
  }

  cv::Mat gray;
  if (page.channels() == 1) {
    gray = page;
  } else if (page.channels() == 4) {
    cv::cvtColor(page, gray, cv::COLOR_BGRA2GRAY);
  } else {
    cv::cvtColor(page, gray, cv::COLOR_BGR2GRAY);
  }

  int bandHeight = std::max(
      1, static_cast<int>(page.rows * m_config.bandFraction + 0.5));
  bandHeight = std::min(bandHeight, page.rows);

  PageBandSample sample;
  sample.pageSize = page.size();
  sample.top = resampleStrip(gray, cv::Rect(0, 0, page.cols, bandHeight));
  sample.bottom = resampleStrip(
      gray, cv::Rect(0, page.rows - bandHeight, page.cols, bandHeight));
  return sample;
}

double BoilerplateFilter::normalizedCorrelation(const cv::Mat &a,
                                                const cv::Mat &b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0;
  }

  cv::Mat fa, fb;
  a.convertTo(fa, CV_64F);
  b.convertTo(fb, CV_64F);
  fa -= cv::mean(fa);
  fb -= cv::mean(fb);

  double denominator = cv::norm(fa) * cv::norm(fb);
  if (denominator < 1e-9) {
    return 0.0;
  }
  return fa.dot(fb) / denominator;
}

std::vector<RepeatedBands> BoilerplateFilter::findRepeatedBands(
    const std::vector<PageBandSample> &samples) const {
  std::vector<RepeatedBands> bands(samples.size());
  if (samples.size() < 2) {
    return bands;
  }

  for (size_t i = 0; i < samples.size(); ++i) {
    int topRepeats = 1;
    int bottomRepeats = 1;
    for (size_t j = 0; j < samples.size(); ++j) {
      if (i == j) {
        continue;
      }
      if (normalizedCorrelation(samples[i].top, samples[j].top) >
          m_config.bandSimilarity) {
        topRepeats++;
      }
      if (normalizedCorrelation(samples[i].bottom, samples[j].bottom) >
          m_config.bandSimilarity) {
        bottomRepeats++;
      }
    }
    bands[i].top = topRepeats >= m_config.minRepeatPages;
    bands[i].bottom = bottomRepeats >= m_config.minRepeatPages;
  }
  return bands;
}

std::vector<Candidate>
BoilerplateFilter::annotate(const std::vector<Candidate> &candidates,
                            const std::vector<PageBandSample> &samples,
                            const std::vector<RepeatedBands> &bands) const {
  std::vector<Candidate> annotated = candidates;
  if (samples.size() < 2) {
    return annotated;
  }

  for (auto &candidate : annotated) {
    size_t index = static_cast<size_t>(candidate.page - 1);
    if (candidate.page < 1 || index >= samples.size() ||
        index >= bands.size()) {
      continue;
    }

    const double pageHeight = samples[index].pageSize.height;
    const double centerY =
        candidate.boundingBox.y + candidate.boundingBox.height / 2.0;
    const double bandHeight = pageHeight * m_config.bandFraction;

    if (bands[index].top && centerY < bandHeight) {
      candidate.boilerplate = true;
    } else if (bands[index].bottom && centerY >= pageHeight - bandHeight) {
      candidate.boilerplate = true;
    }
  }
  return annotated;
}

} // namespace invoice
