#include "CandidateAssembler.hpp"
#include "AmountParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>

namespace invoice {

namespace {

std::string cellText(const Cell &cell) {
  std::string text;
  for (const auto &token : cell.tokens) {
    if (token.text.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += ' ';
    }
    text += token.text;
  }
  return text;
}

bool hasDigit(const std::string &text) {
  return std::any_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

// Running token-weighted confidence and token box union of one row
struct RowStats {
  double confidenceSum = 0.0;
  int confidenceCount = 0;
  cv::Rect box;
  bool hasBox = false;

  void add(const OcrToken &token) {
    if (token.confidence >= 0) {
      confidenceSum += token.confidence;
      confidenceCount++;
    }
    if (token.boundingBox.area() > 0) {
      box = hasBox ? (box | token.boundingBox) : token.boundingBox;
      hasBox = true;
    }
  }

  std::optional<double> confidence() const {
    if (confidenceCount == 0) {
      return std::nullopt;
    }
    return confidenceSum / confidenceCount;
  }
};

} // anonymous namespace

CandidateAssembler::CandidateAssembler() : m_config() {}

CandidateAssembler::CandidateAssembler(const AssemblyConfig &config)
    : m_config(config) {}

const AssemblyConfig &CandidateAssembler::getConfig() const {
  return m_config;
}

bool CandidateAssembler::isSummaryRow(const std::string &description) {
  static const std::regex summary(
      "^[^a-z0-9]*(sub[ -]*total|grand *total|total|amount *due|balance|"
      "net *amount)\\b",
      std::regex::icase);
  return std::regex_search(description, summary);
}

AssemblyResult CandidateAssembler::assembleFromCells(
    const std::vector<Cell> &cells, int page, int firstId) const {
  AssemblyResult result;

  std::map<int, std::vector<const Cell *>> rows;
  for (const auto &cell : cells) {
    rows[cell.row].push_back(&cell);
  }

  int nextId = firstId;
  for (auto &entry : rows) {
    auto &rowCells = entry.second;
    std::sort(rowCells.begin(), rowCells.end(),
              [](const Cell *a, const Cell *b) { return a->column < b->column; });

    std::vector<std::string> texts;
    bool anyText = false;
    for (const Cell *cell : rowCells) {
      texts.push_back(cellText(*cell));
      anyText = anyText || !texts.back().empty();
    }
    if (!anyText) {
      continue;
    }

    // Amount: first value that parses, scanning right to left
    std::optional<double> amount;
    int amountColumn = -1;
    for (int c = static_cast<int>(texts.size()) - 1; c >= 0; --c) {
      if (texts[c].empty()) {
        continue;
      }
      amount = parseAmount(texts[c]);
      if (amount) {
        amountColumn = c;
        break;
      }
    }

    std::string description;
    RowStats stats;
    for (size_t c = 0; c < rowCells.size(); ++c) {
      for (const auto &token : rowCells[c]->tokens) {
        stats.add(token);
      }
      if (static_cast<int>(c) == amountColumn || texts[c].empty()) {
        continue;
      }
      if (!description.empty()) {
        description += ' ';
      }
      description += texts[c];
    }

    if (m_config.skipSummaryRows && isSummaryRow(description)) {
      continue;
    }

    if (!amount) {
      auto last = std::find_if(texts.rbegin(), texts.rend(),
                               [](const std::string &t) { return !t.empty(); });
      if (last != texts.rend() && hasDigit(*last) && texts.size() > 1) {
        result.warnings.push_back(
            {ErrorCategory::Parse, page,
             "Unparsable amount in table row " + std::to_string(entry.first)});
      }
    }

    Candidate candidate;
    candidate.id = nextId++;
    candidate.description = description;
    candidate.amount = amount;
    candidate.confidence = stats.confidence();
    candidate.page = page;
    if (stats.hasBox) {
      candidate.boundingBox = stats.box;
    } else {
      cv::Rect rowRect = rowCells.front()->rect;
      for (const Cell *cell : rowCells) {
        rowRect |= cell->rect;
      }
      candidate.boundingBox = rowRect;
    }
    result.candidates.push_back(candidate);
  }

  return result;
}

AssemblyResult
CandidateAssembler::assembleFromPageTokens(const std::vector<OcrToken> &tokens,
                                           int page, int firstId) const {
  AssemblyResult result;

  std::vector<OcrToken> kept;
  for (const auto &token : tokens) {
    if (!token.text.empty() &&
        token.confidence >= m_config.fallbackMinConfidence) {
      kept.push_back(token);
    }
  }

  auto centerY = [](const OcrToken &t) {
    return t.boundingBox.y + t.boundingBox.height / 2.0;
  };
  std::stable_sort(kept.begin(), kept.end(),
                   [&](const OcrToken &a, const OcrToken &b) {
                     return centerY(a) < centerY(b);
                   });

  // Cluster into lines around the first token of each line
  std::vector<std::vector<OcrToken>> lines;
  double anchor = 0.0;
  for (const auto &token : kept) {
    if (lines.empty() ||
        std::abs(centerY(token) - anchor) > m_config.fallbackRowThreshold) {
      lines.emplace_back();
      anchor = centerY(token);
    }
    lines.back().push_back(token);
  }

  int nextId = firstId;
  for (auto &line : lines) {
    std::sort(line.begin(), line.end(),
              [](const OcrToken &a, const OcrToken &b) {
                return a.boundingBox.x < b.boundingBox.x;
              });

    std::optional<double> amount;
    int amountIndex = -1;
    for (int i = static_cast<int>(line.size()) - 1; i >= 0; --i) {
      auto value = parseAmount(line[i].text);
      if (value && toCents(*value) != 0) {
        amount = value;
        amountIndex = i;
        break;
      }
    }
    if (!amount) {
      continue;
    }

    std::string description;
    RowStats stats;
    for (size_t i = 0; i < line.size(); ++i) {
      stats.add(line[i]);
      if (static_cast<int>(i) == amountIndex) {
        continue;
      }
      if (!description.empty()) {
        description += ' ';
      }
      description += line[i].text;
    }
    if (description.empty()) {
      continue;
    }
    if (m_config.skipSummaryRows && isSummaryRow(description)) {
      continue;
    }

    Candidate candidate;
    candidate.id = nextId++;
    candidate.description = description;
    candidate.amount = amount;
    candidate.confidence = stats.confidence();
    candidate.page = page;
    candidate.boundingBox = stats.box;
    result.candidates.push_back(candidate);
  }

  return result;
}

bool CandidateAssembler::isContinuation(const Candidate &previous,
                                        const Candidate &next) const {
  if (next.amount || next.description.empty() || previous.page != next.page) {
    return false;
  }
  if (std::abs(next.boundingBox.x - previous.boundingBox.x) >
      m_config.alignmentTolerance) {
    return false;
  }
  const int gap = next.boundingBox.y -
                  (previous.boundingBox.y + previous.boundingBox.height);
  return gap >= m_config.minContinuationGap &&
         gap <= m_config.maxContinuationGap;
}

std::vector<Candidate> CandidateAssembler::mergeContinuationRows(
    const std::vector<Candidate> &candidates) const {
  std::vector<Candidate> merged;
  merged.reserve(candidates.size());

  for (const auto &candidate : candidates) {
    if (merged.empty() || !isContinuation(merged.back(), candidate)) {
      merged.push_back(candidate);
      continue;
    }

    Candidate &previous = merged.back();
    if (previous.description.empty()) {
      previous.description = candidate.description;
    } else {
      previous.description += " " + candidate.description;
    }

    // Grow down and right; the left and top edges stay
    const cv::Rect &a = previous.boundingBox;
    const cv::Rect &b = candidate.boundingBox;
    const int right = std::max(a.x + a.width, b.x + b.width);
    const int bottom = std::max(a.y + a.height, b.y + b.height);
    previous.boundingBox = cv::Rect(a.x, a.y, right - a.x, bottom - a.y);

    if (candidate.confidence &&
        (!previous.confidence || *candidate.confidence > *previous.confidence)) {
      previous.confidence = candidate.confidence;
    }
  }

  return merged;
}

} // namespace invoice
