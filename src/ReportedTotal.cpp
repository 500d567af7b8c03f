#include "ReportedTotal.hpp"
#include "AmountParser.hpp"

#include <algorithm>
#include <cmath>
#include <regex>

namespace invoice {

std::optional<double>
findReportedTotal(const std::vector<std::string> &lines) {
  // Optional currency marker, then the amount in group 1
  static const std::string kAmount =
      "\\s*[:\\-]?\\s*(?:rs\\.?|inr|\xE2\x82\xB9|\\$)?\\s*([0-9][0-9,]*(?:\\.[0-9]+)?)";
  static const std::vector<std::regex> patterns = {
      std::regex("(?:grand|final|invoice)\\s+total" + kAmount,
                 std::regex::icase),
      std::regex("total\\s+(?:amount|due|payable)" + kAmount,
                 std::regex::icase),
      std::regex("net\\s+(?:total|amount)" + kAmount, std::regex::icase),
      std::regex("balance\\s*due" + kAmount, std::regex::icase),
      std::regex("amount\\s+payable" + kAmount, std::regex::icase)};
  static const std::regex partial("sub\\s*-?\\s*total|category",
                                  std::regex::icase);

  for (const auto &pattern : patterns) {
    for (const auto &line : lines) {
      if (std::regex_search(line, partial)) {
        continue;
      }
      std::smatch match;
      if (!std::regex_search(line, match, pattern)) {
        continue;
      }
      auto amount = parseAmount(match[1].str());
      if (amount && *amount > 0) {
        return amount;
      }
    }
  }
  return std::nullopt;
}

std::vector<std::string> tokensToLines(const std::vector<OcrToken> &tokens,
                                       int rowThreshold) {
  std::vector<const OcrToken *> sorted;
  for (const auto &token : tokens) {
    if (!token.text.empty()) {
      sorted.push_back(&token);
    }
  }
  auto centerY = [](const OcrToken *t) {
    return t->boundingBox.y + t->boundingBox.height / 2.0;
  };
  std::stable_sort(sorted.begin(), sorted.end(),
                   [&](const OcrToken *a, const OcrToken *b) {
                     return centerY(a) < centerY(b);
                   });

  std::vector<std::vector<const OcrToken *>> rows;
  double anchor = 0.0;
  for (const OcrToken *token : sorted) {
    if (rows.empty() || std::abs(centerY(token) - anchor) > rowThreshold) {
      rows.emplace_back();
      anchor = centerY(token);
    }
    rows.back().push_back(token);
  }

  std::vector<std::string> lines;
  for (auto &row : rows) {
    std::sort(row.begin(), row.end(), [](const OcrToken *a, const OcrToken *b) {
      return a->boundingBox.x < b->boundingBox.x;
    });
    std::string line;
    for (const OcrToken *token : row) {
      if (!line.empty()) {
        line += ' ';
      }
      line += token->text;
    }
    lines.push_back(line);
  }
  return lines;
}

} // namespace invoice
