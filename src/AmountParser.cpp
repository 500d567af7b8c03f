#include "AmountParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace invoice {

namespace {

std::string trim(const std::string &s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a])))
    a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
    b--;
  return s.substr(a, b - a);
}

void eraseAll(std::string &s, const std::string &needle) {
  size_t pos;
  while ((pos = s.find(needle)) != std::string::npos) {
    s.erase(pos, needle.size());
  }
}

} // namespace

std::optional<double> parseAmount(const std::string &text) {
  static const std::regex debitCredit("^(.*[0-9)])\\s*(dr|cr)\\.?$",
                                      std::regex::icase);
  static const std::regex currencyCode("inr|usd|eur|gbp|jpy|rs\\.?",
                                       std::regex::icase);
  static const std::regex number(
      "^(?:\\d{1,3}(?:,\\d{3})+|\\d{1,2}(?:,\\d{2})+,\\d{3}|\\d+)(?:\\.\\d+)?$"
      "|^\\.\\d+$");

  std::string s = trim(text);
  if (s.empty()) {
    return std::nullopt;
  }

  // +1 credit, -1 debit, 0 no notation
  int notation = 0;
  std::smatch m;
  if (std::regex_match(s, m, debitCredit)) {
    char first = static_cast<char>(
        std::tolower(static_cast<unsigned char>(m[2].str()[0])));
    notation = first == 'd' ? -1 : 1;
    s = m[1].str();
  }

  // UTF-8 currency signs: rupee, euro, pound, yen
  eraseAll(s, "\xE2\x82\xB9");
  eraseAll(s, "\xE2\x82\xAC");
  eraseAll(s, "\xC2\xA3");
  eraseAll(s, "\xC2\xA5");
  eraseAll(s, "$");
  s = std::regex_replace(s, currencyCode, "");
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](unsigned char c) { return std::isspace(c); }),
          s.end());

  bool negative = false;
  if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
    negative = true;
    s = s.substr(1, s.size() - 2);
  }
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = negative || s.front() == '-';
    s.erase(0, 1);
  } else if (!s.empty() && s.back() == '-') {
    negative = true;
    s.pop_back();
  }

  if (!std::regex_match(s, number)) {
    return std::nullopt;
  }

  s.erase(std::remove(s.begin(), s.end(), ','), s.end());
  char *end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || !std::isfinite(value)) {
    return std::nullopt;
  }

  if (notation < 0) {
    return -std::abs(value);
  }
  if (notation > 0) {
    return std::abs(value);
  }
  return negative ? -value : value;
}

bool looksNumeric(const std::string &text) {
  return parseAmount(text).has_value();
}

} // namespace invoice
