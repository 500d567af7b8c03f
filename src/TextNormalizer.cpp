#include "TextNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace invoice {

namespace {

const std::unordered_set<std::string> &invoiceStopwords() {
  static const std::unordered_set<std::string> words = {
      "qty",  "nos",   "no",    "pcs",   "pc",    "each",   "pack",
      "pkt",  "box",   "unit",  "units", "item",  "items",  "ea",
      "per",  "total", "amt",   "amount", "rate", "price",  "value",
      "description", "desc"};
  return words;
}

// UTF-8 currency signs and punctuation, replaced by spaces before
// tokenizing: rupee, euro, pound, yen, en and em dash, curly quotes,
// bullet, ellipsis, multiplication sign, no-break space
const std::vector<std::string> &unicodePunctuation() {
  static const std::vector<std::string> marks = {
      "\xE2\x82\xB9", "\xE2\x82\xAC", "\xC2\xA3",     "\xC2\xA5",
      "\xE2\x80\x93", "\xE2\x80\x94", "\xE2\x80\x98", "\xE2\x80\x99",
      "\xE2\x80\x9C", "\xE2\x80\x9D", "\xE2\x80\xA2", "\xE2\x80\xA6",
      "\xC3\x97",     "\xC2\xA0"};
  return marks;
}

std::string replaceUnicodePunctuation(const std::string &text) {
  std::string out = text;
  for (const auto &mark : unicodePunctuation()) {
    size_t pos = 0;
    while ((pos = out.find(mark, pos)) != std::string::npos) {
      out.replace(pos, mark.size(), " ");
      pos += 1;
    }
  }
  return out;
}

std::string join(const std::set<std::string> &words) {
  std::string out;
  for (const auto &word : words) {
    if (!out.empty()) {
      out += ' ';
    }
    out += word;
  }
  return out;
}

} // anonymous namespace

std::vector<std::string> splitWords(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

std::string canonicalizeDescription(const std::string &text) {
  std::string lowered;
  lowered.reserve(text.size());
  for (char ch : replaceUnicodePunctuation(text)) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c >= 0x80 || std::isalnum(c)) {
      lowered += static_cast<char>(std::tolower(c));
    } else {
      lowered += ' ';
    }
  }

  const auto &stopwords = invoiceStopwords();
  std::string result;
  for (const auto &word : splitWords(lowered)) {
    if (stopwords.count(word) > 0) {
      continue;
    }
    if (!result.empty()) {
      result += ' ';
    }
    result += word;
  }
  return result;
}

double indelSimilarity(const std::string &a, const std::string &b) {
  const size_t total = a.size() + b.size();
  if (total == 0) {
    return 100.0;
  }

  // Longest common subsequence, two rolling rows
  std::vector<size_t> previous(b.size() + 1, 0), current(b.size() + 1, 0);
  for (size_t i = 1; i <= a.size(); ++i) {
    for (size_t j = 1; j <= b.size(); ++j) {
      if (a[i - 1] == b[j - 1]) {
        current[j] = previous[j - 1] + 1;
      } else {
        current[j] = std::max(previous[j], current[j - 1]);
      }
    }
    std::swap(previous, current);
  }
  const size_t lcs = previous[b.size()];
  return 100.0 * 2.0 * static_cast<double>(lcs) / static_cast<double>(total);
}

double tokenSetSimilarity(const std::string &a, const std::string &b) {
  std::vector<std::string> wordsA = splitWords(a);
  std::vector<std::string> wordsB = splitWords(b);
  std::set<std::string> setA(wordsA.begin(), wordsA.end());
  std::set<std::string> setB(wordsB.begin(), wordsB.end());
  if (setA.empty() || setB.empty()) {
    return 0.0;
  }

  std::set<std::string> shared, onlyA, onlyB;
  std::set_intersection(setA.begin(), setA.end(), setB.begin(), setB.end(),
                        std::inserter(shared, shared.end()));
  std::set_difference(setA.begin(), setA.end(), setB.begin(), setB.end(),
                      std::inserter(onlyA, onlyA.end()));
  std::set_difference(setB.begin(), setB.end(), setA.begin(), setA.end(),
                      std::inserter(onlyB, onlyB.end()));

  if (!shared.empty() && (onlyA.empty() || onlyB.empty())) {
    return 100.0;
  }

  const std::string sharedText = join(shared);
  const std::string restA = join(onlyA);
  const std::string restB = join(onlyB);

  double best = indelSimilarity(restA, restB);
  if (!sharedText.empty()) {
    const std::string withA = sharedText + " " + restA;
    const std::string withB = sharedText + " " + restB;
    best = std::max(best, indelSimilarity(sharedText, withA));
    best = std::max(best, indelSimilarity(sharedText, withB));
    best = std::max(best, indelSimilarity(withA, withB));
  }
  return best;
}

} // namespace invoice
