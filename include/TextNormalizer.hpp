#ifndef INVOICE_TEXT_NORMALIZER_HPP
#define INVOICE_TEXT_NORMALIZER_HPP

#include <string>
#include <vector>

namespace invoice {

/**
 * @brief Canonical form of a line item description
 *
 * Lower-cases, turns punctuation into spaces, drops invoice stopwords
 * (units and filler such as "qty", "pcs", "item", "amount") and collapses
 * whitespace.
 *
 * @code
 * canonicalizeDescription("Item - 5 Nos. (Pack)"); // "5"
 * canonicalizeDescription("Widget (Qty: 10 pcs)"); // "widget 10"
 * @endcode
 */
std::string canonicalizeDescription(const std::string &text);

/**
 * @brief Split on whitespace
 */
std::vector<std::string> splitWords(const std::string &text);

/**
 * @brief Normalized indel similarity of two strings (0-100)
 *
 * 100 * 2 * LCS(a, b) / (|a| + |b|); two empty strings score 100.
 */
double indelSimilarity(const std::string &a, const std::string &b);

/**
 * @brief Order-independent token-overlap similarity (0-100)
 *
 * Compares the sorted shared vocabulary with each side's sorted remainder
 * and keeps the best indel similarity. Symmetric in its arguments; 100 when
 * one token set contains the other; 0 when either side has no tokens.
 */
double tokenSetSimilarity(const std::string &a, const std::string &b);

} // namespace invoice

#endif // INVOICE_TEXT_NORMALIZER_HPP
