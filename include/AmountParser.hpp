#ifndef INVOICE_AMOUNT_PARSER_HPP
#define INVOICE_AMOUNT_PARSER_HPP

#include <optional>
#include <string>

namespace invoice {

/**
 * @brief Parse a monetary cell value
 *
 * Accepts thousands separators (1,234,567.89) and lakh/crore grouping
 * (12,34,567.00), currency symbols and codes ($, €, £, ¥, ₹, Rs, INR, USD,
 * EUR, GBP, JPY), parenthesized negatives, a leading or trailing minus and
 * trailing debit/credit notation ("Dr" makes the value negative, "Cr"
 * positive). The whole text must be a monetary value: words around a number
 * make it unparsable.
 *
 * @code
 * parseAmount("(1,200.00)"); // -1200.00
 * parseAmount("₹1,234.50");  // 1234.50
 * parseAmount("1234.56 Dr"); // -1234.56
 * parseAmount("Widget");     // std::nullopt
 * @endcode
 *
 * @param text Raw cell or token text
 * @return The signed value, or std::nullopt when the text is not an amount
 */
std::optional<double> parseAmount(const std::string &text);

/**
 * @brief Whether parseAmount would return a value
 */
bool looksNumeric(const std::string &text);

} // namespace invoice

#endif // INVOICE_AMOUNT_PARSER_HPP
