#ifndef INVOICE_REPORTED_TOTAL_HPP
#define INVOICE_REPORTED_TOTAL_HPP

#include "InvoiceTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace invoice {

/**
 * @brief Find the grand total printed on an invoice
 *
 * Looks for "grand/final/invoice total", "total amount/due/payable",
 * "net total/amount", "balance due" and "amount payable" followed by an
 * amount, in that order of preference. Subtotal and category total lines
 * are ignored. Only positive amounts are accepted.
 *
 * @code
 * findReportedTotal({"Subtotal: 450.00", "Grand Total: $480.00"}); // 480.0
 * @endcode
 *
 * @param lines Text lines in reading order
 */
std::optional<double> findReportedTotal(const std::vector<std::string> &lines);

/**
 * @brief Group OCR tokens into text lines
 *
 * Tokens whose vertical centers lie within @p rowThreshold pixels of a
 * line's first token join that line; words are joined left to right.
 *
 * @return Lines ordered top to bottom
 */
std::vector<std::string> tokensToLines(const std::vector<OcrToken> &tokens,
                                       int rowThreshold = 15);

} // namespace invoice

#endif // INVOICE_REPORTED_TOTAL_HPP
