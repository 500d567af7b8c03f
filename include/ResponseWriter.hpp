#ifndef INVOICE_RESPONSE_WRITER_HPP
#define INVOICE_RESPONSE_WRITER_HPP

#include "InvoiceExtractor.hpp"

#include <string>

namespace invoice {

/**
 * @brief Render an extraction result as the JSON response document
 *
 * Successful results:
 * @code
 * {
 *   "is_success": true,
 *   "data": {
 *     "pagewise_line_items": [
 *       {"page_no": "1", "bill_items": [
 *         {"item_name": "Widget", "item_amount": 100.0, "confidence": 95.0}]}
 *     ],
 *     "total_item_count": 1,
 *     "reconciled_amount": 100.0
 *   },
 *   "reconciliation": {"status": "ok", "target_total": null, ...},
 *   "warnings": [{"category": "detection_empty", "page": 2, "message": "..."}]
 * }
 * @endcode
 *
 * Failures carry "is_success": false, "error" (the sanitized message) and
 * "error_category".
 *
 * @param result Result to render
 * @param pretty Indent the output
 */
std::string writeResponse(const ExtractionResult &result, bool pretty = true);

} // namespace invoice

#endif // INVOICE_RESPONSE_WRITER_HPP
