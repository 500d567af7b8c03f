#ifndef INVOICE_CANDIDATE_ASSEMBLER_HPP
#define INVOICE_CANDIDATE_ASSEMBLER_HPP

#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"

#include <string>
#include <vector>

namespace invoice {

/**
 * @brief Candidates of one page plus the conditions met while building them
 */
struct AssemblyResult {
  std::vector<Candidate> candidates;
  std::vector<Warning> warnings;
};

/**
 * @brief Turns OCR'd table cells into line item candidates
 *
 * Each table row becomes one candidate: the amount is the first value that
 * parses when scanning the columns right to left, the description is the
 * text of every other column. Rows that only continue the description of
 * the row above are folded into it by mergeContinuationRows().
 */
class CandidateAssembler {
public:
  CandidateAssembler();
  explicit CandidateAssembler(const AssemblyConfig &config);

  /**
   * @brief Build one candidate per non-empty table row
   *
   * Summary rows (total, subtotal, balance, ...) are skipped when configured.
   * A row whose last non-empty cell contains digits but does not parse is
   * kept without amount and reported as a Parse warning.
   *
   * @param cells Cells of one table region with their tokens
   * @param page 1-indexed page number
   * @param firstId Id given to the first candidate, the rest follow
   */
  AssemblyResult assembleFromCells(const std::vector<Cell> &cells, int page,
                                   int firstId = 0) const;

  /**
   * @brief Build candidates from the free token layout of a page
   *
   * Used for pages without ruled tables. Tokens above the confidence floor
   * are clustered into lines; each line ending in a non-zero amount becomes
   * a candidate.
   */
  AssemblyResult assembleFromPageTokens(const std::vector<OcrToken> &tokens,
                                        int page, int firstId = 0) const;

  /**
   * @brief Fold amount-less continuation rows into their predecessor
   *
   * The merged candidate keeps the predecessor's id, amount, page and left
   * edge. Applying the merge to its own output changes nothing.
   */
  std::vector<Candidate>
  mergeContinuationRows(const std::vector<Candidate> &candidates) const;

  /**
   * @brief Whether @p next continues the description of @p previous
   */
  bool isContinuation(const Candidate &previous, const Candidate &next) const;

  /**
   * @brief Whether a row description is a total/subtotal/balance line
   */
  static bool isSummaryRow(const std::string &description);

  const AssemblyConfig &getConfig() const;

private:
  AssemblyConfig m_config;
};

} // namespace invoice

#endif // INVOICE_CANDIDATE_ASSEMBLER_HPP
