#ifndef INVOICE_DEDUPLICATOR_HPP
#define INVOICE_DEDUPLICATOR_HPP

#include "InvoiceConfig.hpp"
#include "InvoiceTypes.hpp"

#include <vector>

namespace invoice {

/**
 * @brief Union-find over dense indices with path compression and union by
 * rank
 */
class DisjointSet {
public:
  explicit DisjointSet(size_t size);

  size_t find(size_t x);
  void unite(size_t a, size_t b);
  size_t size() const { return m_parent.size(); }

private:
  std::vector<size_t> m_parent;
  std::vector<unsigned> m_rank;
};

/**
 * @brief Groups fuzzy duplicates among line item candidates
 *
 * Two candidates match when the token-set similarity of their canonical
 * descriptions reaches the configured threshold and their amounts agree to
 * the cent (two absent amounts agree). Matches are merged transitively.
 */
class Deduplicator {
public:
  Deduplicator();
  explicit Deduplicator(const DedupeConfig &config);

  /**
   * @brief Annotate every candidate with its duplicate group
   *
   * Boilerplate candidates take no part and keep group -1. Every other
   * candidate gets the lowest id of its group (its own id when alone).
   *
   * @param candidates Candidates after header/footer filtering
   * @return Annotated copies in the input order
   */
  std::vector<Candidate>
  assignGroups(const std::vector<Candidate> &candidates) const;

  /**
   * @brief Whether two candidates describe the same line item
   */
  bool matches(const Candidate &a, const Candidate &b) const;

private:
  DedupeConfig m_config;
};

} // namespace invoice

#endif // INVOICE_DEDUPLICATOR_HPP
