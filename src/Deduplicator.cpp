#include "Deduplicator.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>
#include <string>

namespace invoice {

DisjointSet::DisjointSet(size_t size) : m_parent(size), m_rank(size, 0) {
  for (size_t i = 0; i < size; ++i) {
    m_parent[i] = i;
  }
}

size_t DisjointSet::find(size_t x) {
  size_t root = x;
  while (m_parent[root] != root) {
    root = m_parent[root];
  }
  while (m_parent[x] != root) {
    size_t next = m_parent[x];
    m_parent[x] = root;
    x = next;
  }
  return root;
}

void DisjointSet::unite(size_t a, size_t b) {
  size_t rootA = find(a);
  size_t rootB = find(b);
  if (rootA == rootB) {
    return;
  }
  if (m_rank[rootA] < m_rank[rootB]) {
    std::swap(rootA, rootB);
  }
  m_parent[rootB] = rootA;
  if (m_rank[rootA] == m_rank[rootB]) {
    m_rank[rootA]++;
  }
}

namespace {

bool sameAmount(const Candidate &a, const Candidate &b) {
  if (a.amount.has_value() != b.amount.has_value()) {
    return false;
  }
  return !a.amount || toCents(*a.amount) == toCents(*b.amount);
}

} // anonymous namespace

Deduplicator::Deduplicator() : m_config() {}

Deduplicator::Deduplicator(const DedupeConfig &config) : m_config(config) {}

bool Deduplicator::matches(const Candidate &a, const Candidate &b) const {
  if (!sameAmount(a, b)) {
    return false;
  }
  return tokenSetSimilarity(canonicalizeDescription(a.description),
                            canonicalizeDescription(b.description)) >=
         m_config.similarityThreshold;
}

std::vector<Candidate>
Deduplicator::assignGroups(const std::vector<Candidate> &candidates) const {
  std::vector<Candidate> annotated = candidates;

  std::vector<size_t> members;
  std::vector<std::string> canonical;
  for (size_t i = 0; i < annotated.size(); ++i) {
    annotated[i].duplicateGroup = -1;
    if (!annotated[i].boilerplate) {
      members.push_back(i);
      canonical.push_back(canonicalizeDescription(annotated[i].description));
    }
  }

  DisjointSet groups(members.size());
  for (size_t i = 0; i < members.size(); ++i) {
    for (size_t j = i + 1; j < members.size(); ++j) {
      const Candidate &a = annotated[members[i]];
      const Candidate &b = annotated[members[j]];
      if (!sameAmount(a, b)) {
        continue;
      }
      if (tokenSetSimilarity(canonical[i], canonical[j]) >=
          m_config.similarityThreshold) {
        groups.unite(i, j);
      }
    }
  }

  // Name each group after its lowest candidate id
  std::vector<int> lowestId(members.size(), -1);
  for (size_t i = 0; i < members.size(); ++i) {
    size_t root = groups.find(i);
    int id = annotated[members[i]].id;
    if (lowestId[root] < 0 || id < lowestId[root]) {
      lowestId[root] = id;
    }
  }
  for (size_t i = 0; i < members.size(); ++i) {
    annotated[members[i]].duplicateGroup = lowestId[groups.find(i)];
  }
  return annotated;
}

} // namespace invoice
