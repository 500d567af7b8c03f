#include <catch2/catch_all.hpp>

#include "Deduplicator.hpp"
#include "TestSupport.hpp"

using namespace invoice;
using invoice::test::makeCandidate;

TEST_CASE("DisjointSet merges transitively", "[dedupe]") {
  DisjointSet set(5);
  set.unite(0, 1);
  set.unite(3, 4);
  set.unite(1, 4);

  REQUIRE(set.find(0) == set.find(3));
  REQUIRE(set.find(1) == set.find(4));
  REQUIRE(set.find(2) != set.find(0));
  REQUIRE(set.size() == 5);
}

TEST_CASE("assignGroups links fuzzy duplicates with equal amounts",
          "[dedupe]") {
  Deduplicator deduplicator;
  auto annotated = deduplicator.assignGroups(
      {makeCandidate(0, "Widget (Qty: 2 pcs)", 100.0, 90.0),
       makeCandidate(1, "Gadget", 200.0, 90.0, 1),
       makeCandidate(2, "widget 2", 100.0, 80.0, 2),
       makeCandidate(3, "Widget 2", 120.0, 80.0, 2)});

  REQUIRE(annotated.size() == 4);
  REQUIRE(annotated[0].duplicateGroup == 0);
  REQUIRE(annotated[1].duplicateGroup == 1);
  REQUIRE(annotated[2].duplicateGroup == 0);
  // Same words, different amount
  REQUIRE(annotated[3].duplicateGroup == 3);
}

TEST_CASE("assignGroups is transitive", "[dedupe]") {
  // a~b and b~c although a and c alone fall below the threshold
  Deduplicator deduplicator;
  auto annotated = deduplicator.assignGroups(
      {makeCandidate(0, "steel bolt m8", 10.0, 90.0),
       makeCandidate(1, "steel bolt m8 zinc", 10.0, 90.0),
       makeCandidate(2, "bolt m8 zinc", 10.0, 90.0)});

  REQUIRE_FALSE(deduplicator.matches(annotated[0], annotated[2]));
  REQUIRE(annotated[0].duplicateGroup == 0);
  REQUIRE(annotated[1].duplicateGroup == 0);
  REQUIRE(annotated[2].duplicateGroup == 0);
}

TEST_CASE("assignGroups names groups after the lowest id", "[dedupe]") {
  Deduplicator deduplicator;
  auto annotated =
      deduplicator.assignGroups({makeCandidate(9, "Service fee", 30.0, 70.0),
                                 makeCandidate(4, "service fee", 30.0, 60.0)});

  REQUIRE(annotated[0].duplicateGroup == 4);
  REQUIRE(annotated[1].duplicateGroup == 4);
  REQUIRE(annotated[0].id == 9);
}

TEST_CASE("assignGroups leaves boilerplate ungrouped", "[dedupe]") {
  Candidate header = makeCandidate(0, "Acme Corp invoice", 1.0, 90.0);
  header.boilerplate = true;
  Candidate copy = makeCandidate(1, "Acme Corp invoice", 1.0, 90.0, 2);
  copy.boilerplate = true;
  Candidate item = makeCandidate(2, "Acme Corp invoice", 1.0, 90.0, 3);

  Deduplicator deduplicator;
  auto annotated = deduplicator.assignGroups({header, copy, item});
  REQUIRE(annotated[0].duplicateGroup == -1);
  REQUIRE(annotated[1].duplicateGroup == -1);
  REQUIRE(annotated[2].duplicateGroup == 2);
}

TEST_CASE("matches compares absent amounts as equal", "[dedupe]") {
  Deduplicator deduplicator;
  auto a = makeCandidate(0, "Delivery note", std::nullopt, 90.0);
  auto b = makeCandidate(1, "delivery note", std::nullopt, 50.0);
  auto c = makeCandidate(2, "delivery note", 5.0, 50.0);

  REQUIRE(deduplicator.matches(a, b));
  REQUIRE_FALSE(deduplicator.matches(a, c));

  // 100.004 and 100.00 round to the same cents
  REQUIRE(deduplicator.matches(makeCandidate(0, "Widget", 100.004, 90.0),
                               makeCandidate(1, "Widget", 100.0, 90.0)));
}

TEST_CASE("similarity threshold is configurable", "[dedupe]") {
  DedupeConfig config;
  config.similarityThreshold = 50.0;
  Deduplicator lenient(config);
  REQUIRE(lenient.matches(makeCandidate(0, "steel bolt m8", 10.0, 90.0),
                          makeCandidate(1, "bolt m8 zinc", 10.0, 90.0)));
}
