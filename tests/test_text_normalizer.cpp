#include <catch2/catch_all.hpp>

#include "TextNormalizer.hpp"

using namespace invoice;

TEST_CASE("canonicalizeDescription lowercases and drops filler", "[normalize]") {
  REQUIRE(canonicalizeDescription("Widget (Qty: 10 pcs)") == "widget 10");
  REQUIRE(canonicalizeDescription("Item - 5 Nos. (Pack)") == "5");
  REQUIRE(canonicalizeDescription("  Blue   WIDGET ") == "blue widget");
  REQUIRE(canonicalizeDescription("---").empty());
}

TEST_CASE("canonicalizeDescription strips unicode punctuation",
          "[normalize]") {
  // Rupee sign, en dash, curly quotes
  REQUIRE(canonicalizeDescription("\xE2\x82\xB9 Steel Rod \xE2\x80\x93 "
                                  "\xE2\x80\x9C" "12mm\xE2\x80\x9D") ==
          "steel rod 12mm");
  REQUIRE(canonicalizeDescription("Bolt\xC3\x97" "4") == "bolt 4");
  REQUIRE(canonicalizeDescription("\xE2\x82\xAC\xE2\x80\x94").empty());
  // Letters outside ASCII stay part of the word
  REQUIRE(canonicalizeDescription("Caf\xC3\xA9 Latte") ==
          "caf\xC3\xA9 latte");
}

TEST_CASE("indelSimilarity scores edit closeness", "[normalize]") {
  REQUIRE(indelSimilarity("", "") == Catch::Approx(100.0));
  REQUIRE(indelSimilarity("abc", "abc") == Catch::Approx(100.0));
  REQUIRE(indelSimilarity("abc", "") == Catch::Approx(0.0));
  // LCS("kitten", "sitting") = 4 ("ittn")
  REQUIRE(indelSimilarity("kitten", "sitting") ==
          Catch::Approx(100.0 * 8.0 / 13.0));
}

TEST_CASE("tokenSetSimilarity ignores word order and is symmetric",
          "[normalize]") {
  REQUIRE(tokenSetSimilarity("blue widget", "widget blue") ==
          Catch::Approx(100.0));

  const std::string a = "steel bolt m8";
  const std::string b = "steel bolts m8 zinc";
  REQUIRE(tokenSetSimilarity(a, b) == Catch::Approx(tokenSetSimilarity(b, a)));

  REQUIRE(tokenSetSimilarity("consulting", "consulting services") ==
          Catch::Approx(100.0));
  REQUIRE(tokenSetSimilarity("widget", "gadget") < 88.0);
}

TEST_CASE("tokenSetSimilarity is zero without tokens", "[normalize]") {
  REQUIRE(tokenSetSimilarity("", "widget") == Catch::Approx(0.0));
  REQUIRE(tokenSetSimilarity("widget", "   ") == Catch::Approx(0.0));
}
