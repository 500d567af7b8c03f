#include <catch2/catch_all.hpp>

#include "AmountParser.hpp"

using namespace invoice;

TEST_CASE("parseAmount reads plain and grouped numbers", "[amount]") {
  REQUIRE(parseAmount("1234.56").value() == Catch::Approx(1234.56));
  REQUIRE(parseAmount("1,234,567.89").value() == Catch::Approx(1234567.89));
  REQUIRE(parseAmount("  42 ").value() == Catch::Approx(42.0));
  REQUIRE(parseAmount(".50").value() == Catch::Approx(0.5));
  REQUIRE(parseAmount("0").value() == Catch::Approx(0.0));
}

TEST_CASE("parseAmount accepts lakh and crore grouping", "[amount]") {
  REQUIRE(parseAmount("12,34,567.00").value() == Catch::Approx(1234567.0));
  REQUIRE(parseAmount("1,00,00,000").value() == Catch::Approx(10000000.0));
}

TEST_CASE("parseAmount strips currency symbols and codes", "[amount]") {
  REQUIRE(parseAmount("$1,200.00").value() == Catch::Approx(1200.0));
  REQUIRE(parseAmount("\xE2\x82\xB9" "1,234.50").value() ==
          Catch::Approx(1234.5));
  REQUIRE(parseAmount("\xE2\x82\xAC 99.99").value() == Catch::Approx(99.99));
  REQUIRE(parseAmount("\xC2\xA3" "5").value() == Catch::Approx(5.0));
  REQUIRE(parseAmount("Rs. 450").value() == Catch::Approx(450.0));
  REQUIRE(parseAmount("INR 1,000").value() == Catch::Approx(1000.0));
  REQUIRE(parseAmount("250.00 USD").value() == Catch::Approx(250.0));
}

TEST_CASE("parseAmount handles negative notations", "[amount]") {
  REQUIRE(parseAmount("(1,200.00)").value() == Catch::Approx(-1200.0));
  REQUIRE(parseAmount("-75.25").value() == Catch::Approx(-75.25));
  REQUIRE(parseAmount("75.25-").value() == Catch::Approx(-75.25));
  REQUIRE(parseAmount("($30.00)").value() == Catch::Approx(-30.0));
}

TEST_CASE("parseAmount applies debit and credit suffixes", "[amount]") {
  REQUIRE(parseAmount("1234.56 Dr").value() == Catch::Approx(-1234.56));
  REQUIRE(parseAmount("1234.56 CR").value() == Catch::Approx(1234.56));
  REQUIRE(parseAmount("500Dr.").value() == Catch::Approx(-500.0));

  // The suffix decides the sign over parentheses
  REQUIRE(parseAmount("(80.00) Cr").value() == Catch::Approx(80.0));
}

TEST_CASE("parseAmount rejects text that is not an amount", "[amount]") {
  REQUIRE_FALSE(parseAmount("").has_value());
  REQUIRE_FALSE(parseAmount("   ").has_value());
  REQUIRE_FALSE(parseAmount("Widget").has_value());
  REQUIRE_FALSE(parseAmount("12 pcs").has_value());
  REQUIRE_FALSE(parseAmount("1,23").has_value());
  REQUIRE_FALSE(parseAmount("1.2.3").has_value());
  REQUIRE_FALSE(parseAmount("$").has_value());
  REQUIRE_FALSE(parseAmount("Dr").has_value());

  REQUIRE(looksNumeric("3,000"));
  REQUIRE_FALSE(looksNumeric("Item 3"));
}
