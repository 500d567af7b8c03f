#include <catch2/catch_all.hpp>

#include "ResponseWriter.hpp"
#include "TestSupport.hpp"

#include <rapidjson/document.h>

using namespace invoice;
using invoice::test::makeCandidate;

namespace {

rapidjson::Document parse(const std::string &json) {
  rapidjson::Document document;
  document.Parse(json.c_str());
  REQUIRE_FALSE(document.HasParseError());
  REQUIRE(document.IsObject());
  return document;
}

ExtractionResult successfulResult() {
  ExtractionResult result;
  result.success = true;
  result.pageCount = 2;
  result.candidates = {makeCandidate(0, "Widget", 100.0, 95.5, 1),
                       makeCandidate(1, "Widget", 100.0, 80.0, 2),
                       makeCandidate(2, "Gadget \"XL\"", 200.004, std::nullopt,
                                     2)};
  result.targetTotal = 300.0;
  result.tolerance = 5.0;
  result.reconciliation.selectedIds = {0, 2};
  result.reconciliation.selectedTotal = 300.0;
  result.reconciliation.solverName = "cbc";
  result.warnings.push_back(
      {ErrorCategory::DetectionEmpty, 3, "No table found on page"});
  result.processingTimeMs = 1234.56;
  return result;
}

} // namespace

TEST_CASE("writeResponse groups selected items by page", "[response]") {
  auto document = parse(writeResponse(successfulResult()));

  REQUIRE(document["is_success"].GetBool());
  REQUIRE_FALSE(document.HasMember("error"));

  const auto &data = document["data"];
  const auto &pages = data["pagewise_line_items"];
  REQUIRE(pages.Size() == 2);
  REQUIRE(std::string(pages[0]["page_no"].GetString()) == "1");
  REQUIRE(std::string(pages[1]["page_no"].GetString()) == "2");

  const auto &first = pages[0]["bill_items"][0];
  REQUIRE(std::string(first["item_name"].GetString()) == "Widget");
  REQUIRE(first["item_amount"].GetDouble() == Catch::Approx(100.0));
  REQUIRE(first["confidence"].GetDouble() == Catch::Approx(95.5));
  REQUIRE(first.HasMember("item_rate"));
  REQUIRE(first["item_rate"].IsNull());
  REQUIRE(first.HasMember("item_quantity"));
  REQUIRE(first["item_quantity"].IsNull());

  const auto &second = pages[1]["bill_items"];
  REQUIRE(second.Size() == 1);
  REQUIRE(std::string(second[0]["item_name"].GetString()) == "Gadget \"XL\"");
  REQUIRE(second[0]["item_amount"].GetDouble() == Catch::Approx(200.0));
  REQUIRE(second[0]["confidence"].IsNull());

  REQUIRE(data["total_item_count"].GetInt() == 2);
  REQUIRE(data["reconciled_amount"].GetDouble() == Catch::Approx(300.0));
}

TEST_CASE("writeResponse reports the reconciliation", "[response]") {
  auto document = parse(writeResponse(successfulResult(), false));

  const auto &reconciliation = document["reconciliation"];
  REQUIRE(std::string(reconciliation["status"].GetString()) == "ok");
  REQUIRE(reconciliation["reported_total"].IsNull());
  REQUIRE(reconciliation["target_total"].GetDouble() == Catch::Approx(300.0));
  REQUIRE(reconciliation["tolerance"].GetDouble() == Catch::Approx(5.0));
  REQUIRE(reconciliation["deviation"].GetDouble() == Catch::Approx(0.0));
  REQUIRE(reconciliation["within_tolerance"].GetBool());
  REQUIRE(std::string(reconciliation["solver"].GetString()) == "cbc");
  REQUIRE(reconciliation["candidate_count"].GetInt() == 3);

  const auto &warnings = document["warnings"];
  REQUIRE(warnings.Size() == 1);
  REQUIRE(std::string(warnings[0]["category"].GetString()) ==
          "detection_empty");
  REQUIRE(warnings[0]["page"].GetInt() == 3);

  REQUIRE(document["page_count"].GetInt() == 2);
  REQUIRE(document["processing_time_ms"].GetDouble() ==
          Catch::Approx(1234.6));
}

TEST_CASE("compact output is a single line", "[response]") {
  std::string compact = writeResponse(successfulResult(), false);
  REQUIRE(compact.find('\n') == std::string::npos);
  REQUIRE(writeResponse(successfulResult()).find('\n') != std::string::npos);
}

TEST_CASE("writeResponse reports failures without data", "[response]") {
  ExtractionResult result;
  result.errorCategory = ErrorCategory::Download;
  result.errorMessage = "The document could not be retrieved";

  auto document = parse(writeResponse(result));
  REQUIRE_FALSE(document["is_success"].GetBool());
  REQUIRE_FALSE(document.HasMember("data"));
  REQUIRE_FALSE(document.HasMember("reconciliation"));
  REQUIRE(std::string(document["error"].GetString()) ==
          "The document could not be retrieved");
  REQUIRE(std::string(document["error_category"].GetString()) == "download");
  REQUIRE(document["warnings"].Size() == 0);
}

TEST_CASE("an infeasible reconciliation without solver is labelled",
          "[response]") {
  ExtractionResult result = successfulResult();
  result.reconciliation.status = ReconciliationResult::Status::Infeasible;
  result.reconciliation.solverName.clear();

  auto document = parse(writeResponse(result));
  REQUIRE(std::string(document["reconciliation"]["status"].GetString()) ==
          "infeasible");
  REQUIRE(document["reconciliation"]["solver"].IsNull());
}
