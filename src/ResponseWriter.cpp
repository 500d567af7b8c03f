#include "ResponseWriter.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <map>

namespace invoice {

namespace {

double roundCents(double value) {
  return static_cast<double>(toCents(value)) / 100.0;
}

template <class Writer>
void writeOptional(Writer &writer, const std::optional<double> &value) {
  if (value) {
    writer.Double(roundCents(*value));
  } else {
    writer.Null();
  }
}

template <class Writer>
void writeItems(Writer &writer, const ExtractionResult &result) {
  std::map<int, std::vector<Candidate>> byPage;
  for (const auto &candidate : result.selectedCandidates()) {
    byPage[candidate.page].push_back(candidate);
  }

  writer.Key("pagewise_line_items");
  writer.StartArray();
  for (const auto &page : byPage) {
    writer.StartObject();
    writer.Key("page_no");
    writer.String(std::to_string(page.first).c_str());
    writer.Key("bill_items");
    writer.StartArray();
    for (const auto &item : page.second) {
      writer.StartObject();
      writer.Key("item_name");
      writer.String(item.description.c_str(),
                    static_cast<rapidjson::SizeType>(item.description.size()));
      writer.Key("item_amount");
      writeOptional(writer, item.amount);
      // Rate and quantity are not extracted
      writer.Key("item_rate");
      writer.Null();
      writer.Key("item_quantity");
      writer.Null();
      writer.Key("confidence");
      writeOptional(writer, item.confidence);
      writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
  }
  writer.EndArray();

  writer.Key("total_item_count");
  writer.Int(static_cast<int>(result.reconciliation.selectedIds.size()));
  writer.Key("reconciled_amount");
  writer.Double(roundCents(result.reconciliation.selectedTotal));
}

template <class Writer>
void writeReconciliation(Writer &writer, const ExtractionResult &result) {
  const ReconciliationResult &reconciliation = result.reconciliation;
  writer.Key("reconciliation");
  writer.StartObject();
  writer.Key("status");
  writer.String(reconciliation.status == ReconciliationResult::Status::Ok
                    ? "ok"
                    : "infeasible");
  writer.Key("reported_total");
  writeOptional(writer, result.reportedTotal);
  writer.Key("target_total");
  writeOptional(writer, result.targetTotal);
  writer.Key("tolerance");
  writer.Double(roundCents(result.tolerance));
  writer.Key("deviation");
  writer.Double(roundCents(reconciliation.deviation));
  writer.Key("within_tolerance");
  writer.Bool(reconciliation.withinTolerance);
  writer.Key("solver");
  if (reconciliation.solverName.empty()) {
    writer.Null();
  } else {
    writer.String(reconciliation.solverName.c_str());
  }
  writer.Key("candidate_count");
  writer.Int(static_cast<int>(result.candidates.size()));
  writer.EndObject();
}

template <class Writer>
void writeWarnings(Writer &writer, const std::vector<Warning> &warnings) {
  writer.Key("warnings");
  writer.StartArray();
  for (const auto &warning : warnings) {
    writer.StartObject();
    writer.Key("category");
    writer.String(categoryName(warning.category));
    writer.Key("page");
    writer.Int(warning.page);
    writer.Key("message");
    writer.String(warning.message.c_str(),
                  static_cast<rapidjson::SizeType>(warning.message.size()));
    writer.EndObject();
  }
  writer.EndArray();
}

template <class Writer>
void writeDocument(Writer &writer, const ExtractionResult &result) {
  writer.StartObject();
  writer.Key("is_success");
  writer.Bool(result.success);

  if (result.success) {
    writer.Key("data");
    writer.StartObject();
    writeItems(writer, result);
    writer.EndObject();
    writeReconciliation(writer, result);
  } else {
    writer.Key("error");
    writer.String(result.errorMessage.c_str(),
                  static_cast<rapidjson::SizeType>(result.errorMessage.size()));
    writer.Key("error_category");
    writer.String(categoryName(result.errorCategory));
  }

  writeWarnings(writer, result.warnings);
  writer.Key("page_count");
  writer.Int(result.pageCount);
  writer.Key("processing_time_ms");
  writer.Double(std::round(result.processingTimeMs * 10.0) / 10.0);
  writer.EndObject();
}

} // anonymous namespace

std::string writeResponse(const ExtractionResult &result, bool pretty) {
  rapidjson::StringBuffer buffer;
  if (pretty) {
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    writeDocument(writer, result);
  } else {
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writeDocument(writer, result);
  }
  return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace invoice
