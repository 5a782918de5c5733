#include "run_summary.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace eventcache::service {

namespace {

using google::protobuf::Struct;

void SetNumber(Struct* object, const std::string& key, double value) {
  (*object->mutable_fields())[key].set_number_value(value);
}

void SetString(Struct* object, const std::string& key, const std::string& value) {
  (*object->mutable_fields())[key].set_string_value(value);
}

void SetOptional(Struct* object, const std::string& key, const std::optional<int64_t>& value) {
  auto& field = (*object->mutable_fields())[key];
  if (value) {
    field.set_number_value(static_cast<double>(*value));
  } else {
    field.set_null_value(google::protobuf::NULL_VALUE);
  }
}

void SetStrings(Struct* object, const std::string& key, const std::vector<std::string>& values) {
  auto* list = (*object->mutable_fields())[key].mutable_list_value();
  for (const auto& value : values) {
    list->add_values()->set_string_value(value);
  }
}

void SetRanges(Struct* object, const std::string& key, const range::RangeList& ranges) {
  auto* list = (*object->mutable_fields())[key].mutable_list_value();
  for (const auto& r : ranges) {
    auto* pair = list->add_values()->mutable_list_value();
    pair->add_values()->set_number_value(static_cast<double>(r.start_ms));
    pair->add_values()->set_number_value(static_cast<double>(r.end_ms));
  }
}

} // namespace

std::string RunSummaryToJson(const RunSummary& run) {
  Struct root;

  SetString(&root, "entity_id", run.entity_id);
  SetRanges(&root, "requested", {run.requested});
  SetString(&root, "decision", run.decision);
  SetRanges(&root, "missing_ranges", run.missing_ranges);

  SetStrings(&root, "output_segments", run.output_segments);
  SetStrings(&root, "segments_used", run.segments_used);
  SetStrings(&root, "segments_written", run.segments_written);

  SetNumber(&root, "rows_processed", static_cast<double>(run.rows_processed));
  SetNumber(&root, "raw_events_seen", static_cast<double>(run.raw_events_seen));
  SetNumber(&root, "duplicates_dropped", static_cast<double>(run.duplicates_dropped));
  SetNumber(&root, "malformed_events", static_cast<double>(run.malformed_events));
  SetNumber(&root, "pages_fetched", static_cast<double>(run.pages_fetched));
  SetNumber(&root, "parts_written", run.parts_written);
  SetNumber(&root, "total_bytes_written", static_cast<double>(run.total_bytes_written));
  SetNumber(&root, "type_conflicts", static_cast<double>(run.type_conflicts));
  SetOptional(&root, "part_bytes_min", run.part_bytes_min);
  SetOptional(&root, "part_bytes_max", run.part_bytes_max);
  SetOptional(&root, "observed_min_ts_ms", run.observed_min_ts_ms);
  SetOptional(&root, "observed_max_ts_ms", run.observed_max_ts_ms);
  SetOptional(&root, "provider_total_matched", run.provider_total_matched);
  SetNumber(&root, "duration_ms", static_cast<double>(run.duration_ms));

  auto* summary = (*root.mutable_fields())["summary"].mutable_struct_value();
  SetNumber(summary, "row_count", static_cast<double>(run.summary.row_count));
  SetNumber(summary, "part_count", run.summary.part_count);
  SetNumber(summary, "total_bytes", static_cast<double>(run.summary.total_bytes));
  SetOptional(summary, "timestamp_min", run.summary.timestamp_min);
  SetOptional(summary, "timestamp_max", run.summary.timestamp_max);
  SetStrings(summary, "skipped_segments", run.summary.skipped_segments);
  auto* columns = (*summary->mutable_fields())["columns"].mutable_struct_value();
  for (const auto& [name, type] : run.summary.columns) {
    SetString(columns, name, type);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render run summary: " + std::string(status.message()));
  }
  return json;
}

} // namespace eventcache::service
