#include "internal/model/event_row.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <string>

namespace {

using eventcache::model::EventRow;
using eventcache::model::KindOf;
using eventcache::model::ValueKind;

EventRow FromJson(const std::string& json, const std::string& timestamp_column = "timestamp") {
  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object);
  assert(status.ok());
  return EventRow::FromStruct(object, timestamp_column);
}

void TestDedupeKeyPrefersSequenceString() {
  auto row = FromJson(R"({"log_id": "abc", "sequence_number_str": "123456789012345678901", "sequence_number": 1})");
  assert(row.DedupeKey() == std::string("abc:123456789012345678901"));
}

void TestDedupeKeyFallsBackToSequenceNumber() {
  auto row = FromJson(R"({"log_id": "abc", "sequence_number": 42})");
  assert(row.DedupeKey() == std::string("abc:42"));
}

void TestDedupeKeyNeedsBothParts() {
  assert(!FromJson(R"({"log_id": "abc"})").DedupeKey());
  assert(!FromJson(R"({"sequence_number": 42})").DedupeKey());
  assert(!FromJson(R"({"log_id": null, "sequence_number": 42})").DedupeKey());
}

void TestTimestampFromIsoString() {
  auto row = FromJson(R"({"ts": "2026-02-10T00:00:00Z"})", "ts");
  assert(row.TimestampMs() == 1770681600000);
  assert(KindOf(*row.Find("ts")) == ValueKind::kTimestamp);

  auto naive = FromJson(R"({"ts": "yesterday"})", "ts");
  assert(!naive.TimestampMs());
  assert(KindOf(*naive.Find("ts")) == ValueKind::kString);
}

void TestEstimatedBytesGrowsWithPayload() {
  auto small = FromJson(R"({"message": "a"})");
  auto large = FromJson(R"({"message": ")" + std::string(1000, 'x') + R"("})");
  assert(small.EstimatedBytes() > 0);
  assert(large.EstimatedBytes() >= small.EstimatedBytes() + 999);
}

} // namespace

int main() {
  TestDedupeKeyPrefersSequenceString();
  TestDedupeKeyFallsBackToSequenceNumber();
  TestDedupeKeyNeedsBothParts();
  TestTimestampFromIsoString();
  TestEstimatedBytesGrowsWithPayload();

  std::cout << "eventcache_unit_event_row: pass\n";
  return 0;
}
