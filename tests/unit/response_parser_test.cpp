#include "internal/client/response_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using eventcache::client::ParseQueryPage;
using eventcache::model::KindOf;
using eventcache::model::ValueKind;

bool IsProtocolError(const std::string& body) {
  try {
    (void)ParseQueryPage(body, "timestamp");
  } catch (const eventcache::util::ProtocolError&) {
    return true;
  }
  return false;
}

void TestListOfObjects() {
  auto page = ParseQueryPage(
      R"({"events": [{"timestamp": 1700000000123, "log_id": "L1", "sequence_number": 7, "ratio": 0.5, "ok": true,
                      "labels": {"env": "prod"}, "message": "hello"}]})",
      "timestamp");

  assert(page.events.size() == 1);
  assert(!page.in_progress);
  assert(!page.next_link && !page.self_link);

  const auto& row = page.events[0];
  assert(row.TimestampMs() == 1700000000123);
  assert(KindOf(*row.Find("timestamp")) == ValueKind::kTimestamp);
  assert(KindOf(*row.Find("sequence_number")) == ValueKind::kInt64);
  assert(KindOf(*row.Find("ratio")) == ValueKind::kDouble);
  assert(KindOf(*row.Find("ok")) == ValueKind::kBool);
  assert(KindOf(*row.Find("labels")) == ValueKind::kRaw);
  assert(KindOf(*row.Find("message")) == ValueKind::kString);
}

void TestEventsEncodedAsJsonString() {
  auto page = ParseQueryPage(R"({"events": "[{\"timestamp\": 1}, {\"timestamp\": 2}]"})", "timestamp");
  assert(page.events.size() == 2);
  assert(page.events[1].TimestampMs() == 2);
}

void TestEventsEncodedAsWrappedObjectString() {
  auto page = ParseQueryPage(R"({"events": "{\"events\": [{\"timestamp\": 5}]}"})", "timestamp");
  assert(page.events.size() == 1);
  assert(page.events[0].TimestampMs() == 5);
}

void TestListOfEncodedStrings() {
  auto page = ParseQueryPage(R"({"events": ["{\"timestamp\": 9}", "not json", 42]})", "timestamp");
  assert(page.events.size() == 1);
  assert(page.events[0].TimestampMs() == 9);
  assert(page.malformed_events == 2);
}

void TestInProgressRules() {
  auto running = ParseQueryPage(R"({"links": [{"rel": "Self", "href": "https://x/q/1"}]})", "timestamp");
  assert(running.in_progress);
  assert(running.self_link == std::string("https://x/q/1"));

  auto explicit_done =
      ParseQueryPage(R"({"in_progress": false, "links": [{"rel": "Self", "href": "https://x/q/1"}], "events": []})", "timestamp");
  assert(!explicit_done.in_progress);

  auto next = ParseQueryPage(R"({"events": [], "links": [{"rel": "Next", "href": "https://x/q/2"}]})", "timestamp");
  assert(!next.in_progress);
  assert(next.next_link == std::string("https://x/q/2"));
}

void TestProviderTotal() {
  assert(ParseQueryPage(R"({"events": [], "total_matched": 12})", "timestamp").total_matched == 12);
  assert(ParseQueryPage(R"({"events": [], "statistics": {"count": 34}})", "timestamp").total_matched == 34);
  assert(!ParseQueryPage(R"({"events": []})", "timestamp").total_matched);
}

void TestMalformedBodies() {
  assert(IsProtocolError("not json"));
  assert(IsProtocolError("[1, 2]"));
  assert(IsProtocolError(R"({"links": {"rel": "Next"}})"));
  assert(IsProtocolError(R"({"links": [{"rel": "Self"}]})"));
  assert(IsProtocolError(R"({"links": [{"rel": "Next", "href": ""}]})"));
  assert(IsProtocolError(R"({"events": 17})"));
}

} // namespace

int main() {
  TestListOfObjects();
  TestEventsEncodedAsJsonString();
  TestEventsEncodedAsWrappedObjectString();
  TestListOfEncodedStrings();
  TestInProgressRules();
  TestProviderTotal();
  TestMalformedBodies();

  std::cout << "eventcache_unit_response_parser: pass\n";
  return 0;
}
