#include "internal/service/ingest_service.hpp"

#include <arrow/util/compression.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/segment_index.hpp"
#include "internal/client/query_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/writer/part_writer.hpp"

namespace {

using eventcache::client::HttpRequest;
using eventcache::client::HttpResponse;
using eventcache::client::HttpTransport;
using eventcache::client::QueryClient;
using eventcache::client::QueryClientOptions;
using eventcache::range::RangeList;
using eventcache::range::TimeRange;
using eventcache::service::IngestOptions;
using eventcache::service::IngestRequest;
using eventcache::service::IngestService;
using eventcache::service::RunSummary;
using eventcache::service::ServiceContext;
using eventcache::util::RunContext;

class FakeTransport final : public HttpTransport {
 public:
  using Responder = std::function<HttpResponse(const HttpRequest&, size_t call)>;

  explicit FakeTransport(Responder responder) : responder_(std::move(responder)) {
  }

  HttpResponse Get(const HttpRequest& request) override {
    requests.push_back(request);
    return responder_(request, requests.size() - 1);
  }

  void SetResponder(Responder responder) {
    responder_ = std::move(responder);
  }

  std::vector<HttpRequest> requests;

 private:
  Responder responder_;
};

class NoSleep final : public eventcache::util::Sleeper {
 public:
  void Sleep(std::chrono::milliseconds, RunContext& ctx) override {
    ctx.ThrowIfCancelled();
  }
};

std::string Param(const HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.query_params) {
    if (key == name) return value;
  }
  return {};
}

HttpResponse Ok(const std::string& body) {
  HttpResponse response;
  response.status = 200;
  response.body   = body;
  return response;
}

std::string Event(int64_t ts, int64_t sequence) {
  return R"({"timestamp": )" + std::to_string(ts) + R"(, "log_id": "L1", "sequence_number": )" + std::to_string(sequence) +
         R"(, "message": "event )" + std::to_string(ts) + R"("})";
}

// One event every 10ms inside the requested window, all on a single page.
HttpResponse RangeProvider(const HttpRequest& request, size_t) {
  const int64_t from = std::stoll(Param(request, "from"));
  const int64_t to   = std::stoll(Param(request, "to"));

  std::string events;
  int64_t     count = 0;
  for (int64_t ts = (from + 9) / 10 * 10; ts < to; ts += 10) {
    if (count++ > 0) events += ",";
    events += Event(ts, ts);
  }
  return Ok(R"({"events": [)" + events + R"(], "total_matched": )" + std::to_string(count) + "}");
}

HttpResponse NotFound(const HttpRequest&, size_t) {
  HttpResponse response;
  response.status = 404;
  response.body   = R"({"error": "no such entity"})";
  return response;
}

// Routes log events into a ring buffer formatted as "<level> <event> <fields>".
class LogCapture {
 public:
  LogCapture() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(512)), previous_(spdlog::default_logger()) {
    auto logger = std::make_shared<spdlog::logger>("capture", sink_);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(std::move(logger));
  }

  ~LogCapture() {
    spdlog::set_default_logger(previous_);
  }

  size_t Count(const std::string& level, const std::string& event = "") {
    size_t count = 0;
    for (const auto& line : sink_->last_formatted()) {
      if (line.rfind(level + " ", 0) != 0) continue;
      if (event.empty() || line.rfind(level + " " + event + " ", 0) == 0) ++count;
    }
    return count;
  }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
  std::shared_ptr<spdlog::logger>                    previous_;
};

struct Harness {
  explicit Harness(const std::string& test_name, FakeTransport::Responder responder = RangeProvider) {
    const auto root = std::filesystem::temp_directory_path() / "eventcache_ingest_service_tests" / test_name;
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    transport = std::make_shared<FakeTransport>(std::move(responder));

    QueryClientOptions options;
    options.endpoint = "https://logs.example.test";
    options.api_key  = "secret";

    ServiceContext ctx;
    ctx.index  = eventcache::cache::SegmentIndex::Open(root.string(), false);
    ctx.client = std::make_shared<QueryClient>(options, transport, std::make_shared<NoSleep>());
    ctx.sink   = std::make_shared<eventcache::writer::ParquetPartWriter>(ctx.index->filesystem(), arrow::Compression::UNCOMPRESSED);
    index      = ctx.index;

    service = std::make_unique<IngestService>(ctx, IngestOptions{});
  }

  RunSummary Run(const TimeRange& range, RunContext& ctx, bool dedupe = true) {
    IngestRequest request;
    request.entity_id      = "svc";
    request.range          = range;
    request.writer         = eventcache::writer::WriterOptions{4, 0};
    request.dedupe_enabled = dedupe;
    return service->Run(request, ctx);
  }

  RunSummary Run(const TimeRange& range, bool dedupe = true) {
    RunContext ctx;
    return Run(range, ctx, dedupe);
  }

  std::shared_ptr<FakeTransport>                   transport;
  std::shared_ptr<eventcache::cache::SegmentIndex> index;
  std::unique_ptr<IngestService>                   service;
};

void TestMissFetchesAndWrites() {
  Harness h("miss");
  auto    run = h.Run(TimeRange{0, 100});

  assert(run.decision == "miss");
  assert((run.missing_ranges == RangeList{{0, 100}}));
  assert(run.segments_used.empty());
  assert(run.segments_written.size() == 1);
  assert(run.segments_written[0] == h.index->SegmentDirectory("svc", TimeRange{0, 100}));
  assert(run.output_segments == run.segments_written);

  assert(h.transport->requests.size() == 1);
  assert(run.raw_events_seen == 10);
  assert(run.rows_processed == 10);
  assert(run.duplicates_dropped == 0);
  assert(run.pages_fetched == 1);
  assert(run.parts_written == 3);
  assert(run.total_bytes_written > 0);
  assert(run.observed_min_ts_ms == 0);
  assert(run.observed_max_ts_ms == 90);
  assert(run.provider_total_matched == 10);

  assert(run.summary.row_count == 10);
  assert(run.summary.part_count == 3);
  assert(run.summary.timestamp_min == 0);
  assert(run.summary.timestamp_max == 90);
  assert(run.summary.total_bytes == run.total_bytes_written);

  auto json = eventcache::service::RunSummaryToJson(run);
  assert(json.find("\"decision\": \"miss\"") != std::string::npos);
}

void TestRerunIsServedFromCache() {
  Harness h("rerun");
  (void)h.Run(TimeRange{0, 100});
  const auto calls = h.transport->requests.size();

  auto run = h.Run(TimeRange{0, 100});
  assert(h.transport->requests.size() == calls);
  assert(run.decision == "hit");
  assert(run.missing_ranges.empty());
  assert(run.segments_written.empty());
  assert(run.segments_used.size() == 1);
  assert(run.rows_processed == 0);
  assert(run.summary.row_count == 10);

  auto inner = h.Run(TimeRange{20, 40});
  assert(h.transport->requests.size() == calls);
  assert(inner.decision == "hit");
  assert(inner.summary.row_count == 10);
}

void TestPartialFetchesOnlyTheGap() {
  Harness h("partial");
  (void)h.Run(TimeRange{0, 30});
  (void)h.Run(TimeRange{70, 100});
  assert(h.transport->requests.size() == 2);

  auto run = h.Run(TimeRange{0, 100});
  assert(run.decision == "partial");
  assert((run.missing_ranges == RangeList{{30, 70}}));
  assert(h.transport->requests.size() == 3);

  const auto& request = h.transport->requests.back();
  assert(Param(request, "from") == "30");
  assert(Param(request, "to") == "70");

  assert(run.rows_processed == 4);
  assert(run.segments_used.size() == 2);
  assert(run.output_segments.size() == 3);
  assert(run.summary.row_count == 10);
  assert(run.summary.timestamp_min == 0);
  assert(run.summary.timestamp_max == 90);
}

void TestInvalidRangeMakesNoCalls() {
  Harness h("invalid_range");

  bool threw = false;
  try {
    (void)h.Run(TimeRange{100, 100});
  } catch (const eventcache::util::InvalidRangeError&) {
    threw = true;
  }
  assert(threw);
  assert(h.transport->requests.empty());
}

void TestClientErrorPropagates() {
  Harness    h("not_found", NotFound);
  LogCapture logs;

  long status = 0;
  try {
    (void)h.Run(TimeRange{0, 100});
  } catch (const eventcache::util::ProtocolError& e) {
    status = e.http_status();
  }
  assert(status == 404);
  assert(h.transport->requests.size() == 1);

  // One ERROR event per failed run; the client reports the status as a warning.
  assert(logs.Count("warning", "http_error") == 1);
  assert(logs.Count("error") == 1);
  assert(logs.Count("error", "run_failed") == 1);
}

void TestInvalidRangeReportsRunFailed() {
  Harness    h("invalid_range_logged");
  LogCapture logs;

  bool threw = false;
  try {
    (void)h.Run(TimeRange{50, 10});
  } catch (const eventcache::util::InvalidRangeError&) {
    threw = true;
  }
  assert(threw);
  assert(logs.Count("error") == 1);
  assert(logs.Count("error", "run_failed") == 1);
  assert(logs.Count("info", "run_start") == 0);
}

void TestFailedFetchLeavesRangeMissing() {
  Harness h("failed_fetch_rerun", NotFound);

  bool threw = false;
  try {
    (void)h.Run(TimeRange{0, 100});
  } catch (const eventcache::util::ProtocolError&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(h.index->SegmentDirectory("svc", TimeRange{0, 100})));
  assert(h.index->ListSegments("svc").empty());

  h.transport->SetResponder(RangeProvider);
  const auto calls = h.transport->requests.size();

  auto run = h.Run(TimeRange{0, 100});
  assert(run.decision == "miss");
  assert((run.missing_ranges == RangeList{{0, 100}}));
  assert(h.transport->requests.size() == calls + 1);
  assert(run.rows_processed == 10);
  assert(run.summary.row_count == 10);
}

// First page of [0,30) flushes one full part, the continuation fails.
HttpResponse FailAfterFirstPage(const HttpRequest& request, size_t call) {
  if (request.url.find("/continue/") != std::string::npos) {
    return NotFound(request, call);
  }
  return Ok(R"({"events": [)" + Event(0, 1000) + "," + Event(5, 1005) + "," + Event(10, 1010) + "," + Event(15, 1015) +
            R"(], "links": [{"rel": "next", "href": "https://logs.example.test/continue/1"}]})");
}

void TestFlushedPartsSurviveAFailedRun() {
  Harness h("mid_run_failure");
  (void)h.Run(TimeRange{30, 70});

  h.transport->SetResponder(FailAfterFirstPage);
  bool threw = false;
  try {
    (void)h.Run(TimeRange{0, 100});
  } catch (const eventcache::util::ProtocolError&) {
    threw = true;
  }
  assert(threw);

  // [0,30) has a flushed part; [70,100) was never started.
  const auto segments = h.index->ListSegments("svc");
  assert(segments.size() == 2);
  assert(!std::filesystem::exists(h.index->SegmentDirectory("svc", TimeRange{70, 100})));

  h.transport->SetResponder(RangeProvider);
  const auto calls = h.transport->requests.size();

  auto run = h.Run(TimeRange{0, 100});
  assert(run.decision == "partial");
  assert((run.missing_ranges == RangeList{{70, 100}}));
  assert(h.transport->requests.size() == calls + 1);
  assert(Param(h.transport->requests.back(), "from") == "70");
  assert(Param(h.transport->requests.back(), "to") == "100");
  assert(run.segments_used.size() == 2);
  assert(run.rows_processed == 3);
  assert(run.summary.row_count == 11);
  assert(run.summary.timestamp_min == 0);
  assert(run.summary.timestamp_max == 90);
}

void TestCancellationPropagates() {
  RunContext ctx;
  Harness    h("cancelled", [&ctx](const HttpRequest&, size_t) {
    ctx.Cancel("stopped by operator");
    return Ok(R"({"in_progress": true, "links": [{"rel": "Self", "href": "https://logs.example.test/query/q1"}]})");
  });

  {
    LogCapture logs;
    bool       cancelled = false;
    try {
      (void)h.Run(TimeRange{0, 100}, ctx);
    } catch (const eventcache::util::CancelledError&) {
      cancelled = true;
    }
    assert(cancelled);
    assert(h.transport->requests.size() == 1);
    assert(logs.Count("error") == 1);
    assert(logs.Count("error", "run_failed") == 1);
  }

  h.transport->SetResponder(RangeProvider);
  auto run = h.Run(TimeRange{0, 100});
  assert(run.decision == "miss");
  assert(run.summary.row_count == 10);
}

// "status" is numeric below 50ms and textual from 50ms on.
HttpResponse StatusProvider(const HttpRequest& request, size_t) {
  const int64_t from = std::stoll(Param(request, "from"));
  const int64_t to   = std::stoll(Param(request, "to"));

  std::string events;
  for (int64_t ts = (from + 9) / 10 * 10; ts < to; ts += 10) {
    if (!events.empty()) events += ",";
    const std::string status = ts < 50 ? std::to_string(200 + ts) : R"("ok")";
    events += R"({"timestamp": )" + std::to_string(ts) + R"(, "log_id": "L1", "sequence_number": )" +
              std::to_string(ts) + R"(, "status": )" + status + "}";
  }
  return Ok(R"({"events": [)" + events + "]}");
}

void TestColumnTypesCarryAcrossRuns() {
  Harness h("schema_across_runs", StatusProvider);

  auto first = h.Run(TimeRange{0, 50});
  assert(first.type_conflicts == 0);
  assert(first.summary.columns.at("status") == "int64");

  // The stored int64 column wins over this run's first textual value.
  auto second = h.Run(TimeRange{50, 100});
  assert(second.rows_processed == 5);
  assert(second.type_conflicts == 5);
  assert(second.summary.columns.at("status") == "int64");

  const auto calls = h.transport->requests.size();
  auto       whole = h.Run(TimeRange{0, 100});
  assert(whole.decision == "hit");
  assert(h.transport->requests.size() == calls);
  assert(whole.summary.row_count == 10);
  assert(whole.summary.columns.at("status") == "int64");
}

HttpResponse TwoPagesWithRepeat(const HttpRequest&, size_t call) {
  if (call == 0) {
    return Ok(R"({"events": [)" + Event(5, 1) +
              R"(], "links": [{"rel": "next", "href": "https://logs.example.test/continue/1"}]})");
  }
  return Ok(R"({"events": [)" + Event(5, 1) + "," + Event(6, 2) + "]}");
}

void TestDuplicatesAcrossPagesAreDropped() {
  Harness h("dedupe", TwoPagesWithRepeat);
  auto    run = h.Run(TimeRange{0, 100});

  assert(h.transport->requests.size() == 2);
  assert(h.transport->requests[1].url == "https://logs.example.test/continue/1");
  assert(h.transport->requests[1].query_params.empty());
  assert(run.pages_fetched == 2);
  assert(run.raw_events_seen == 3);
  assert(run.duplicates_dropped == 1);
  assert(run.rows_processed == 2);
  assert(run.summary.row_count == 2);
  assert(!run.provider_total_matched);
}

void TestDedupeCanBeDisabled() {
  Harness h("no_dedupe", TwoPagesWithRepeat);
  auto    run = h.Run(TimeRange{0, 100}, /*dedupe=*/false);

  assert(run.raw_events_seen == 3);
  assert(run.duplicates_dropped == 0);
  assert(run.rows_processed == 3);
  assert(run.summary.row_count == 3);
}

} // namespace

int main() {
  TestMissFetchesAndWrites();
  TestRerunIsServedFromCache();
  TestPartialFetchesOnlyTheGap();
  TestInvalidRangeMakesNoCalls();
  TestClientErrorPropagates();
  TestInvalidRangeReportsRunFailed();
  TestFailedFetchLeavesRangeMissing();
  TestFlushedPartsSurviveAFailedRun();
  TestCancellationPropagates();
  TestColumnTypesCarryAcrossRuns();
  TestDuplicatesAcrossPagesAreDropped();
  TestDedupeCanBeDisabled();

  std::cout << "eventcache_unit_ingest_service: pass\n";
  return 0;
}
