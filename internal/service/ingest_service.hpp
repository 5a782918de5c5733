#pragma once

#include <string>

#include "internal/range/time_range.hpp"
#include "internal/util/run_context.hpp"
#include "internal/writer/streaming_writer.hpp"
#include "run_summary.hpp"
#include "service_context.hpp"

namespace eventcache::service {

struct IngestRequest {
  std::string      entity_id;
  range::TimeRange range;
  std::string      filter;

  writer::WriterOptions writer;
  bool                  dedupe_enabled = true;
};

struct IngestOptions {
  std::string timestamp_column = "timestamp";

  // Relative gap between provider total and raw events that triggers a warning.
  double divergence_tolerance = 0.01;
};

/*
  Fetch orchestrator.

      plan -> for each missing sub-range: fetch + stream-write a new segment
           -> summarize every segment intersecting the request
           -> run_summary event

  A failing sub-range aborts the run. Parts already flushed stay on disk and
  the original error propagates after one run_failed event.
*/
class IngestService {
 public:
  IngestService(ServiceContext ctx, IngestOptions options);

  RunSummary Run(const IngestRequest& request, util::RunContext& ctx);

 private:
  ServiceContext ctx_;
  IngestOptions  options_;
};

} // namespace eventcache::service
