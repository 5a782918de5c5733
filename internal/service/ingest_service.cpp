#include "ingest_service.hpp"

#include <arrow/type.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/cache/coverage_planner.hpp"
#include "internal/cache/segment_index.hpp"
#include "internal/client/query_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/summary/dataset_summary.hpp"
#include "internal/util/error_category.hpp"
#include "internal/util/errors.hpp"
#include "internal/writer/column_schema.hpp"
#include "internal/writer/part_writer.hpp"

namespace eventcache::service {

namespace {

void Widen(std::optional<int64_t>* min, std::optional<int64_t>* max, int64_t value) {
  *min = *min ? std::min(**min, value) : value;
  *max = *max ? std::max(**max, value) : value;
}

std::vector<std::string> Directories(const std::vector<cache::Segment>& segments) {
  std::vector<std::string> out;
  out.reserve(segments.size());
  for (const auto& segment : segments) {
    out.push_back(segment.directory);
  }
  return out;
}

void LogProviderDivergence(const IngestRequest& request, const RunCounters& counters, double tolerance) {
  if (!counters.provider_total_matched) return;

  const auto   total = *counters.provider_total_matched;
  const auto   seen  = static_cast<int64_t>(counters.raw_events_seen);
  const double ratio =
      static_cast<double>(std::llabs(total - seen)) / static_cast<double>(std::max<int64_t>(total, 1));
  if (ratio <= tolerance) return;

  EVENTCACHE_LOG_WARN("provider_count_divergence", {observability::StringField("entity_id", request.entity_id),
                                                    observability::IntField("provider_total_matched", total),
                                                    observability::IntField("raw_events_seen", seen),
                                                    observability::DoubleField("divergence_ratio", ratio),
                                                    observability::DoubleField("tolerance", tolerance)});
}

// Pins every column already stored for the entity so this run's parts agree
// with earlier runs' parts. Unreadable parts follow the bypass policy; a
// column stored under incompatible types is always corruption.
void SeedSchema(const cache::SegmentIndex& index, const summary::DatasetSummarizer& summarizer,
                const std::string& entity_id, writer::ColumnSchema* schema) {
  for (const auto& segment : index.ListSegments(entity_id)) {
    std::vector<std::shared_ptr<arrow::Schema>> stored;
    try {
      for (const auto& part : segment.parts) {
        stored.push_back(summarizer.ReadSchema(part.path));
      }
    } catch (const util::CacheCorruptionError& e) {
      if (!index.bypass_on_corruption()) throw;
      EVENTCACHE_LOG_WARN("cache_corruption_bypassed", {observability::StringField("path", segment.directory),
                                                        observability::StringField("reason", e.what())});
      continue;
    }

    for (const auto& part_schema : stored) {
      for (const auto& field : part_schema->fields()) {
        const auto kind = writer::KindFromArrowType(*field->type());
        if (!kind) continue;
        if (!schema->Pin(field->name(), *kind)) {
          throw util::CacheCorruptionError("column " + field->name() + " is stored as " + field->type()->ToString() +
                                           " in " + segment.directory + ", conflicting with earlier parts");
        }
      }
    }
  }

  EVENTCACHE_LOG_DEBUG("schema_seeded", {observability::StringField("entity_id", entity_id),
                                         observability::IntField("columns", static_cast<int64_t>(schema->columns().size()))});
}

} // namespace

IngestService::IngestService(ServiceContext ctx, IngestOptions options) : ctx_(std::move(ctx)), options_(std::move(options)) {
  if (!ctx_.index || !ctx_.client || !ctx_.sink) {
    throw std::invalid_argument("IngestService: index, client and sink are required");
  }
}

RunSummary IngestService::Run(const IngestRequest& request, util::RunContext& ctx) {
  const auto started = std::chrono::steady_clock::now();

  RunCounters                     counters;
  auto                            schema = std::make_shared<writer::ColumnSchema>(options_.timestamp_column);
  std::unordered_set<std::string> seen_keys;
  bool                            all_totals_reported = true;

  std::optional<range::TimeRange> current_range;
  size_t                          current_page = 0;

  cache::CoveragePlan plan;
  RunSummary          run;

  try {
    range::Validate(request.range);
    storage::common::ValidateEntityId(request.entity_id);

    EVENTCACHE_LOG_INFO("run_start", {observability::StringField("entity_id", request.entity_id),
                                      observability::StringField("requested", range::FormatRange(request.range)),
                                      observability::BoolField("dedupe_enabled", request.dedupe_enabled),
                                      observability::IntField("flush_rows", static_cast<int64_t>(request.writer.flush_rows))});

    cache::CoveragePlanner planner(ctx_.index);
    plan = planner.Plan(request.entity_id, request.range);

    summary::DatasetSummarizer summarizer(ctx_.index->filesystem(), options_.timestamp_column,
                                          ctx_.index->bypass_on_corruption());
    if (!plan.missing.empty()) {
      SeedSchema(*ctx_.index, summarizer, request.entity_id, schema.get());
    }

    for (const auto& missing : plan.missing) {
      ctx.ThrowIfCancelled();
      current_range = missing;
      current_page  = 0;

      writer::StreamingWriter writer(ctx_.index->filesystem(), ctx_.index->SegmentDirectory(request.entity_id, missing),
                                     request.writer, ctx_.sink, schema);
      counters.segments_written.push_back(writer.directory());

      auto on_page = [&](const client::QueryPage& page, size_t page_index) {
        current_page = page_index;
        for (const auto& event : page.events) {
          ++counters.raw_events_seen;
          if (auto ts = event.TimestampMs()) {
            Widen(&counters.observed_min_ts_ms, &counters.observed_max_ts_ms, *ts);
          }

          if (request.dedupe_enabled) {
            if (auto key = event.DedupeKey()) {
              if (!seen_keys.insert(*key).second) {
                ++counters.duplicates_dropped;
                continue;
              }
            }
          }

          writer.Append(event);
          ++counters.rows_processed;
        }
      };

      client::QueryRequest query{request.entity_id, missing, request.filter};
      auto                 query_stats = ctx_.client->Execute(query, on_page, ctx);
      auto                 written     = writer.Finalize();

      counters.pages_fetched += query_stats.pages;
      counters.malformed_events += query_stats.malformed_events;
      if (query_stats.total_matched && all_totals_reported) {
        counters.provider_total_matched = counters.provider_total_matched.value_or(0) + *query_stats.total_matched;
      } else {
        all_totals_reported = false;
        counters.provider_total_matched.reset();
      }

      counters.parts_written += written.parts;
      counters.total_bytes_written += written.bytes;
      if (written.part_bytes_min) Widen(&counters.part_bytes_min, &counters.part_bytes_max, *written.part_bytes_min);
      if (written.part_bytes_max) Widen(&counters.part_bytes_min, &counters.part_bytes_max, *written.part_bytes_max);
    }
    current_range.reset();

    auto segments = ctx_.index->Intersecting(request.entity_id, request.range);
    run.summary = summarizer.Summarize(segments);
    run.output_segments = Directories(segments);
  } catch (const std::exception& e) {
    const auto category = util::Categorize(e);
    EVENTCACHE_LOG_ERROR("run_failed",
                         {observability::StringField("entity_id", request.entity_id),
                          observability::StringField("requested", range::FormatRange(request.range)),
                          observability::StringField("sub_range", current_range ? range::FormatRange(*current_range) : ""),
                          observability::IntField("page_index", static_cast<int64_t>(current_page)),
                          observability::StringField("category", util::CategoryName(category)),
                          observability::StringField("error", e.what()),
                          observability::StringField("remediation", util::RemediationHint(e))});
    throw;
  }

  run.entity_id      = request.entity_id;
  run.requested      = request.range;
  run.decision       = std::string(cache::CoverageDecisionName(plan.decision));
  run.missing_ranges = plan.missing;
  run.segments_used  = Directories(plan.segments);

  run.segments_written    = counters.segments_written;
  run.rows_processed      = counters.rows_processed;
  run.raw_events_seen     = counters.raw_events_seen;
  run.duplicates_dropped  = counters.duplicates_dropped;
  run.malformed_events    = counters.malformed_events;
  run.pages_fetched       = counters.pages_fetched;
  run.parts_written       = counters.parts_written;
  run.total_bytes_written = counters.total_bytes_written;
  run.type_conflicts      = schema->type_conflicts();
  run.part_bytes_min      = counters.part_bytes_min;
  run.part_bytes_max      = counters.part_bytes_max;
  run.observed_min_ts_ms  = counters.observed_min_ts_ms;
  run.observed_max_ts_ms  = counters.observed_max_ts_ms;
  run.provider_total_matched = counters.provider_total_matched;
  run.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

  EVENTCACHE_LOG_INFO("reconciliation", {observability::StringField("entity_id", request.entity_id),
                                         observability::IntField("raw_events_seen", static_cast<int64_t>(run.raw_events_seen)),
                                         observability::IntField("rows_processed", static_cast<int64_t>(run.rows_processed)),
                                         observability::IntField("duplicates_dropped", static_cast<int64_t>(run.duplicates_dropped)),
                                         observability::BoolField("consistent", run.raw_events_seen == run.rows_processed + run.duplicates_dropped)});

  LogProviderDivergence(request, counters, options_.divergence_tolerance);

  EVENTCACHE_LOG_INFO("run_summary", {observability::StringField("entity_id", run.entity_id),
                                      observability::StringField("requested", range::FormatRange(run.requested)),
                                      observability::StringField("decision", run.decision),
                                      observability::StringField("missing", range::FormatRanges(run.missing_ranges)),
                                      observability::IntField("segments_used", static_cast<int64_t>(run.segments_used.size())),
                                      observability::IntField("segments_written", static_cast<int64_t>(run.segments_written.size())),
                                      observability::IntField("rows_processed", static_cast<int64_t>(run.rows_processed)),
                                      observability::IntField("raw_events_seen", static_cast<int64_t>(run.raw_events_seen)),
                                      observability::IntField("duplicates_dropped", static_cast<int64_t>(run.duplicates_dropped)),
                                      observability::IntField("pages_fetched", static_cast<int64_t>(run.pages_fetched)),
                                      observability::IntField("parts_written", run.parts_written),
                                      observability::IntField("total_bytes_written", run.total_bytes_written),
                                      observability::IntField("summary_row_count", run.summary.row_count),
                                      observability::IntField("type_conflicts", static_cast<int64_t>(run.type_conflicts)),
                                      observability::IntField("duration_ms", run.duration_ms)});
  return run;
}

} // namespace eventcache::service
