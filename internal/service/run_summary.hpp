#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/range/time_range.hpp"
#include "internal/summary/dataset_summary.hpp"

namespace eventcache::service {

/*
  Mutable tallies for one run. Owned by the run, never shared between runs.
*/
struct RunCounters {
  uint64_t raw_events_seen    = 0;
  uint64_t rows_processed     = 0;
  uint64_t duplicates_dropped = 0;
  uint64_t malformed_events   = 0;
  uint64_t pages_fetched      = 0;
  uint32_t parts_written      = 0;
  int64_t  total_bytes_written = 0;

  std::optional<int64_t> part_bytes_min;
  std::optional<int64_t> part_bytes_max;
  std::optional<int64_t> observed_min_ts_ms;
  std::optional<int64_t> observed_max_ts_ms;

  // Sum of provider totals; unset unless every fetched sub-range reported one.
  std::optional<int64_t> provider_total_matched;

  std::vector<std::string> segments_written;
};

struct RunSummary {
  std::string      entity_id;
  range::TimeRange requested;
  std::string      decision;
  range::RangeList missing_ranges;

  std::vector<std::string> output_segments;
  std::vector<std::string> segments_used;
  std::vector<std::string> segments_written;

  uint64_t rows_processed      = 0;
  uint64_t raw_events_seen     = 0;
  uint64_t duplicates_dropped  = 0;
  uint64_t malformed_events    = 0;
  uint64_t pages_fetched       = 0;
  uint32_t parts_written       = 0;
  int64_t  total_bytes_written = 0;
  uint64_t type_conflicts      = 0;

  std::optional<int64_t> part_bytes_min;
  std::optional<int64_t> part_bytes_max;
  std::optional<int64_t> observed_min_ts_ms;
  std::optional<int64_t> observed_max_ts_ms;
  std::optional<int64_t> provider_total_matched;

  summary::DatasetSummary summary;

  int64_t duration_ms = 0;
};

// Pretty-printed JSON rendering for the command line.
std::string RunSummaryToJson(const RunSummary& run);

} // namespace eventcache::service
