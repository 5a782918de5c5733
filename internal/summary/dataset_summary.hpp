#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/type_fwd.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/segment.hpp"

namespace eventcache::summary {

struct PartSummary {
  std::string path;
  int64_t     rows  = 0;
  int64_t     bytes = 0;

  // Column name -> Arrow type name ("int64", "string", "timestamp[ms]", ...).
  std::map<std::string, std::string> columns;

  std::optional<int64_t> timestamp_min;
  std::optional<int64_t> timestamp_max;

  // True when min/max came from a column read rather than footer statistics.
  bool read_timestamp_column = false;
};

struct DatasetSummary {
  int64_t  row_count   = 0;
  uint32_t part_count  = 0;
  int64_t  total_bytes = 0;

  uint32_t                 segments_summarized = 0;
  std::vector<std::string> skipped_segments;

  std::map<std::string, std::string> columns;

  std::optional<int64_t> timestamp_min;
  std::optional<int64_t> timestamp_max;
};

/*
  Footer-level summary of a set of segments.

  Row counts and schemas come from Parquet metadata; timestamp bounds from
  column-chunk statistics, falling back to reading only the timestamp column
  when a chunk carries none. Column types across parts are unioned (int64
  widens to double, null yields to anything); any other disagreement is a
  util::CacheCorruptionError. An unreadable part is fatal unless
  bypass_on_corruption is set, in which case its segment is skipped.
*/
class DatasetSummarizer {
 public:
  DatasetSummarizer(std::shared_ptr<arrow::fs::FileSystem> fs, std::string timestamp_column, bool bypass_on_corruption);

  DatasetSummary Summarize(const std::vector<cache::Segment>& segments) const;

  PartSummary SummarizePart(const std::string& path) const;

  // Arrow schema stored in a part's footer; util::CacheCorruptionError when unreadable.
  std::shared_ptr<arrow::Schema> ReadSchema(const std::string& path) const;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            timestamp_column_;
  bool                                   bypass_on_corruption_;
};

} // namespace eventcache::summary
