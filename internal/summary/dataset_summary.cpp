#include "dataset_summary.hpp"

#include <arrow/array.h>
#include <arrow/chunked_array.h>
#include <arrow/io/interfaces.h>
#include <arrow/type.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>
#include <parquet/statistics.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace eventcache::summary {

using namespace eventcache::storage::common;

namespace {

void Widen(std::optional<int64_t>* min, std::optional<int64_t>* max, int64_t value) {
  *min = *min ? std::min(**min, value) : value;
  *max = *max ? std::max(**max, value) : value;
}

template <typename ArrayType>
void WidenFromArray(const ArrayType& values, PartSummary* part) {
  for (int64_t i = 0; i < values.length(); ++i) {
    if (values.IsNull(i)) continue;
    Widen(&part->timestamp_min, &part->timestamp_max, values.Value(i));
  }
}

bool IsMillisTimestamp(const arrow::DataType& type) {
  if (type.id() == arrow::Type::INT64) return true;
  if (type.id() != arrow::Type::TIMESTAMP) return false;
  return static_cast<const arrow::TimestampType&>(type).unit() == arrow::TimeUnit::MILLI;
}

// int64 and double merge to double; null yields to anything.
std::optional<std::string> UnionType(const std::string& a, const std::string& b) {
  if (a == b) return a;
  if (a == "null") return b;
  if (b == "null") return a;
  if ((a == "int64" && b == "double") || (a == "double" && b == "int64")) return std::string("double");
  return std::nullopt;
}

void MergeColumns(std::map<std::string, std::string>* into, const PartSummary& part) {
  for (const auto& [name, type] : part.columns) {
    auto it = into->find(name);
    if (it == into->end()) {
      into->emplace(name, type);
      continue;
    }
    auto merged = UnionType(it->second, type);
    if (!merged) {
      throw util::CacheCorruptionError("column " + name + " has conflicting types " + it->second + " and " + type +
                                       " (in " + part.path + ")");
    }
    it->second = *merged;
  }
}

} // namespace

DatasetSummarizer::DatasetSummarizer(std::shared_ptr<arrow::fs::FileSystem> fs, std::string timestamp_column,
                                     bool bypass_on_corruption)
    : fs_(std::move(fs)), timestamp_column_(std::move(timestamp_column)), bypass_on_corruption_(bypass_on_corruption) {
}

PartSummary DatasetSummarizer::SummarizePart(const std::string& path) const {
  const auto context = "read part " + path;

  auto input = Unwrap<util::CacheCorruptionError>(fs_->OpenInputFile(path), context);

  parquet::arrow::FileReaderBuilder builder;
  Unwrap<util::CacheCorruptionError>(builder.Open(input), context);

  std::unique_ptr<parquet::arrow::FileReader> reader;
  Unwrap<util::CacheCorruptionError>(builder.Build(&reader), context);

  std::shared_ptr<arrow::Schema> schema;
  Unwrap<util::CacheCorruptionError>(reader->GetSchema(&schema), context);

  auto metadata = reader->parquet_reader()->metadata();

  PartSummary part;
  part.path  = path;
  part.rows  = metadata->num_rows();
  part.bytes = Unwrap<util::CacheCorruptionError>(input->GetSize(), context);
  for (const auto& field : schema->fields()) {
    part.columns[field->name()] = field->type()->ToString();
  }

  const int field_index = schema->GetFieldIndex(timestamp_column_);
  if (field_index < 0 || part.rows == 0 || !IsMillisTimestamp(*schema->field(field_index)->type())) {
    return part;
  }

  // Footer statistics first.
  const int column_index  = metadata->schema()->ColumnIndex(timestamp_column_);
  bool      need_fallback = column_index < 0;
  for (int rg = 0; !need_fallback && rg < metadata->num_row_groups(); ++rg) {
    auto row_group = metadata->RowGroup(rg);
    auto chunk     = row_group->ColumnChunk(column_index);
    auto stats     = chunk->statistics();

    if (!stats || stats->physical_type() != parquet::Type::INT64) {
      need_fallback = true;
      break;
    }
    if (!stats->HasMinMax()) {
      // An all-null chunk has no bounds to contribute.
      if (stats->HasNullCount() && stats->null_count() == row_group->num_rows()) continue;
      need_fallback = true;
      break;
    }

    auto typed = std::static_pointer_cast<parquet::Int64Statistics>(stats);
    Widen(&part.timestamp_min, &part.timestamp_max, typed->min());
    Widen(&part.timestamp_min, &part.timestamp_max, typed->max());
  }

  if (!need_fallback) {
    return part;
  }

  // Bounded read of the single timestamp column.
  part.timestamp_min.reset();
  part.timestamp_max.reset();
  part.read_timestamp_column = true;

  std::shared_ptr<arrow::ChunkedArray> column;
  Unwrap<util::CacheCorruptionError>(reader->ReadColumn(field_index, &column), context);

  for (const auto& chunk : column->chunks()) {
    if (chunk->type_id() == arrow::Type::TIMESTAMP) {
      WidenFromArray(static_cast<const arrow::TimestampArray&>(*chunk), &part);
    } else {
      WidenFromArray(static_cast<const arrow::Int64Array&>(*chunk), &part);
    }
  }
  return part;
}

std::shared_ptr<arrow::Schema> DatasetSummarizer::ReadSchema(const std::string& path) const {
  const auto context = "read schema " + path;

  auto input = Unwrap<util::CacheCorruptionError>(fs_->OpenInputFile(path), context);

  parquet::arrow::FileReaderBuilder builder;
  Unwrap<util::CacheCorruptionError>(builder.Open(input), context);

  std::unique_ptr<parquet::arrow::FileReader> reader;
  Unwrap<util::CacheCorruptionError>(builder.Build(&reader), context);

  std::shared_ptr<arrow::Schema> schema;
  Unwrap<util::CacheCorruptionError>(reader->GetSchema(&schema), context);
  return schema;
}

DatasetSummary DatasetSummarizer::Summarize(const std::vector<cache::Segment>& segments) const {
  DatasetSummary summary;

  for (const auto& segment : segments) {
    std::vector<PartSummary> parts;
    try {
      for (const auto& file : segment.parts) {
        parts.push_back(SummarizePart(file.path));
      }
    } catch (const util::CacheCorruptionError& e) {
      if (!bypass_on_corruption_) throw;
      EVENTCACHE_LOG_WARN("cache_corruption_bypassed", {observability::StringField("path", segment.directory),
                                                        observability::StringField("reason", e.what())});
      summary.skipped_segments.push_back(segment.directory);
      continue;
    }

    for (const auto& part : parts) {
      MergeColumns(&summary.columns, part);
      summary.row_count += part.rows;
      summary.total_bytes += part.bytes;
      summary.part_count += 1;
      if (part.timestamp_min) Widen(&summary.timestamp_min, &summary.timestamp_max, *part.timestamp_min);
      if (part.timestamp_max) Widen(&summary.timestamp_min, &summary.timestamp_max, *part.timestamp_max);
    }
    summary.segments_summarized += 1;
  }

  return summary;
}

} // namespace eventcache::summary
