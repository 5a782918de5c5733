#include "part_writer.hpp"

#include <arrow/builder.h>
#include <arrow/io/interfaces.h>
#include <arrow/memory_pool.h>
#include <arrow/type.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <algorithm>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace eventcache::writer {

using namespace eventcache::storage::common;
using model::ValueKind;

namespace {

std::shared_ptr<arrow::DataType> ArrowType(ValueKind kind) {
  switch (kind) {
    case ValueKind::kInt64:
      return arrow::int64();
    case ValueKind::kDouble:
      return arrow::float64();
    case ValueKind::kBool:
      return arrow::boolean();
    case ValueKind::kTimestamp:
      return arrow::timestamp(arrow::TimeUnit::MILLI);
    case ValueKind::kString:
    case ValueKind::kRaw:
    case ValueKind::kNull:
    default:
      return arrow::utf8();
  }
}

arrow::Status AppendCell(arrow::ArrayBuilder* builder, ValueKind kind, const model::Value* value) {
  if (!value || model::KindOf(*value) == ValueKind::kNull) {
    return builder->AppendNull();
  }

  switch (kind) {
    case ValueKind::kInt64:
      return static_cast<arrow::Int64Builder*>(builder)->Append(std::get<int64_t>(*value));
    case ValueKind::kDouble:
      return static_cast<arrow::DoubleBuilder*>(builder)->Append(std::get<double>(*value));
    case ValueKind::kBool:
      return static_cast<arrow::BooleanBuilder*>(builder)->Append(std::get<bool>(*value));
    case ValueKind::kTimestamp:
      return static_cast<arrow::TimestampBuilder*>(builder)->Append(std::get<model::Timestamp>(*value).millis);
    case ValueKind::kString:
    case ValueKind::kRaw:
      return static_cast<arrow::StringBuilder*>(builder)->Append(model::ValueToString(*value));
    default:
      return arrow::Status::Invalid("unsupported column kind");
  }
}

} // namespace

std::optional<model::ValueKind> KindFromArrowType(const arrow::DataType& type) {
  switch (type.id()) {
    case arrow::Type::INT64:
      return ValueKind::kInt64;
    case arrow::Type::DOUBLE:
      return ValueKind::kDouble;
    case arrow::Type::BOOL:
      return ValueKind::kBool;
    case arrow::Type::TIMESTAMP:
      return ValueKind::kTimestamp;
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return ValueKind::kString;
    default:
      return std::nullopt;
  }
}

std::shared_ptr<arrow::Table> BuildTable(const std::vector<model::EventRow>& rows, const ColumnSchema& schema) {
  arrow::FieldVector                         fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;

  for (const auto& [column, kind] : schema.columns()) {
    auto type = ArrowType(kind);

    auto builder = Unwrap<util::WriteError>(arrow::MakeBuilder(type, arrow::default_memory_pool()), "builder for " + column);
    Unwrap<util::WriteError>(builder->Reserve(static_cast<int64_t>(rows.size())));

    for (const auto& row : rows) {
      Unwrap<util::WriteError>(AppendCell(builder.get(), kind, row.Find(column)), "column " + column);
    }

    std::shared_ptr<arrow::Array> array;
    Unwrap<util::WriteError>(builder->Finish(&array), "finish column " + column);

    fields.push_back(arrow::field(column, type, /*nullable=*/true));
    arrays.push_back(std::move(array));
  }

  return arrow::Table::Make(arrow::schema(fields), arrays, static_cast<int64_t>(rows.size()));
}

ParquetPartWriter::ParquetPartWriter(std::shared_ptr<arrow::fs::FileSystem> fs, arrow::Compression::type compression)
    : fs_(std::move(fs)), compression_(compression) {
}

PartStats ParquetPartWriter::WritePart(const std::string& segment_dir, uint32_t index,
                                       const std::vector<model::EventRow>& rows, const ColumnSchema& schema) {
  const auto final_path = JoinPath(segment_dir, PartFileName(index));
  const auto tmp_path   = final_path + std::string(kTempSuffix);

  auto table = BuildTable(rows, schema);

  auto properties = parquet::WriterProperties::Builder().compression(compression_)->enable_statistics()->build();
  auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();

  {
    auto out = Unwrap<util::WriteError>(fs_->OpenOutputStream(tmp_path), "open " + tmp_path);
    Unwrap<util::WriteError>(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), out,
                                                        std::max<int64_t>(1, table->num_rows()), properties,
                                                        arrow_properties),
                             "write " + tmp_path);
    Unwrap<util::WriteError>(out->Close(), "close " + tmp_path);
  }

  Unwrap<util::WriteError>(fs_->Move(tmp_path, final_path), "rename " + tmp_path);

  auto info = Unwrap<util::WriteError>(fs_->GetFileInfo(final_path), "stat " + final_path);

  PartStats stats;
  stats.index = index;
  stats.path  = final_path;
  stats.rows  = rows.size();
  stats.bytes = info.size();
  return stats;
}

} // namespace eventcache::writer
