#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/table.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "column_schema.hpp"
#include "internal/model/event_row.hpp"

namespace eventcache::writer {

struct PartStats {
  uint32_t    index = 0;
  std::string path;
  uint64_t    rows  = 0;
  int64_t     bytes = 0;
};

/*
  Destination for flushed buffers. One call writes one complete part.
*/
class PartSink {
 public:
  virtual ~PartSink() = default;

  virtual PartStats WritePart(const std::string& segment_dir, uint32_t index, const std::vector<model::EventRow>& rows,
                              const ColumnSchema& schema) = 0;
};

// Column kind stored as the given Arrow type; nullopt for types parts never contain.
std::optional<model::ValueKind> KindFromArrowType(const arrow::DataType& type);

// Builds an Arrow table over the schema's pinned columns. Missing cells are null.
std::shared_ptr<arrow::Table> BuildTable(const std::vector<model::EventRow>& rows, const ColumnSchema& schema);

/*
  Writes parts as compressed Parquet files.

  Atomic write:
      write part-NNNNN.parquet.tmp -> close -> rename
*/
class ParquetPartWriter final : public PartSink {
 public:
  ParquetPartWriter(std::shared_ptr<arrow::fs::FileSystem> fs, arrow::Compression::type compression);

  PartStats WritePart(const std::string& segment_dir, uint32_t index, const std::vector<model::EventRow>& rows,
                      const ColumnSchema& schema) override;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  arrow::Compression::type               compression_;
};

} // namespace eventcache::writer
