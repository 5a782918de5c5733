#pragma once

#include <arrow/filesystem/filesystem.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "column_schema.hpp"
#include "internal/model/event_row.hpp"
#include "part_writer.hpp"

namespace eventcache::writer {

struct WriterOptions {
  uint64_t flush_rows  = 10000;
  uint64_t flush_bytes = 0; // 0 disables the byte threshold
};

struct SegmentWriteStats {
  std::string directory;

  uint64_t rows               = 0;
  uint32_t parts              = 0;
  int64_t  bytes              = 0;
  uint64_t peak_buffered_rows = 0;

  std::optional<int64_t> part_bytes_min;
  std::optional<int64_t> part_bytes_max;

  std::vector<PartStats> part_files;
};

/*
  Bounded-memory writer for one segment.

  Rows are buffered until flush_rows (or flush_bytes) is reached, then
  written as the next part. The condition is checked after every row, so
  the buffer never holds more than flush_rows rows.
*/
class StreamingWriter {
 public:
  // Proves the segment's parent directory is writable; throws util::WriteError otherwise.
  // The segment directory itself is created by the first flush or by Finalize.
  StreamingWriter(std::shared_ptr<arrow::fs::FileSystem> fs, std::string segment_dir, WriterOptions options,
                  std::shared_ptr<PartSink> sink, std::shared_ptr<ColumnSchema> schema);

  StreamingWriter(const StreamingWriter&)            = delete;
  StreamingWriter& operator=(const StreamingWriter&) = delete;

  void Append(const model::EventRow& row);
  void Append(const std::vector<model::EventRow>& rows);

  // Flushes whatever is buffered, creates the segment directory if no part
  // did, and returns the segment totals. Call once.
  SegmentWriteStats Finalize();

  uint64_t buffered_rows() const {
    return buffer_.size();
  }

  const std::string& directory() const {
    return segment_dir_;
  }

 private:
  void Flush();
  void EnsureDirectory();

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            segment_dir_;
  WriterOptions                          options_;
  std::shared_ptr<PartSink>              sink_;
  std::shared_ptr<ColumnSchema>          schema_;

  std::vector<model::EventRow> buffer_;
  uint64_t                     buffered_bytes_ = 0;

  SegmentWriteStats stats_;
  bool              finalized_         = false;
  bool              directory_created_ = false;
};

} // namespace eventcache::writer
