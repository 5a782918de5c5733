#include "streaming_writer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace eventcache::writer {

using namespace eventcache::storage::common;

namespace {

constexpr std::string_view kMarkerPrefix = ".write-check-";

std::string BaseName(const std::string& path) {
  const auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

StreamingWriter::StreamingWriter(std::shared_ptr<arrow::fs::FileSystem> fs, std::string segment_dir, WriterOptions options,
                                 std::shared_ptr<PartSink> sink, std::shared_ptr<ColumnSchema> schema)
    : fs_(std::move(fs)),
      segment_dir_(std::move(segment_dir)),
      options_(options),
      sink_(std::move(sink)),
      schema_(std::move(schema)) {
  if (!fs_ || !sink_ || !schema_) {
    throw std::invalid_argument("StreamingWriter: filesystem, sink and schema are required");
  }
  if (options_.flush_rows == 0) {
    throw std::invalid_argument("StreamingWriter: flush_rows must be positive");
  }

  // Only the parent is created here. The segment directory appears with its
  // first part (or at Finalize), so a fetch that fails before flushing leaves
  // no segment behind and the range stays missing.
  const auto parent = ParentPath(segment_dir_);
  if (parent.empty()) {
    throw util::WriteError("segment directory has no parent: " + segment_dir_);
  }
  Unwrap<util::WriteError>(fs_->CreateDir(parent, /*recursive=*/true), "create " + parent);

  // Fail before the first row rather than at the first flush.
  const auto marker = JoinPath(parent, std::string(kMarkerPrefix) + BaseName(segment_dir_));
  {
    auto out = Unwrap<util::WriteError>(fs_->OpenOutputStream(marker), "segment not writable " + segment_dir_);
    Unwrap<util::WriteError>(out->Write("ok", 2), "segment not writable " + segment_dir_);
    Unwrap<util::WriteError>(out->Close(), "segment not writable " + segment_dir_);
  }
  Unwrap<util::WriteError>(fs_->DeleteFile(marker), "remove " + marker);

  stats_.directory = segment_dir_;
  buffer_.reserve(static_cast<size_t>(std::min<uint64_t>(options_.flush_rows, 65536)));
}

void StreamingWriter::Append(const model::EventRow& row) {
  if (finalized_) {
    throw std::logic_error("StreamingWriter: append after finalize");
  }

  buffer_.push_back(schema_->Admit(row));
  buffered_bytes_ += buffer_.back().EstimatedBytes();
  stats_.peak_buffered_rows = std::max<uint64_t>(stats_.peak_buffered_rows, buffer_.size());

  if (buffer_.size() >= options_.flush_rows || (options_.flush_bytes > 0 && buffered_bytes_ >= options_.flush_bytes)) {
    Flush();
  }
}

void StreamingWriter::Append(const std::vector<model::EventRow>& rows) {
  for (const auto& row : rows) {
    Append(row);
  }
}

SegmentWriteStats StreamingWriter::Finalize() {
  if (finalized_) {
    throw std::logic_error("StreamingWriter: finalize called twice");
  }
  if (!buffer_.empty()) {
    Flush();
  }
  // A completed fetch with no rows still covers its range.
  EnsureDirectory();
  finalized_ = true;

  EVENTCACHE_LOG_INFO("segment_finalized", {observability::StringField("segment_dir", segment_dir_),
                                            observability::IntField("rows", static_cast<int64_t>(stats_.rows)),
                                            observability::IntField("parts", stats_.parts),
                                            observability::IntField("bytes", stats_.bytes)});
  return stats_;
}

void StreamingWriter::EnsureDirectory() {
  if (directory_created_) return;
  Unwrap<util::WriteError>(fs_->CreateDir(segment_dir_, /*recursive=*/true), "create " + segment_dir_);
  directory_created_ = true;
}

void StreamingWriter::Flush() {
  const uint32_t index = stats_.parts;
  EnsureDirectory();

  EVENTCACHE_LOG_INFO("flush_start", {observability::StringField("segment_dir", segment_dir_),
                                      observability::IntField("part_index", index),
                                      observability::IntField("rows_buffered", static_cast<int64_t>(buffer_.size())),
                                      observability::IntField("bytes_buffered", static_cast<int64_t>(buffered_bytes_))});

  auto part = sink_->WritePart(segment_dir_, index, buffer_, *schema_);

  stats_.rows += part.rows;
  stats_.bytes += part.bytes;
  stats_.parts += 1;
  stats_.part_bytes_min = stats_.part_bytes_min ? std::min(*stats_.part_bytes_min, part.bytes) : part.bytes;
  stats_.part_bytes_max = stats_.part_bytes_max ? std::max(*stats_.part_bytes_max, part.bytes) : part.bytes;

  EVENTCACHE_LOG_INFO("flush_complete", {observability::StringField("segment_dir", segment_dir_),
                                         observability::IntField("part_index", index),
                                         observability::IntField("rows_written", static_cast<int64_t>(part.rows)),
                                         observability::StringField("output_file", part.path),
                                         observability::IntField("file_size_bytes", part.bytes)});

  stats_.part_files.push_back(std::move(part));
  buffer_.clear();
  buffered_bytes_ = 0;
}

} // namespace eventcache::writer
