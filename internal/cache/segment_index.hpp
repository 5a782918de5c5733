#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>
#include <vector>

#include "internal/range/time_range.hpp"
#include "segment.hpp"

namespace eventcache::cache {

/*
  Read-only view of the segment directories under a cache root.

      <root>/<entity_id>/from=<start_ms>/to=<end_ms>/part-NNNNN.parquet

  Directory names following the from=/to= convention that cannot be parsed,
  inverted ranges, and segments overlapping another segment of the same
  entity raise util::CacheCorruptionError. With bypass_on_corruption those
  entries are reported as WARN events and left out of the listing instead.
*/
class SegmentIndex {
 public:
  SegmentIndex(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root, bool bypass_on_corruption);

  // Resolves a local path or filesystem URI.
  static std::shared_ptr<SegmentIndex> Open(const std::string& root_uri_or_path, bool bypass_on_corruption);

  // All segments of the entity, sorted by range start.
  std::vector<Segment> ListSegments(const std::string& entity_id) const;

  // Segments whose range overlaps `query`.
  std::vector<Segment> Intersecting(const std::string& entity_id, const range::TimeRange& query) const;

  std::string SegmentDirectory(const std::string& entity_id, const range::TimeRange& range) const;

  const std::shared_ptr<arrow::fs::FileSystem>& filesystem() const {
    return fs_;
  }

  const std::string& root() const {
    return root_;
  }

  bool bypass_on_corruption() const {
    return bypass_on_corruption_;
  }

 private:
  std::vector<arrow::fs::FileInfo> ListDirectory(const std::string& path) const;
  std::vector<PartFile> ListParts(const std::string& segment_dir) const;

  // Throws, or logs and returns when bypassing.
  void ReportCorruption(const std::string& path, const std::string& reason) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
  bool                                   bypass_on_corruption_;
};

} // namespace eventcache::cache
