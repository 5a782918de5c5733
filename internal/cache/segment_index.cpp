#include "segment_index.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace eventcache::cache {

using namespace eventcache::storage::common;

SegmentIndex::SegmentIndex(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root, bool bypass_on_corruption)
    : fs_(std::move(fs)), root_(std::move(root)), bypass_on_corruption_(bypass_on_corruption) {
  if (!fs_) throw std::invalid_argument("SegmentIndex: filesystem is required");
}

std::shared_ptr<SegmentIndex> SegmentIndex::Open(const std::string& root_uri_or_path, bool bypass_on_corruption) {
  auto [fs, root] = Unwrap<std::invalid_argument>(ResolveFileSystem(root_uri_or_path), "cache root " + root_uri_or_path);
  return std::make_shared<SegmentIndex>(std::move(fs), std::move(root), bypass_on_corruption);
}

std::string SegmentIndex::SegmentDirectory(const std::string& entity_id, const range::TimeRange& range) const {
  range::Validate(range);
  return SegmentPath(root_, entity_id, range.start_ms, range.end_ms);
}

std::vector<Segment> SegmentIndex::ListSegments(const std::string& entity_id) const {
  const auto entity_dir = EntityPath(root_, entity_id);

  auto entity_info = Unwrap<util::CacheCorruptionError>(fs_->GetFileInfo(entity_dir), "stat " + entity_dir);
  if (entity_info.type() == arrow::fs::FileType::NotFound) {
    return {};
  }
  if (entity_info.type() != arrow::fs::FileType::Directory) {
    ReportCorruption(entity_dir, "entity path is not a directory");
    return {};
  }

  std::vector<Segment> segments;

  for (const auto& from_info : ListDirectory(entity_dir)) {
    if (from_info.type() != arrow::fs::FileType::Directory) continue;

    const auto from_name = from_info.base_name();
    if (from_name.rfind(kFromPrefix, 0) != 0) continue;

    auto start = ParseBoundary(from_name, kFromPrefix);
    if (!start) {
      ReportCorruption(from_info.path(), "unparsable segment start");
      continue;
    }

    for (const auto& to_info : ListDirectory(from_info.path())) {
      if (to_info.type() != arrow::fs::FileType::Directory) continue;

      const auto to_name = to_info.base_name();
      if (to_name.rfind(kToPrefix, 0) != 0) continue;

      auto end = ParseBoundary(to_name, kToPrefix);
      if (!end) {
        ReportCorruption(to_info.path(), "unparsable segment end");
        continue;
      }
      if (*end <= *start) {
        ReportCorruption(to_info.path(), "segment end is not after its start");
        continue;
      }

      Segment segment;
      segment.entity_id = entity_id;
      segment.range     = range::TimeRange{*start, *end};
      segment.directory = to_info.path();
      segment.parts     = ListParts(segment.directory);
      segments.push_back(std::move(segment));
    }
  }

  std::sort(segments.begin(), segments.end(), [](const Segment& a, const Segment& b) {
    return a.range.start_ms < b.range.start_ms || (a.range.start_ms == b.range.start_ms && a.range.end_ms < b.range.end_ms);
  });

  // Segments of one entity never overlap; if they do, the cache was written by something else.
  std::vector<bool> overlapping(segments.size(), false);
  for (size_t i = 0; i < segments.size(); ++i) {
    for (size_t j = i + 1; j < segments.size() && segments[j].range.start_ms < segments[i].range.end_ms; ++j) {
      overlapping[i] = true;
      overlapping[j] = true;
    }
  }

  std::vector<Segment> valid;
  valid.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    if (overlapping[i]) {
      ReportCorruption(segments[i].directory, "segment " + range::FormatRange(segments[i].range) +
                                                  " overlaps another segment of the same entity");
      continue;
    }
    valid.push_back(std::move(segments[i]));
  }
  return valid;
}

std::vector<Segment> SegmentIndex::Intersecting(const std::string& entity_id, const range::TimeRange& query) const {
  range::Validate(query);

  std::vector<Segment> result;
  for (auto& segment : ListSegments(entity_id)) {
    if (range::Overlaps(segment.range, query)) {
      result.push_back(std::move(segment));
    }
  }
  return result;
}

std::vector<arrow::fs::FileInfo> SegmentIndex::ListDirectory(const std::string& path) const {
  arrow::fs::FileSelector selector;
  selector.base_dir       = path;
  selector.recursive      = false;
  selector.allow_not_found = true;
  return Unwrap<util::CacheCorruptionError>(fs_->GetFileInfo(selector), "list " + path);
}

std::vector<PartFile> SegmentIndex::ListParts(const std::string& segment_dir) const {
  std::vector<PartFile> parts;
  for (const auto& info : ListDirectory(segment_dir)) {
    if (info.type() != arrow::fs::FileType::File) continue;

    auto index = ParsePartFileName(info.base_name());
    if (!index) continue;

    parts.push_back(PartFile{*index, info.path(), info.size()});
  }

  std::sort(parts.begin(), parts.end(), [](const PartFile& a, const PartFile& b) { return a.index < b.index; });
  return parts;
}

void SegmentIndex::ReportCorruption(const std::string& path, const std::string& reason) const {
  if (!bypass_on_corruption_) {
    throw util::CacheCorruptionError(reason + ": " + path);
  }
  EVENTCACHE_LOG_WARN("cache_corruption_bypassed",
                      {observability::StringField("path", path), observability::StringField("reason", reason)});
}

} // namespace eventcache::cache
