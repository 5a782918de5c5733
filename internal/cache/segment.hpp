#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/range/time_range.hpp"

namespace eventcache::cache {

struct PartFile {
  uint32_t    index = 0;
  std::string path;
  int64_t     byte_size = 0;
};

/*
  One persisted fetch of [range.start_ms, range.end_ms) for an entity.

  The interval is the requested range that produced the segment, not the
  span of the timestamps it happens to contain. Segments are never merged
  or rewritten; parts are listed in index order.
*/
struct Segment {
  std::string           entity_id;
  range::TimeRange      range;
  std::string           directory;
  std::vector<PartFile> parts;
};

} // namespace eventcache::cache
