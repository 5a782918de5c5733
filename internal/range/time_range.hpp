#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace eventcache::range {

/*
  Half-open interval [start_ms, end_ms) in epoch milliseconds.

  All functions below require start_ms < end_ms for every input interval and
  throw util::InvalidRangeError otherwise. Outputs are always canonical:
  sorted by start, non-overlapping, non-adjacent, and never zero-width.
*/
struct TimeRange {
  int64_t start_ms = 0;
  int64_t end_ms   = 0;

  int64_t Width() const {
    return end_ms - start_ms;
  }

  bool operator==(const TimeRange&) const = default;
};

using RangeList = std::vector<TimeRange>;

// Builds a range, throwing InvalidRangeError when end_ms <= start_ms.
TimeRange MakeRange(int64_t start_ms, int64_t end_ms);

void Validate(const TimeRange& range);

// True when the two intervals share at least one instant. Touching is not overlap.
bool Overlaps(const TimeRange& a, const TimeRange& b);

bool Contains(const TimeRange& outer, const TimeRange& inner);

// Intersection of interval with bounds, nullopt if empty.
std::optional<TimeRange> Clamp(const TimeRange& interval, const TimeRange& bounds);

// Sort and coalesce overlapping or touching intervals.
RangeList Merge(RangeList intervals);

// universe \ Merge(covered ∩ universe).
RangeList Subtract(const TimeRange& universe, const RangeList& covered);

// "[[0,30), [70,100)]"
std::string FormatRange(const TimeRange& range);
std::string FormatRanges(const RangeList& ranges);

} // namespace eventcache::range
