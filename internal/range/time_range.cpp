#include "time_range.hpp"

#include <algorithm>
#include <sstream>

#include "internal/util/errors.hpp"

namespace eventcache::range {

TimeRange MakeRange(int64_t start_ms, int64_t end_ms) {
  TimeRange range{start_ms, end_ms};
  Validate(range);
  return range;
}

void Validate(const TimeRange& range) {
  if (range.end_ms <= range.start_ms) {
    throw util::InvalidRangeError("invalid range " + FormatRange(range) + ": end must be greater than start");
  }
}

bool Overlaps(const TimeRange& a, const TimeRange& b) {
  return a.start_ms < b.end_ms && b.start_ms < a.end_ms;
}

bool Contains(const TimeRange& outer, const TimeRange& inner) {
  return outer.start_ms <= inner.start_ms && inner.end_ms <= outer.end_ms;
}

std::optional<TimeRange> Clamp(const TimeRange& interval, const TimeRange& bounds) {
  Validate(interval);
  Validate(bounds);

  const auto start = std::max(interval.start_ms, bounds.start_ms);
  const auto end   = std::min(interval.end_ms, bounds.end_ms);
  if (end <= start) {
    return std::nullopt;
  }
  return TimeRange{start, end};
}

RangeList Merge(RangeList intervals) {
  for (const auto& interval : intervals) {
    Validate(interval);
  }

  std::sort(intervals.begin(), intervals.end(), [](const TimeRange& a, const TimeRange& b) {
    return a.start_ms < b.start_ms || (a.start_ms == b.start_ms && a.end_ms < b.end_ms);
  });

  RangeList merged;
  merged.reserve(intervals.size());
  for (const auto& interval : intervals) {
    if (!merged.empty() && interval.start_ms <= merged.back().end_ms) {
      merged.back().end_ms = std::max(merged.back().end_ms, interval.end_ms);
      continue;
    }
    merged.push_back(interval);
  }
  return merged;
}

RangeList Subtract(const TimeRange& universe, const RangeList& covered) {
  Validate(universe);

  RangeList clamped;
  clamped.reserve(covered.size());
  for (const auto& interval : covered) {
    if (auto c = Clamp(interval, universe)) {
      clamped.push_back(*c);
    }
  }

  RangeList missing;
  int64_t   cursor = universe.start_ms;
  for (const auto& interval : Merge(std::move(clamped))) {
    if (interval.start_ms > cursor) {
      missing.push_back({cursor, interval.start_ms});
    }
    cursor = std::max(cursor, interval.end_ms);
  }
  if (cursor < universe.end_ms) {
    missing.push_back({cursor, universe.end_ms});
  }
  return missing;
}

std::string FormatRange(const TimeRange& range) {
  std::ostringstream out;
  out << '[' << range.start_ms << ',' << range.end_ms << ')';
  return out.str();
}

std::string FormatRanges(const RangeList& ranges) {
  std::ostringstream out;
  out << '[';
  for (size_t i = 0; i < ranges.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << FormatRange(ranges[i]);
  }
  out << ']';
  return out.str();
}

} // namespace eventcache::range
