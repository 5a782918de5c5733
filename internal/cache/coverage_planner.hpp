#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/range/time_range.hpp"
#include "segment.hpp"
#include "segment_index.hpp"

namespace eventcache::cache {

enum class CoverageDecision {
  kHit,
  kMiss,
  kPartial,
};

std::string_view CoverageDecisionName(CoverageDecision decision);

struct CoveragePlan {
  range::TimeRange requested;

  // Both lists are sorted, non-overlapping and clamped to `requested`;
  // together they tile it exactly.
  range::RangeList covered;
  range::RangeList missing;

  CoverageDecision decision = CoverageDecision::kMiss;

  // Segments the plan was derived from.
  std::vector<Segment> segments;
};

// Pure planning step over an already-listed set of segments.
CoveragePlan BuildPlan(const range::TimeRange& requested, std::vector<Segment> segments);

class CoveragePlanner {
 public:
  explicit CoveragePlanner(std::shared_ptr<const SegmentIndex> index);

  // Logs a coverage_plan event before returning.
  CoveragePlan Plan(const std::string& entity_id, const range::TimeRange& requested) const;

 private:
  std::shared_ptr<const SegmentIndex> index_;
};

} // namespace eventcache::cache
