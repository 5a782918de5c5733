#include "coverage_planner.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace eventcache::cache {

std::string_view CoverageDecisionName(CoverageDecision decision) {
  switch (decision) {
    case CoverageDecision::kHit:
      return "hit";
    case CoverageDecision::kMiss:
      return "miss";
    case CoverageDecision::kPartial:
      return "partial";
  }
  return "unknown";
}

CoveragePlan BuildPlan(const range::TimeRange& requested, std::vector<Segment> segments) {
  range::Validate(requested);

  range::RangeList clamped;
  clamped.reserve(segments.size());
  for (const auto& segment : segments) {
    if (auto c = range::Clamp(segment.range, requested)) {
      clamped.push_back(*c);
    }
  }

  CoveragePlan plan;
  plan.requested = requested;
  plan.covered   = range::Merge(std::move(clamped));
  plan.missing   = range::Subtract(requested, plan.covered);
  plan.segments  = std::move(segments);

  if (plan.missing.empty()) {
    plan.decision = CoverageDecision::kHit;
  } else if (plan.covered.empty()) {
    plan.decision = CoverageDecision::kMiss;
  } else {
    plan.decision = CoverageDecision::kPartial;
  }
  return plan;
}

CoveragePlanner::CoveragePlanner(std::shared_ptr<const SegmentIndex> index) : index_(std::move(index)) {
  if (!index_) throw std::invalid_argument("CoveragePlanner: segment index is required");
}

CoveragePlan CoveragePlanner::Plan(const std::string& entity_id, const range::TimeRange& requested) const {
  range::Validate(requested);

  auto plan = BuildPlan(requested, index_->Intersecting(entity_id, requested));

  EVENTCACHE_LOG_INFO("coverage_plan", {observability::StringField("entity_id", entity_id),
                                        observability::StringField("requested", range::FormatRange(requested)),
                                        observability::StringField("decision", CoverageDecisionName(plan.decision)),
                                        observability::StringField("covered", range::FormatRanges(plan.covered)),
                                        observability::StringField("missing", range::FormatRanges(plan.missing)),
                                        observability::IntField("segments", static_cast<int64_t>(plan.segments.size()))});
  return plan;
}

} // namespace eventcache::cache
