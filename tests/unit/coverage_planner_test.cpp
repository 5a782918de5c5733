#include "internal/cache/coverage_planner.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using eventcache::cache::BuildPlan;
using eventcache::cache::CoverageDecision;
using eventcache::cache::CoveragePlanner;
using eventcache::cache::Segment;
using eventcache::cache::SegmentIndex;
using eventcache::range::RangeList;
using eventcache::range::TimeRange;

Segment MakeSegment(int64_t start, int64_t end) {
  Segment segment;
  segment.entity_id = "svc";
  segment.range     = TimeRange{start, end};
  return segment;
}

void TestMissWithoutSegments() {
  auto plan = BuildPlan(TimeRange{0, 100}, {});
  assert(plan.decision == CoverageDecision::kMiss);
  assert(plan.covered.empty());
  assert((plan.missing == RangeList{{0, 100}}));
}

void TestHitWhenFullyCovered() {
  auto plan = BuildPlan(TimeRange{10, 50}, {MakeSegment(0, 100)});
  assert(plan.decision == CoverageDecision::kHit);
  assert((plan.covered == RangeList{{10, 50}}));
  assert(plan.missing.empty());
  assert(plan.segments.size() == 1);
}

void TestAdjacentSegmentsCoverTogether() {
  auto plan = BuildPlan(TimeRange{0, 100}, {MakeSegment(0, 50), MakeSegment(50, 100)});
  assert(plan.decision == CoverageDecision::kHit);
  assert((plan.covered == RangeList{{0, 100}}));
}

void TestPartialLeavesTheGap() {
  auto plan = BuildPlan(TimeRange{0, 100}, {MakeSegment(0, 30), MakeSegment(70, 100)});
  assert(plan.decision == CoverageDecision::kPartial);
  assert((plan.covered == RangeList{{0, 30}, {70, 100}}));
  assert((plan.missing == RangeList{{30, 70}}));
}

void TestSegmentsAreClampedToRequest() {
  auto plan = BuildPlan(TimeRange{0, 100}, {MakeSegment(-50, 20), MakeSegment(90, 500)});
  assert(plan.decision == CoverageDecision::kPartial);
  assert((plan.covered == RangeList{{0, 20}, {90, 100}}));
  assert((plan.missing == RangeList{{20, 90}}));
}

void TestInvalidRequestIsRejected() {
  bool threw = false;
  try {
    (void)BuildPlan(TimeRange{100, 100}, {});
  } catch (const eventcache::util::InvalidRangeError&) {
    threw = true;
  }
  assert(threw);
}

void TestPlannerReadsTheIndex() {
  const auto root = std::filesystem::temp_directory_path() / "eventcache_coverage_planner_tests";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root / "svc" / "from=0" / "to=30");
  std::filesystem::create_directories(root / "svc" / "from=70" / "to=100");
  std::filesystem::create_directories(root / "other" / "from=30" / "to=70");

  CoveragePlanner planner(SegmentIndex::Open(root.string(), false));

  auto plan = planner.Plan("svc", TimeRange{0, 100});
  assert(plan.decision == CoverageDecision::kPartial);
  assert((plan.missing == RangeList{{30, 70}}));
  assert(plan.segments.size() == 2);

  auto inside = planner.Plan("svc", TimeRange{5, 25});
  assert(inside.decision == CoverageDecision::kHit);

  auto elsewhere = planner.Plan("svc", TimeRange{200, 300});
  assert(elsewhere.decision == CoverageDecision::kMiss);
  assert(elsewhere.segments.empty());
}

} // namespace

int main() {
  TestMissWithoutSegments();
  TestHitWhenFullyCovered();
  TestAdjacentSegmentsCoverTogether();
  TestPartialLeavesTheGap();
  TestSegmentsAreClampedToRequest();
  TestInvalidRequestIsRejected();
  TestPlannerReadsTheIndex();

  std::cout << "eventcache_unit_coverage_planner: pass\n";
  return 0;
}
