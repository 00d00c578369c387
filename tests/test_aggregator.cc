#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "discrim/core/Errors.hh"
#include "discrim/stats/Aggregator.hh"

using namespace discrim;
using discrim::stats::Aggregate;

namespace {

Segment MakeSegment(int idx, long events, long non_events,
                    double lo = 0.0, double hi = 1.0) {
  Segment s;
  s.segment_index = idx;
  s.lower_bound = lo;
  s.upper_bound = hi;
  s.events = events;
  s.non_events = non_events;
  s.population = events + non_events;
  return s;
}

} // namespace

TEST(Aggregator, ZeroEventSegmentReportsInfiniteOdds) {
  const auto r = Aggregate({MakeSegment(0, 4, 0), MakeSegment(1, 0, 5)});
  ASSERT_EQ(r.table.size(), 2u);
  EXPECT_DOUBLE_EQ(r.table[0].odds, 0.0);
  EXPECT_TRUE(std::isinf(r.table[1].odds));
  EXPECT_GT(r.table[1].odds, 0.0);
  EXPECT_DOUBLE_EQ(r.ks_statistic, 1.0);
  EXPECT_EQ(r.ks_segment_index, 0);
}

TEST(Aggregator, OddsAreSegmentLevel) {
  const auto r = Aggregate({MakeSegment(0, 2, 1), MakeSegment(1, 1, 3), MakeSegment(2, 1, 4)});
  EXPECT_DOUBLE_EQ(r.table[0].odds, 0.5);
  EXPECT_DOUBLE_EQ(r.table[1].odds, 3.0);
  EXPECT_DOUBLE_EQ(r.table[2].odds, 4.0);
  EXPECT_DOUBLE_EQ(stats::SegmentOdds(0, 0), std::numeric_limits<double>::infinity());
}

TEST(Aggregator, CumulativeColumnsAndTotals) {
  const auto r = Aggregate({MakeSegment(0, 3, 1), MakeSegment(1, 1, 3), MakeSegment(2, 0, 4)});
  EXPECT_EQ(r.observations, 12);
  EXPECT_EQ(r.total_events, 4);
  EXPECT_EQ(r.total_non_events, 8);

  EXPECT_EQ(r.table[0].cum_events, 3);
  EXPECT_EQ(r.table[1].cum_non_events, 4);
  EXPECT_DOUBLE_EQ(r.table[0].cum_event_pct, 0.75);
  EXPECT_DOUBLE_EQ(r.table[0].cum_nonevent_pct, 0.125);
  EXPECT_DOUBLE_EQ(r.table[1].cum_event_pct, 1.0);
  EXPECT_DOUBLE_EQ(r.table[1].cum_nonevent_pct, 0.5);
  EXPECT_DOUBLE_EQ(r.table[1].cum_population_pct, 8.0 / 12.0);

  const auto& last = r.table.back();
  EXPECT_EQ(last.cum_population_pct, 1.0);
  EXPECT_EQ(last.cum_event_pct, 1.0);
  EXPECT_EQ(last.cum_nonevent_pct, 1.0);

  EXPECT_DOUBLE_EQ(r.table[0].separation, 0.625);
  EXPECT_DOUBLE_EQ(r.ks_statistic, 0.625);
  EXPECT_EQ(r.ks_segment_index, 0);
}

TEST(Aggregator, RatesAndRemainingCounts) {
  const auto r = Aggregate({MakeSegment(0, 3, 1), MakeSegment(1, 1, 3), MakeSegment(2, 0, 4)});

  EXPECT_DOUBLE_EQ(r.table[0].event_rate, 0.75);
  EXPECT_DOUBLE_EQ(r.table[0].non_event_rate, 0.25);
  EXPECT_DOUBLE_EQ(r.table[2].event_rate, 0.0);

  // scored at or above each lower bound
  EXPECT_EQ(r.table[0].remaining_population, 4);
  EXPECT_EQ(r.table[0].remaining_events, 3);
  EXPECT_EQ(r.table[1].remaining_population, 8);
  EXPECT_EQ(r.table[1].remaining_events, 4);
  EXPECT_EQ(r.table[1].remaining_non_events, 4);
  EXPECT_EQ(r.table[2].remaining_population, 12);
  EXPECT_EQ(r.table[2].remaining_non_events, 8);

  // scored at or below each upper bound
  EXPECT_EQ(r.table[0].upward_population, 12);
  EXPECT_EQ(r.table[0].upward_events, 4);
  EXPECT_EQ(r.table[1].upward_population, 8);
  EXPECT_EQ(r.table[1].upward_events, 1);
  EXPECT_EQ(r.table[1].upward_non_events, 7);
  EXPECT_EQ(r.table[2].upward_population, 4);
  EXPECT_EQ(r.table[2].upward_events, 0);
}

TEST(Aggregator, KsTieKeepsFirstSegment) {
  // separations: 0.5, 0.5, 0.0
  const auto r = Aggregate({MakeSegment(0, 1, 0), MakeSegment(1, 1, 1), MakeSegment(2, 0, 1)});
  EXPECT_DOUBLE_EQ(r.table[0].separation, 0.5);
  EXPECT_DOUBLE_EQ(r.table[1].separation, 0.5);
  EXPECT_DOUBLE_EQ(r.ks_statistic, 0.5);
  EXPECT_EQ(r.ks_segment_index, 0);
}

TEST(Aggregator, KsCanSitPastTheFirstSegment) {
  // separations: 0.25, 0.5, 0.0
  const auto r = Aggregate({MakeSegment(0, 1, 0), MakeSegment(1, 1, 0), MakeSegment(2, 2, 4)});
  EXPECT_DOUBLE_EQ(r.ks_statistic, 0.5);
  EXPECT_EQ(r.ks_segment_index, 1);
}

TEST(Aggregator, SingleClassIsDegenerate) {
  EXPECT_THROW(Aggregate({MakeSegment(0, 0, 2), MakeSegment(1, 0, 2)}),
               DegenerateClassDistributionError);
  EXPECT_THROW(Aggregate({MakeSegment(0, 2, 0), MakeSegment(1, 2, 0)}),
               DegenerateClassDistributionError);
}

TEST(Aggregator, RejectsMalformedSegments) {
  EXPECT_THROW(Aggregate({}), InvalidInputError);

  Segment bad = MakeSegment(0, 1, 1);
  bad.population = 3;
  EXPECT_THROW(Aggregate({bad, MakeSegment(1, 1, 1)}), InvalidInputError);

  EXPECT_THROW(Aggregate({MakeSegment(1, 1, 1), MakeSegment(0, 1, 1)}), InvalidInputError);
}
