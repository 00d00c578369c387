#pragma once

#include <vector>

#include "discrim/segment/Segment.hh"
#include "discrim/stats/EvaluationResult.hh"

namespace discrim::stats {

/**
 * Build the results table and the KS statistic from ordered segments.
 *
 * Per segment, in ascending segment_index:
 *   cum_event_pct    = sum_{j<=i} events_j     / total events
 *   cum_nonevent_pct = sum_{j<=i} non_events_j / total non-events
 *   odds             = non_events_i / events_i   (+inf when events_i == 0)
 *
 *   KS = max_i |cum_event_pct_i - cum_nonevent_pct_i|
 * with ks_segment_index the first i reaching the maximum.
 *
 * Throws InvalidInputError for an empty or inconsistent segment list and
 * DegenerateClassDistributionError when the population has no events or no
 * non-events. Only the table and KS fields of the result are filled; the
 * configuration fields are left to the caller.
 */
EvaluationResult Aggregate(const std::vector<Segment>& segments);

/// Segment-level odds, non_events / events, with +inf for zero events.
double SegmentOdds(long events, long non_events);

} // namespace discrim::stats
