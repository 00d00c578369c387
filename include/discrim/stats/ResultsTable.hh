#pragma once

#include <vector>

#include "discrim/segment/Segment.hh"

namespace discrim::stats {

/// Tolerance on the cumulative columns reaching 1.0 at the last row.
constexpr double kCumulativeEpsilon = 1e-9;

/**
 * One row of the results table: a segment plus its derived figures.
 *
 * Cumulative fields run from segment 0 (highest scores) through this row.
 * Remaining fields count observations scored at or above this segment's
 * lower bound. Upward fields run from the last segment (lowest scores) up
 * through this row, i.e. observations scored at or below the upper bound.
 */
struct ResultsRow {
  Segment segment;

  long cum_population = 0;
  long cum_events     = 0;
  long cum_non_events = 0;

  double cum_population_pct = 0.0;   // cum_population / total population
  double cum_event_pct      = 0.0;   // cum_events / total events
  double cum_nonevent_pct   = 0.0;   // cum_non_events / total non-events

  double odds           = 0.0;       // non_events / events in this segment, +inf if events == 0
  double event_rate     = 0.0;       // events / population
  double non_event_rate = 0.0;       // non_events / population

  long remaining_population = 0;
  long remaining_events     = 0;
  long remaining_non_events = 0;

  long upward_population = 0;
  long upward_events     = 0;
  long upward_non_events = 0;

  double separation = 0.0;           // |cum_event_pct - cum_nonevent_pct|
};

using ResultsTable = std::vector<ResultsRow>;

} // namespace discrim::stats
