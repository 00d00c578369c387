#include "discrim/stats/Aggregator.hh"
#include "discrim/core/Errors.hh"

#include <cmath>
#include <limits>
#include <string>

namespace discrim::stats {

double SegmentOdds(long events, long non_events) {
  if (events == 0) return std::numeric_limits<double>::infinity();
  return static_cast<double>(non_events) / static_cast<double>(events);
}

EvaluationResult Aggregate(const std::vector<Segment>& segments) {
  if (segments.empty())
    throw InvalidInputError("Aggregate: no segments");

  long total_pop = 0, total_ev = 0, total_nev = 0;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const Segment& s = segments[i];
    if (s.segment_index != static_cast<int>(i))
      throw InvalidInputError("Aggregate: segment " + std::to_string(i)
                              + " has segment_index " + std::to_string(s.segment_index));
    if (!s.is_valid())
      throw InvalidInputError("Aggregate: segment " + std::to_string(i)
                              + " violates events + non_events == population");
    total_pop += s.population;
    total_ev  += s.events;
    total_nev += s.non_events;
  }

  if (total_ev == 0)
    throw DegenerateClassDistributionError(
        "Aggregate: population has no events (label 1); KS and odds are undefined");
  if (total_nev == 0)
    throw DegenerateClassDistributionError(
        "Aggregate: population has no non-events (label 0); KS and odds are undefined");

  EvaluationResult r;
  r.observations     = total_pop;
  r.total_events     = total_ev;
  r.total_non_events = total_nev;
  r.table.reserve(segments.size());

  long cum_pop = 0, cum_ev = 0, cum_nev = 0;
  double ks = -1.0;
  int ks_idx = 0;

  for (const Segment& s : segments) {
    ResultsRow row;
    row.segment = s;

    // counted before this segment is added, so they include it
    row.upward_population = total_pop - cum_pop;
    row.upward_events     = total_ev  - cum_ev;
    row.upward_non_events = total_nev - cum_nev;

    cum_pop += s.population;
    cum_ev  += s.events;
    cum_nev += s.non_events;

    row.cum_population = cum_pop;
    row.cum_events     = cum_ev;
    row.cum_non_events = cum_nev;

    // every segment above this one scores at or above its lower bound
    row.remaining_population = cum_pop;
    row.remaining_events     = cum_ev;
    row.remaining_non_events = cum_nev;

    row.cum_population_pct = static_cast<double>(cum_pop) / static_cast<double>(total_pop);
    row.cum_event_pct      = static_cast<double>(cum_ev)  / static_cast<double>(total_ev);
    row.cum_nonevent_pct   = static_cast<double>(cum_nev) / static_cast<double>(total_nev);

    row.odds           = SegmentOdds(s.events, s.non_events);
    row.event_rate     = static_cast<double>(s.events) / static_cast<double>(s.population);
    row.non_event_rate = static_cast<double>(s.non_events) / static_cast<double>(s.population);

    row.separation = std::abs(row.cum_event_pct - row.cum_nonevent_pct);
    // strict: ties keep the earliest segment
    if (row.separation > ks) {
      ks = row.separation;
      ks_idx = s.segment_index;
    }
    r.table.push_back(row);
  }

  r.ks_statistic     = ks;
  r.ks_segment_index = ks_idx;
  return r;
}

} // namespace discrim::stats
