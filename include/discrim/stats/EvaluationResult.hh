#pragma once

#include "discrim/segment/SegmentationConfig.hh"
#include "discrim/stats/ResultsTable.hh"

namespace discrim::stats {

/// Output of one evaluation. Plain value; the caller owns it.
struct EvaluationResult {
  ResultsTable table;

  double ks_statistic     = 0.0;  ///< max |cum_event_pct - cum_nonevent_pct|, in [0,1]
  int    ks_segment_index = 0;    ///< first segment attaining ks_statistic

  long observations     = 0;
  long total_events     = 0;      ///< label 1
  long total_non_events = 0;      ///< label 0

  int       num_segments_requested = 0;
  TiePolicy tie_policy = TiePolicy::RankEqualCount;
};

} // namespace discrim::stats
