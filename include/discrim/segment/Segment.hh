#pragma once

namespace discrim {

/**
 * One population segment: a contiguous run of observations in descending
 * probability order.
 *
 *  - segment_index : 0 holds the highest probabilities
 *  - lower_bound   : smallest probability in the segment
 *  - upper_bound   : largest probability in the segment
 */
struct Segment {
  int    segment_index = 0;
  double lower_bound   = 0.0;
  double upper_bound   = 0.0;
  long   population    = 0;
  long   events        = 0;
  long   non_events    = 0;

  bool is_valid() const {
    return population > 0 && events >= 0 && non_events >= 0 &&
           events + non_events == population && lower_bound <= upper_bound;
  }
};

} // namespace discrim
