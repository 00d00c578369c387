#pragma once

#include "discrim/segment/IBinningRule.hh"

namespace discrim {

/**
 * Equal-population segments by rank.
 *
 * With n observations and k = min(num_segments, n) segments, segment g holds
 *   n / k + (g < n % k ? 1 : 0)
 * observations, so the remainder goes to the highest scored segments.
 * Observations sharing a probability may end up in neighbouring segments;
 * their relative order is the input order, which keeps the split reproducible.
 */
class RankEqualCount : public IBinningRule {
public:
  RankEqualCount() = default;
  ~RankEqualCount() override = default;

  std::vector<std::size_t> CutOffsets(const std::vector<Observation>& sorted,
                                      int num_segments) const override;

  const char* Name() const override { return "rank_equal_count"; }
};

} // namespace discrim
