#pragma once

#include "discrim/segment/IBinningRule.hh"

namespace discrim {

/**
 * Equal-population cuts snapped onto tie boundaries.
 *
 * Starts from the RankEqualCount cuts. A cut that falls inside a run of equal
 * probabilities is moved forward to the end of that run; cuts that collapse
 * onto an earlier cut or onto the end of the sample are dropped. Every
 * probability value therefore lives in exactly one segment, at the price of
 * unequal populations and possibly fewer segments than requested (a sample
 * with a single distinct value yields one segment).
 */
class BoundarySnapping : public IBinningRule {
public:
  BoundarySnapping() = default;
  ~BoundarySnapping() override = default;

  std::vector<std::size_t> CutOffsets(const std::vector<Observation>& sorted,
                                      int num_segments) const override;

  const char* Name() const override { return "boundary_snapping"; }
};

} // namespace discrim
