#pragma once

#include <memory>

#include "discrim/segment/IBinningRule.hh"
#include "discrim/segment/SegmentationConfig.hh"

namespace discrim {

/**
 * Create the binning rule selected by SegmentationConfig::tie_policy.
 *
 *   RankEqualCount   -> RankEqualCount
 *   BoundarySnapping -> BoundarySnapping
 */
std::unique_ptr<IBinningRule> MakeBinningRule(const SegmentationConfig& cfg);

} // namespace discrim
