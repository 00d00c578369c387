#include "discrim/segment/BinningRuleFactory.hh"

#include <iostream>

#include "discrim/core/Errors.hh"
#include "discrim/segment/BoundarySnapping.hh"
#include "discrim/segment/RankEqualCount.hh"

namespace discrim {

std::unique_ptr<IBinningRule>
MakeBinningRule(const SegmentationConfig& cfg) {
  std::unique_ptr<IBinningRule> rule;
  switch (cfg.tie_policy) {
    case TiePolicy::RankEqualCount:   rule = std::make_unique<RankEqualCount>();   break;
    case TiePolicy::BoundarySnapping: rule = std::make_unique<BoundarySnapping>(); break;
  }
  if (!rule)
    throw InvalidInputError("MakeBinningRule: unhandled tie policy");

  if (cfg.verbosity > 1) {
    std::cout << "[segment] Using " << rule->Name() << " binning rule\n";
  }
  return rule;
}

} // namespace discrim
