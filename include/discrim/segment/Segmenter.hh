#pragma once
#include <memory>
#include <vector>

#include "discrim/segment/IBinningRule.hh"
#include "discrim/segment/Segment.hh"
#include "discrim/segment/SegmentationConfig.hh"

namespace discrim {

/**
 * Partition (probability, label) pairs into ordered population segments.
 *
 * Apply() validates the inputs, ranks the observations by descending
 * probability (input order on ties), cuts them with the configured binning
 * rule and counts events / non-events per segment. It does no statistics.
 */
class Segmenter {
public:
  explicit Segmenter(SegmentationConfig cfg);

  std::vector<Segment> Apply(const std::vector<double>& probabilities,
                             const std::vector<int>& labels) const;

  const SegmentationConfig& config() const noexcept { return cfg_; }

private:
  SegmentationConfig            cfg_;
  std::unique_ptr<IBinningRule> rule_;
};

} // namespace discrim
