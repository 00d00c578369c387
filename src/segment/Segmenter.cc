#include "discrim/segment/Segmenter.hh"
#include "discrim/segment/BinningRuleFactory.hh"
#include "discrim/segment/Observation.hh"
#include "discrim/core/Errors.hh"

#include <iostream>
#include <utility>

namespace discrim {

Segmenter::Segmenter(SegmentationConfig cfg)
  : cfg_(std::move(cfg))
{
  if (cfg_.num_segments < 1)
    throw InvalidInputError("num_segments must be >= 1");
  rule_ = MakeBinningRule(cfg_);
}

std::vector<Segment> Segmenter::Apply(const std::vector<double>& probabilities,
                                      const std::vector<int>& labels) const {
  std::vector<Observation> obs = MakeObservations(probabilities, labels);
  SortByDescendingProbability(obs);

  const std::vector<std::size_t> ends = rule_->CutOffsets(obs, cfg_.num_segments);

  std::vector<Segment> segments;
  segments.reserve(ends.size());
  std::size_t begin = 0;
  for (std::size_t s = 0; s < ends.size(); ++s) {
    const std::size_t end = ends[s];
    Segment seg;
    seg.segment_index = static_cast<int>(s);
    // descending order: first element is the maximum
    seg.upper_bound = obs[begin].probability;
    seg.lower_bound = obs[end - 1].probability;
    for (std::size_t i = begin; i < end; ++i) {
      if (obs[i].label == 1) ++seg.events;
      else                   ++seg.non_events;
    }
    seg.population = static_cast<long>(end - begin);
    segments.push_back(seg);
    begin = end;
  }

  if (cfg_.verbosity > 0) {
    std::cout << "[segment] " << obs.size() << " observations -> " << segments.size()
              << " segments (" << rule_->Name() << ", requested "
              << cfg_.num_segments << ")\n";
  }
  if (cfg_.verbosity > 1) {
    for (const auto& seg : segments) {
      std::cout << "[segment]   #" << seg.segment_index
                << " [" << seg.lower_bound << ", " << seg.upper_bound << "]"
                << " n=" << seg.population
                << " events=" << seg.events
                << " non_events=" << seg.non_events << "\n";
    }
  }
  return segments;
}

} // namespace discrim
