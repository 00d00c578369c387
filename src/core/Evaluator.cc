#include "discrim/core/Evaluator.hh"
#include "discrim/segment/Segmenter.hh"
#include "discrim/stats/Aggregator.hh"

#include <iostream>

namespace discrim {

EvaluationResult Evaluate(const std::vector<double>& probabilities,
                          const std::vector<int>& labels,
                          const EvaluationConfig& cfg) {
  SegmentationConfig scfg;
  scfg.num_segments = cfg.num_segments;
  scfg.tie_policy   = cfg.tie_policy;
  scfg.verbosity    = cfg.verbosity;

  const Segmenter segmenter(scfg);
  const std::vector<Segment> segments = segmenter.Apply(probabilities, labels);

  EvaluationResult r = stats::Aggregate(segments);
  r.num_segments_requested = cfg.num_segments;
  r.tie_policy             = cfg.tie_policy;

  if (cfg.verbosity > 0) {
    std::cout << "[stats] obs=" << r.observations
              << " class0=" << r.total_non_events
              << " class1=" << r.total_events
              << " KS=" << r.ks_statistic
              << " at segment " << r.ks_segment_index << "\n";
  }
  return r;
}

EvaluationOutcome TryEvaluate(const std::vector<double>& probabilities,
                              const std::vector<int>& labels,
                              const EvaluationConfig& cfg) {
  try {
    return Evaluate(probabilities, labels, cfg);
  } catch (const InvalidInputError& e) {
    return EvaluationError{ErrorKind::InvalidInput, e.what()};
  } catch (const DegenerateClassDistributionError& e) {
    return EvaluationError{ErrorKind::DegenerateClassDistribution, e.what()};
  }
}

} // namespace discrim
