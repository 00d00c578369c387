#pragma once

#include <string>
#include <variant>
#include <vector>

#include "discrim/core/Errors.hh"
#include "discrim/segment/SegmentationConfig.hh"
#include "discrim/stats/EvaluationResult.hh"

namespace discrim {

using stats::EvaluationResult;

struct EvaluationConfig {
  int       num_segments = 10;
  TiePolicy tie_policy   = TiePolicy::RankEqualCount;
  int       verbosity    = 0;   ///< 0=silent, 1=summary, 2+=debug
};

struct EvaluationError {
  ErrorKind   kind = ErrorKind::InvalidInput;
  std::string message;
};

/// Either a result or the named reason it could not be produced.
using EvaluationOutcome = std::variant<EvaluationResult, EvaluationError>;

/**
 * Segment the scores and aggregate them into the results table and KS.
 *
 * Throws InvalidInputError for malformed inputs and
 * DegenerateClassDistributionError for single-class samples.
 */
EvaluationResult Evaluate(const std::vector<double>& probabilities,
                          const std::vector<int>& labels,
                          const EvaluationConfig& cfg = EvaluationConfig{});

/// Same as Evaluate, with the two domain errors returned instead of thrown.
EvaluationOutcome TryEvaluate(const std::vector<double>& probabilities,
                              const std::vector<int>& labels,
                              const EvaluationConfig& cfg = EvaluationConfig{});

} // namespace discrim
