#pragma once
#include <cstddef>
#include <vector>

namespace discrim {

struct Observation {
  double      probability = 0.0; // predicted P(label == 1), in [0,1]
  int         label       = 0;   // 1 = event, 0 = non-event
  std::size_t input_index = 0;   // position in the caller's arrays
};

/// Validate the parallel arrays and zip them into observations, in input order.
/// Throws InvalidInputError on empty input, length mismatch, a probability
/// outside [0,1] (NaN included) or a label outside {0,1}.
std::vector<Observation> MakeObservations(const std::vector<double>& probabilities,
                                          const std::vector<int>& labels);

/// Stable sort by descending probability; equal probabilities keep input order.
void SortByDescendingProbability(std::vector<Observation>& obs);

} // namespace discrim
