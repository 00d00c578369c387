#include "discrim/segment/Observation.hh"
#include "discrim/core/Errors.hh"

#include <algorithm>
#include <cmath>
#include <string>

namespace discrim {

std::vector<Observation> MakeObservations(const std::vector<double>& probabilities,
                                          const std::vector<int>& labels) {
  if (probabilities.empty() && labels.empty())
    throw InvalidInputError("MakeObservations: empty input");
  if (probabilities.size() != labels.size())
    throw InvalidInputError("MakeObservations: length mismatch (probabilities="
                            + std::to_string(probabilities.size()) + ", labels="
                            + std::to_string(labels.size()) + ")");

  std::vector<Observation> obs;
  obs.reserve(probabilities.size());
  for (std::size_t i = 0; i < probabilities.size(); ++i) {
    const double p = probabilities[i];
    // NaN fails both comparisons
    if (!(p >= 0.0 && p <= 1.0))
      throw InvalidInputError("MakeObservations: probability at index " + std::to_string(i)
                              + " is outside [0,1]: " + std::to_string(p));
    const int y = labels[i];
    if (y != 0 && y != 1)
      throw InvalidInputError("MakeObservations: label at index " + std::to_string(i)
                              + " is not 0/1: " + std::to_string(y));
    obs.push_back(Observation{p, y, i});
  }
  return obs;
}

void SortByDescendingProbability(std::vector<Observation>& obs) {
  std::stable_sort(obs.begin(), obs.end(),
                   [](const Observation& a, const Observation& b) {
                     return a.probability > b.probability;
                   });
}

} // namespace discrim
