#include "discrim/segment/RankEqualCount.hh"
#include "discrim/core/Errors.hh"

#include <algorithm>

namespace discrim {

std::vector<std::size_t> RankEqualCount::CutOffsets(const std::vector<Observation>& sorted,
                                                    int num_segments) const {
  if (num_segments < 1)
    throw InvalidInputError("RankEqualCount: num_segments must be >= 1");
  const std::size_t n = sorted.size();
  if (n == 0)
    throw InvalidInputError("RankEqualCount: empty sample");

  // never produce empty segments
  const std::size_t k = std::min(static_cast<std::size_t>(num_segments), n);
  const std::size_t base = n / k;
  const std::size_t rem  = n % k;

  std::vector<std::size_t> ends;
  ends.reserve(k);
  std::size_t end = 0;
  for (std::size_t g = 0; g < k; ++g) {
    end += base + (g < rem ? 1 : 0);
    ends.push_back(end);
  }
  return ends;
}

} // namespace discrim
