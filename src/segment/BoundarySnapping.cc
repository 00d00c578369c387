#include "discrim/segment/BoundarySnapping.hh"
#include "discrim/segment/RankEqualCount.hh"

namespace discrim {

std::vector<std::size_t> BoundarySnapping::CutOffsets(const std::vector<Observation>& sorted,
                                                      int num_segments) const {
  const std::vector<std::size_t> rank_ends = RankEqualCount().CutOffsets(sorted, num_segments);
  const std::size_t n = sorted.size();

  std::vector<std::size_t> ends;
  ends.reserve(rank_ends.size());
  for (std::size_t end : rank_ends) {
    // cut between [end-1] and [end]; slide while it splits a tie run
    while (end < n && sorted[end].probability == sorted[end - 1].probability) ++end;
    if (!ends.empty() && end <= ends.back()) continue;
    ends.push_back(end);
    if (end == n) break;
  }
  return ends;
}

} // namespace discrim
