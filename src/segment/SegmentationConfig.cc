#include "discrim/segment/SegmentationConfig.hh"
#include "discrim/core/Errors.hh"

#include <algorithm>
#include <cctype>

namespace discrim {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

TiePolicy ParseTiePolicy(const std::string& name) {
  const std::string s = to_lower(name);
  if (s == "rank_equal_count" || s == "rank") return TiePolicy::RankEqualCount;
  if (s == "boundary_snapping" || s == "snap") return TiePolicy::BoundarySnapping;
  throw InvalidInputError("tie_policy must be rank_equal_count/boundary_snapping, got \""
                          + name + "\"");
}

std::string ToString(TiePolicy policy) {
  switch (policy) {
    case TiePolicy::RankEqualCount:   return "rank_equal_count";
    case TiePolicy::BoundarySnapping: return "boundary_snapping";
  }
  return "unknown";
}

} // namespace discrim
