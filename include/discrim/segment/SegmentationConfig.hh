#pragma once

#include <string>

namespace discrim {

/// How observations with identical probability are placed at a segment boundary.
enum class TiePolicy {
  RankEqualCount,   ///< "rank_equal_count": equal-count groups by rank, ties may be split
  BoundarySnapping  ///< "boundary_snapping": a tie run is never split, segments may be unequal
};

/// Case-insensitive; throws InvalidInputError for unknown names.
TiePolicy ParseTiePolicy(const std::string& name);
std::string ToString(TiePolicy policy);

/**
 * Configuration for the segmenter, derived from the JSON "evaluation"
 * block (or filled directly by library callers).
 */
struct SegmentationConfig {
  int       num_segments = 10;                       ///< requested segments (deciles)
  TiePolicy tie_policy   = TiePolicy::RankEqualCount;
  int       verbosity    = 0;                        ///< 0=silent, 1=summary, 2+=debug
};

} // namespace discrim
