#pragma once

#include <cstddef>
#include <vector>

#include "discrim/segment/Observation.hh"

namespace discrim {

/**
 * Abstract interface for turning a ranked sample into contiguous segments.
 *
 * Works on observations already sorted by descending probability:
 *  - sorted[i]    : i-th highest scored observation
 *  - num_segments : requested segment count (>= 1)
 *
 * Returns the exclusive end offset of every segment, strictly increasing,
 * the last one equal to sorted.size(). No segment is empty.
 */
class IBinningRule {
public:
  virtual ~IBinningRule() = default;

  virtual std::vector<std::size_t> CutOffsets(const std::vector<Observation>& sorted,
                                              int num_segments) const = 0;

  virtual const char* Name() const = 0;
};

} // namespace discrim
