#pragma once

#include <stdexcept>
#include <string>

namespace discrim {

/// Malformed inputs: empty or mismatched arrays, probability outside [0,1],
/// label outside {0,1}, non-positive segment count, unknown tie policy.
class InvalidInputError : public std::invalid_argument {
public:
  explicit InvalidInputError(const std::string& what)
  : std::invalid_argument(what) {}
};

/// Valid inputs whose population holds a single class; KS and odds are
/// undefined for it.
class DegenerateClassDistributionError : public std::domain_error {
public:
  explicit DegenerateClassDistributionError(const std::string& what)
  : std::domain_error(what) {}
};

enum class ErrorKind { InvalidInput, DegenerateClassDistribution };

std::string ToString(ErrorKind kind);

} // namespace discrim
