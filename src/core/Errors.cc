#include "discrim/core/Errors.hh"

namespace discrim {

std::string ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInput:                return "invalid_input";
    case ErrorKind::DegenerateClassDistribution: return "degenerate_class_distribution";
  }
  return "unknown";
}

} // namespace discrim
