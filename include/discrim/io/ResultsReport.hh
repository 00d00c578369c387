#pragma once
#include <iosfwd>
#include <string>

#include "discrim/stats/EvaluationResult.hh"

namespace discrim {

/// Text renderings of an EvaluationResult for the presentation layer.
class ResultsReport {
public:
  /// Header line plus one CSV line per segment. Infinite odds print as "inf".
  static void WriteCSV(const stats::EvaluationResult& r, std::ostream& os);

  /// Writes the CSV to `path`; throws std::runtime_error if it cannot be opened.
  static void WriteCSV(const stats::EvaluationResult& r, const std::string& path);

  /// Population counts and KS, one field per line.
  static void PrintSummary(const stats::EvaluationResult& r, std::ostream& os);

  /// Fixed-width console table.
  static void PrintTable(const stats::EvaluationResult& r, std::ostream& os);
};

} // namespace discrim
