#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace discrim {

/// Holds a scored sample (predicted probability, observed label) read from disk.
class ScoreTable {
public:
  ScoreTable() = default;

  /// Load a delimited text file (comma, or whitespace as fallback);
  /// '#' comments and blank lines are ignored. Labels must be integral.
  /// Rows whose selected cells do not parse are skipped and counted.
  /// Returns true when the file opened and at least one row was read.
  bool LoadCSV(const std::string& path,
               int probability_column = 0,
               int label_column = 1,
               bool has_header = true);

  const std::vector<double>& probabilities() const noexcept { return proba_; }
  const std::vector<int>&    labels()        const noexcept { return labels_; }
  std::size_t size()      const noexcept { return proba_.size(); }
  std::size_t n_skipped() const noexcept { return n_skipped_; }

private:
  std::vector<double> proba_;
  std::vector<int>    labels_;
  std::size_t         n_skipped_ = 0;
};

} // namespace discrim
