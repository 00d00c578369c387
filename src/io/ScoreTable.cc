#include "discrim/io/ScoreTable.hh"

#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace discrim {

namespace {

inline bool is_comment_or_empty(const std::string& s) {
  for (char c : s) {
    if (c == '#') return true;
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

inline void trim(std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  std::size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  s = s.substr(i, j - i);
}

inline std::vector<std::string> split_cells(const std::string& line) {
  std::vector<std::string> cells;
  if (line.find(',') != std::string::npos) {
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) { trim(cell); cells.push_back(cell); }
  } else {
    std::stringstream ss(line);
    std::string cell;
    while (ss >> cell) cells.push_back(cell);
  }
  return cells;
}

// Whole-cell numeric parse; "0.5abc" is rejected.
inline bool parse_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  std::size_t pos = 0;
  try { out = std::stod(s, &pos); }
  catch (const std::invalid_argument&) { return false; }
  catch (const std::out_of_range&)     { return false; }
  return pos == s.size();
}
} // namespace

bool ScoreTable::LoadCSV(const std::string& path,
                         int probability_column,
                         int label_column,
                         bool has_header) {
  proba_.clear(); labels_.clear(); n_skipped_ = 0;
  if (probability_column < 0 || label_column < 0) return false;

  std::ifstream in(path);
  if (!in) return false;

  const auto pcol = static_cast<std::size_t>(probability_column);
  const auto lcol = static_cast<std::size_t>(label_column);

  std::string line;
  bool saw_header = !has_header;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || is_comment_or_empty(line)) continue;
    if (!saw_header) { saw_header = true; continue; }

    const auto cells = split_cells(line);
    double p = 0.0, y = 0.0;
    if (pcol >= cells.size() || lcol >= cells.size() ||
        !parse_double(cells[pcol], p) || !parse_double(cells[lcol], y) ||
        std::floor(y) != y ||
        y < std::numeric_limits<int>::min() || y > std::numeric_limits<int>::max()) {
      ++n_skipped_;
      continue;
    }
    // range checks on p and y belong to the evaluation, not the reader
    proba_.push_back(p);
    labels_.push_back(static_cast<int>(y));
  }
  return !proba_.empty() && proba_.size() == labels_.size();
}

} // namespace discrim
