#include "discrim/io/ResultsReport.hh"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace discrim {

namespace {

std::string format_odds(double odds) {
  if (std::isinf(odds)) return "inf";
  std::ostringstream ss;
  ss << std::setprecision(10) << odds;
  return ss.str();
}

} // namespace

void ResultsReport::WriteCSV(const stats::EvaluationResult& r, std::ostream& os) {
  os << "bin,range,size,class0,class1,odds,class0_rate,class1_rate,"
        "remainder_total,remainder_class0,remainder_class1,"
        "cumulative_class0,cumulative_class1,"
        "cum_population_pct,cum_class0_pct,cum_class1_pct,abs_difference\n";

  const auto old_prec = os.precision(10);
  for (const auto& row : r.table) {
    const auto& s = row.segment;
    os << s.segment_index << ','
       << "\"[" << s.lower_bound << ", " << s.upper_bound << "]\","
       << s.population << ','
       << s.non_events << ','
       << s.events << ','
       << format_odds(row.odds) << ','
       << row.non_event_rate << ','
       << row.event_rate << ','
       << row.remaining_population << ','
       << row.remaining_non_events << ','
       << row.remaining_events << ','
       << row.upward_non_events << ','
       << row.upward_events << ','
       << row.cum_population_pct << ','
       << row.cum_nonevent_pct << ','
       << row.cum_event_pct << ','
       << row.separation << '\n';
  }
  os.precision(old_prec);
}

void ResultsReport::WriteCSV(const stats::EvaluationResult& r, const std::string& path) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("ResultsReport: cannot open " + path);
  WriteCSV(r, out);
  if (!out) throw std::runtime_error("ResultsReport: write failed for " + path);
}

void ResultsReport::PrintSummary(const stats::EvaluationResult& r, std::ostream& os) {
  os << "  Observations : " << r.observations << "\n"
     << "  class0       : " << r.total_non_events << "\n"
     << "  class1       : " << r.total_events << "\n"
     << "  Segments     : " << r.table.size()
     << " (requested " << r.num_segments_requested << ", "
     << ToString(r.tie_policy) << ")\n"
     << "  KS           : " << r.ks_statistic << "\n"
     << "  KS segment   : " << r.ks_segment_index << "\n";
}

void ResultsReport::PrintTable(const stats::EvaluationResult& r, std::ostream& os) {
  const auto old_flags = os.flags();
  const auto old_prec  = os.precision();

  os << std::left
     << std::setw(5)  << "bin"
     << std::setw(22) << "range"
     << std::right
     << std::setw(9)  << "size"
     << std::setw(9)  << "class0"
     << std::setw(9)  << "class1"
     << std::setw(10) << "odds"
     << std::setw(10) << "cum0%"
     << std::setw(10) << "cum1%"
     << std::setw(10) << "|diff|" << "\n";

  os << std::fixed << std::setprecision(4);
  for (const auto& row : r.table) {
    const auto& s = row.segment;
    std::ostringstream range;
    range << std::fixed << std::setprecision(4)
          << "[" << s.lower_bound << ", " << s.upper_bound << "]";
    os << std::left
       << std::setw(5)  << s.segment_index
       << std::setw(22) << range.str()
       << std::right
       << std::setw(9)  << s.population
       << std::setw(9)  << s.non_events
       << std::setw(9)  << s.events
       << std::setw(10) << format_odds(row.odds)
       << std::setw(10) << row.cum_nonevent_pct
       << std::setw(10) << row.cum_event_pct
       << std::setw(10) << row.separation
       << (s.segment_index == r.ks_segment_index ? "  <- KS" : "") << "\n";
  }

  os.flags(old_flags);
  os.precision(old_prec);
}

} // namespace discrim
