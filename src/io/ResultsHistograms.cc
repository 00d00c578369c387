#include "discrim/io/ResultsHistograms.hh"
#include <TFile.h>
#include <TH1D.h>
#include <TParameter.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace discrim {

std::string ToString(TableColumn c) {
  switch (c) {
    case TableColumn::Population:       return "population";
    case TableColumn::Events:           return "class1";
    case TableColumn::NonEvents:        return "class0";
    case TableColumn::CumPopulationPct: return "cum_population_pct";
    case TableColumn::CumEventPct:      return "cum_class1_pct";
    case TableColumn::CumNonEventPct:   return "cum_class0_pct";
    case TableColumn::Separation:       return "abs_difference";
    case TableColumn::Odds:             return "odds";
  }
  return "unknown";
}

namespace {

double column_value(const stats::ResultsRow& row, TableColumn c) {
  switch (c) {
    case TableColumn::Population:       return static_cast<double>(row.segment.population);
    case TableColumn::Events:           return static_cast<double>(row.segment.events);
    case TableColumn::NonEvents:        return static_cast<double>(row.segment.non_events);
    case TableColumn::CumPopulationPct: return row.cum_population_pct;
    case TableColumn::CumEventPct:      return row.cum_event_pct;
    case TableColumn::CumNonEventPct:   return row.cum_nonevent_pct;
    case TableColumn::Separation:       return row.separation;
    case TableColumn::Odds:             return row.odds;
  }
  return 0.0;
}

const TableColumn kAllColumns[] = {
  TableColumn::Population, TableColumn::Events, TableColumn::NonEvents,
  TableColumn::CumPopulationPct, TableColumn::CumEventPct, TableColumn::CumNonEventPct,
  TableColumn::Separation, TableColumn::Odds
};

} // namespace

std::unique_ptr<TH1D> ResultsHistograms::MakeTH1D(const stats::EvaluationResult& r,
                                                  TableColumn column,
                                                  const std::string& name) {
  const int nbins = static_cast<int>(r.table.size());
  if (nbins <= 0) throw std::invalid_argument("ResultsHistograms: empty results table");

  std::ostringstream title;
  title << ToString(column);
  std::ostringstream infinite;
  for (const auto& row : r.table) {
    if (std::isinf(column_value(row, column)))
      infinite << (infinite.tellp() > 0 ? "," : "") << row.segment.segment_index;
  }
  if (infinite.tellp() > 0) title << " (inf in segments " << infinite.str() << ")";
  title << ";segment;" << ToString(column);

  auto h = std::make_unique<TH1D>(name.c_str(), title.str().c_str(), nbins, -0.5, nbins - 0.5);
  h->SetDirectory(nullptr);
  for (int i = 1; i <= nbins; ++i) {
    const double v = column_value(r.table[static_cast<std::size_t>(i - 1)], column);
    h->SetBinContent(i, std::isinf(v) ? 0.0 : v);
  }
  return h;
}

std::unique_ptr<TH1D> ResultsHistograms::MakeInfiniteMask(const stats::EvaluationResult& r,
                                                          TableColumn column,
                                                          const std::string& name) {
  const int nbins = static_cast<int>(r.table.size());
  if (nbins <= 0) throw std::invalid_argument("ResultsHistograms: empty results table");

  const std::string title = ToString(column) + " is infinite;segment;flag";
  auto h = std::make_unique<TH1D>(name.c_str(), title.c_str(), nbins, -0.5, nbins - 0.5);
  h->SetDirectory(nullptr);
  for (int i = 1; i <= nbins; ++i) {
    const double v = column_value(r.table[static_cast<std::size_t>(i - 1)], column);
    h->SetBinContent(i, std::isinf(v) ? 1.0 : 0.0);
  }
  return h;
}

std::vector<std::unique_ptr<TH1D>> ResultsHistograms::MakeAll(const stats::EvaluationResult& r,
                                                              const std::string& prefix) {
  std::vector<std::unique_ptr<TH1D>> out;
  for (TableColumn c : kAllColumns)
    out.push_back(MakeTH1D(r, c, prefix + ToString(c)));
  out.push_back(MakeInfiniteMask(r, TableColumn::Odds, prefix + ToString(TableColumn::Odds) + "_is_inf"));
  return out;
}

void ResultsHistograms::WriteROOT(const stats::EvaluationResult& r, const std::string& path) {
  auto hists = MakeAll(r);

  TFile fout(path.c_str(), "RECREATE");
  if (fout.IsZombie()) throw std::runtime_error("ResultsHistograms: cannot create " + path);
  fout.cd();
  for (auto& h : hists) h->Write();

  TParameter<double> ks("ks_statistic", r.ks_statistic);
  TParameter<int>    ks_idx("ks_segment_index", r.ks_segment_index);
  TParameter<Long64_t> obs("observations", r.observations);
  ks.Write();
  ks_idx.Write();
  obs.Write();
  fout.Close();
}

} // namespace discrim
