#pragma once
#include <memory>
#include <string>
#include <vector>

#include "discrim/stats/EvaluationResult.hh"

class TH1D;

namespace discrim {

enum class TableColumn {
  Population,
  Events,
  NonEvents,
  CumPopulationPct,
  CumEventPct,
  CumNonEventPct,
  Separation,
  Odds
};

std::string ToString(TableColumn c);

/// ROOT views of the results table: one TH1D per column, x = segment index.
class ResultsHistograms {
public:
  /// Bin i+1 holds row i. Segments with infinite odds leave their bin at
  /// zero and are listed in the histogram title; MakeInfiniteMask marks them.
  static std::unique_ptr<TH1D> MakeTH1D(const stats::EvaluationResult& r,
                                        TableColumn column,
                                        const std::string& name);

  /// 1 in bin i+1 where row i of the column is infinite, 0 elsewhere.
  static std::unique_ptr<TH1D> MakeInfiniteMask(const stats::EvaluationResult& r,
                                                TableColumn column,
                                                const std::string& name);

  /// Every column, named "<prefix><column>", plus "<prefix>odds_is_inf".
  static std::vector<std::unique_ptr<TH1D>> MakeAll(const stats::EvaluationResult& r,
                                                    const std::string& prefix = "");

  /// Write all column histograms plus the KS summary to a new ROOT file.
  /// Throws std::runtime_error if the file cannot be created.
  static void WriteROOT(const stats::EvaluationResult& r, const std::string& path);
};

} // namespace discrim
