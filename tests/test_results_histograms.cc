#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include <TFile.h>
#include <TH1D.h>
#include <TParameter.h>

#include "discrim/core/Evaluator.hh"
#include "discrim/io/ResultsHistograms.hh"

using namespace discrim;

namespace {

EvaluationResult ThreeSegments() {
  EvaluationConfig cfg;
  cfg.num_segments = 3;
  // segments: (2 events), (1 event, 1 non-event), (2 non-events)
  return Evaluate({0.95, 0.9, 0.6, 0.5, 0.2, 0.1}, {1, 1, 1, 0, 0, 0}, cfg);
}

} // namespace

TEST(ResultsHistograms, OneBinPerSegment) {
  const auto r = ThreeSegments();
  auto h = ResultsHistograms::MakeTH1D(r, TableColumn::CumEventPct, "cum1");
  ASSERT_EQ(h->GetNbinsX(), 3);
  EXPECT_NEAR(h->GetBinContent(1), 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(h->GetBinContent(2), 1.0, 1e-12);
  EXPECT_NEAR(h->GetBinContent(3), 1.0, 1e-12);
  EXPECT_EQ(h->FindBin(0.0), 1);
}

TEST(ResultsHistograms, InfiniteOddsLeftEmptyAndFlagged) {
  const auto r = ThreeSegments();
  auto h = ResultsHistograms::MakeTH1D(r, TableColumn::Odds, "odds");
  EXPECT_DOUBLE_EQ(h->GetBinContent(1), 0.0);
  EXPECT_DOUBLE_EQ(h->GetBinContent(2), 1.0);
  EXPECT_DOUBLE_EQ(h->GetBinContent(3), 0.0);
  EXPECT_NE(std::string(h->GetTitle()).find("inf in segments 2"), std::string::npos);
}

TEST(ResultsHistograms, InfiniteOddsMaskSeparatesZeroFromInf) {
  const auto r = ThreeSegments();
  auto mask = ResultsHistograms::MakeInfiniteMask(r, TableColumn::Odds, "odds_is_inf");
  ASSERT_EQ(mask->GetNbinsX(), 3);
  // segment 0 has odds exactly 0, segment 2 has no events
  EXPECT_DOUBLE_EQ(mask->GetBinContent(1), 0.0);
  EXPECT_DOUBLE_EQ(mask->GetBinContent(2), 0.0);
  EXPECT_DOUBLE_EQ(mask->GetBinContent(3), 1.0);
}

TEST(ResultsHistograms, WritesAllColumnsAndKs) {
  const auto r = ThreeSegments();
  const auto path = (std::filesystem::path(::testing::TempDir()) / "discrim_hist_test.root").string();
  ResultsHistograms::WriteROOT(r, path);

  TFile f(path.c_str(), "READ");
  ASSERT_FALSE(f.IsZombie());
  auto* sep = dynamic_cast<TH1D*>(f.Get("abs_difference"));
  ASSERT_NE(sep, nullptr);
  EXPECT_NEAR(sep->GetBinContent(1), 2.0 / 3.0, 1e-12);
  auto* ks = dynamic_cast<TParameter<double>*>(f.Get("ks_statistic"));
  ASSERT_NE(ks, nullptr);
  EXPECT_DOUBLE_EQ(ks->GetVal(), r.ks_statistic);
  EXPECT_NE(f.Get("population"), nullptr);
  EXPECT_NE(f.Get("odds"), nullptr);
  auto* mask = dynamic_cast<TH1D*>(f.Get("odds_is_inf"));
  ASSERT_NE(mask, nullptr);
  EXPECT_DOUBLE_EQ(mask->GetBinContent(3), 1.0);
  f.Close();
  std::filesystem::remove(path);
}
