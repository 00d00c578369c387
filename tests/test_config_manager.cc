#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "discrim/io/ConfigManager.hh"

using namespace discrim;
using nlohmann::json;

TEST(ConfigManager, AppliesDefaultsForMissingBlocks) {
  ConfigManager cfg("unused.json");
  cfg.parse(json{{"run", {{"label", "demo"}}}});

  EXPECT_EQ(cfg.run().label, "demo");
  EXPECT_EQ(cfg.run().verbosity, 1);
  EXPECT_EQ(cfg.run().rng_seed, 12345u);
  EXPECT_EQ(cfg.evaluation().num_segments, 10);
  EXPECT_EQ(cfg.evaluation().tie_policy, TiePolicy::RankEqualCount);
  EXPECT_EQ(cfg.evaluation().verbosity, 1);
  EXPECT_TRUE(cfg.input().path.empty());
  EXPECT_TRUE(cfg.output().write_csv);
  EXPECT_TRUE(cfg.output().write_root);
  EXPECT_EQ(cfg.synthetic().n_events, 1000);
}

TEST(ConfigManager, ParsesAllBlocks) {
  const json j = json::parse(R"({
    "run":        { "label": "m1", "outdir": "out/m1", "verbosity": 0, "rng_seed": 42 },
    "evaluation": { "num_segments": 20, "tie_policy": "boundary_snapping" },
    "input":      { "path": "scores.csv", "probability_column": 2,
                    "label_column": 0, "has_header": false },
    "output":     { "write_csv": true, "write_root": false },
    "synthetic":  { "n_events": 10, "n_non_events": 90,
                    "event_shape": [5.0, 1.5], "non_event_shape": [1.5, 5.0] }
  })");
  ConfigManager cfg("unused.json");
  cfg.parse(j);

  EXPECT_EQ(cfg.run().outdir, "out/m1");
  EXPECT_EQ(cfg.run().rng_seed, 42u);
  EXPECT_EQ(cfg.evaluation().num_segments, 20);
  EXPECT_EQ(cfg.evaluation().tie_policy, TiePolicy::BoundarySnapping);
  EXPECT_EQ(cfg.evaluation().verbosity, 0);
  EXPECT_EQ(cfg.input().path, "scores.csv");
  EXPECT_EQ(cfg.input().probability_column, 2);
  EXPECT_EQ(cfg.input().label_column, 0);
  EXPECT_FALSE(cfg.input().has_header);
  EXPECT_FALSE(cfg.output().write_root);
  EXPECT_EQ(cfg.synthetic().n_non_events, 90);
  EXPECT_DOUBLE_EQ(cfg.synthetic().event_alpha, 5.0);
  EXPECT_DOUBLE_EQ(cfg.synthetic().non_event_beta, 5.0);
}

TEST(ConfigManager, RejectsBadValues) {
  ConfigManager cfg("unused.json");
  EXPECT_THROW(cfg.parse(json{{"run", json::object()}, {"evaluation", {{"tie_policy", "median"}}}}),
               InvalidInputError);
  EXPECT_THROW(cfg.parse(json{{"run", json::object()}, {"evaluation", {{"num_segments", 0}}}}),
               std::invalid_argument);
  EXPECT_THROW(cfg.parse(json{{"run", json::object()},
                              {"input", {{"path", "x.csv"}, {"label_column", 0}}}}),
               std::invalid_argument);
  EXPECT_THROW(cfg.parse(json{{"run", json::object()},
                              {"synthetic", {{"event_shape", json::array({1.0})}}}}),
               std::invalid_argument);
  EXPECT_THROW(cfg.parse(json{{"evaluation", json::object()}}), json::out_of_range);
}

TEST(ConfigManager, ReadsFromFile) {
  const auto path = std::filesystem::path(::testing::TempDir()) / "discrim_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"run": {"label": "file"}, "evaluation": {"num_segments": 5}})";
  }
  ConfigManager cfg(path.string());
  cfg.parse();
  EXPECT_EQ(cfg.run().label, "file");
  EXPECT_EQ(cfg.evaluation().num_segments, 5);
  std::filesystem::remove(path);
}

TEST(ConfigManager, MissingFileThrows) {
  ConfigManager cfg("/nonexistent/discrim/config.json");
  EXPECT_THROW(cfg.parse(), std::runtime_error);
}
