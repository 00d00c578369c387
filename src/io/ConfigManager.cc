#include "discrim/io/ConfigManager.hh"
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace discrim {

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw std::runtime_error("Cannot open config: " + path_);
  nlohmann::json j;
  in >> j;
  parse(j);
}

void ConfigManager::parse(const nlohmann::json& j) {
  parse_run_(j.at("run"));
  if (j.contains("evaluation")) parse_evaluation_(j.at("evaluation"));
  if (j.contains("input"))      parse_input_(j.at("input"));
  if (j.contains("output"))     parse_output_(j.at("output"));
  if (j.contains("synthetic"))  parse_synthetic_(j.at("synthetic"));
  eval_.verbosity = run_.verbosity;
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.outdir    = j.value("outdir", std::string{});
  run_.rng_seed  = j.value("rng_seed", 12345ULL);
  run_.verbosity = j.value("verbosity", 1);
}

void ConfigManager::parse_evaluation_(const nlohmann::json& j) {
  eval_.num_segments = j.value("num_segments", 10);
  if (eval_.num_segments < 1)
    throw std::invalid_argument("evaluation.num_segments must be >= 1");
  eval_.tie_policy = ParseTiePolicy(j.value("tie_policy", std::string("rank_equal_count")));
}

void ConfigManager::parse_input_(const nlohmann::json& j) {
  input_.path               = j.at("path").get<std::string>();
  input_.probability_column = j.value("probability_column", 0);
  input_.label_column       = j.value("label_column", 1);
  input_.has_header         = j.value("has_header", true);
  if (input_.probability_column < 0 || input_.label_column < 0)
    throw std::invalid_argument("input columns must be >= 0");
  if (input_.probability_column == input_.label_column)
    throw std::invalid_argument("input.probability_column and input.label_column must differ");
}

void ConfigManager::parse_output_(const nlohmann::json& j) {
  output_.write_csv  = j.value("write_csv", true);
  output_.write_root = j.value("write_root", true);
}

void ConfigManager::parse_synthetic_(const nlohmann::json& j) {
  synth_.n_events     = j.value("n_events", 1000L);
  synth_.n_non_events = j.value("n_non_events", 9000L);
  if (j.contains("event_shape")) {
    const auto shape = j.at("event_shape").get<std::vector<double>>();
    if (shape.size() != 2) throw std::invalid_argument("synthetic.event_shape must be [alpha, beta]");
    synth_.event_alpha = shape[0];
    synth_.event_beta  = shape[1];
  }
  if (j.contains("non_event_shape")) {
    const auto shape = j.at("non_event_shape").get<std::vector<double>>();
    if (shape.size() != 2) throw std::invalid_argument("synthetic.non_event_shape must be [alpha, beta]");
    synth_.non_event_alpha = shape[0];
    synth_.non_event_beta  = shape[1];
  }
  if (synth_.n_events < 0 || synth_.n_non_events < 0)
    throw std::invalid_argument("synthetic counts must be >= 0");
  if (synth_.event_alpha <= 0.0 || synth_.event_beta <= 0.0 ||
      synth_.non_event_alpha <= 0.0 || synth_.non_event_beta <= 0.0)
    throw std::invalid_argument("synthetic shape parameters must be > 0");
}

} // namespace discrim
