#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "discrim/core/Evaluator.hh"

namespace discrim {

struct RunHeader {
  std::string label;
  std::string outdir;
  uint64_t    rng_seed = 12345;
  int         verbosity = 1;
};

struct InputJSON {
  std::string path;                 // score CSV
  int         probability_column = 0;
  int         label_column = 1;
  bool        has_header = true;
};

struct OutputJSON {
  bool write_csv  = true;
  bool write_root = true;
};

// Beta-shaped score distributions for the synthetic check
struct SyntheticJSON {
  long   n_events = 1000;
  long   n_non_events = 9000;
  double event_alpha = 4.0;
  double event_beta = 2.0;
  double non_event_alpha = 2.0;
  double non_event_beta = 4.0;
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  void parse();
  // Same as parse() on an already loaded document.
  void parse(const nlohmann::json& j);

  const RunHeader&        run()        const noexcept { return run_; }
  const EvaluationConfig& evaluation() const noexcept { return eval_; }
  const InputJSON&        input()      const noexcept { return input_; }
  const OutputJSON&       output()     const noexcept { return output_; }
  const SyntheticJSON&    synthetic()  const noexcept { return synth_; }

private:
  std::string      path_;
  RunHeader        run_;
  EvaluationConfig eval_;
  InputJSON        input_;
  OutputJSON       output_;
  SyntheticJSON    synth_;

  void parse_run_(const nlohmann::json& j);
  void parse_evaluation_(const nlohmann::json& j);
  void parse_input_(const nlohmann::json& j);
  void parse_output_(const nlohmann::json& j);
  void parse_synthetic_(const nlohmann::json& j);
};

} // namespace discrim
