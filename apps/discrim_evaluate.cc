#include "discrim/io/ConfigManager.hh"
#include "discrim/io/ScoreTable.hh"
#include "discrim/io/ResultsReport.hh"
#include "discrim/io/ResultsHistograms.hh"
#include "discrim/core/Evaluator.hh"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.json>\n";
    return 1;
  }

  try {
    discrim::ConfigManager cfg(argv[1]); cfg.parse();
    const auto& in = cfg.input();
    if (in.path.empty()) {
      std::cerr << "[error] config has no input.path\n";
      return 1;
    }

    discrim::ScoreTable scores;
    if (!scores.LoadCSV(in.path, in.probability_column, in.label_column, in.has_header)) {
      std::cerr << "[error] failed to read scores from '" << in.path << "'\n";
      return 1;
    }
    if (scores.n_skipped() > 0) {
      std::cerr << "[input] WARNING: skipped " << scores.n_skipped()
                << " unparsable rows in '" << in.path << "'\n";
    }

    std::string outdir = cfg.run().outdir;
    if (outdir.empty())
      outdir = "outputs/" + (cfg.run().label.empty() ? std::string("unnamed")
                                                     : cfg.run().label);

    std::cout << "[run] label=" << cfg.run().label
              << " input='" << in.path << "' rows=" << scores.size()
              << " outdir='" << outdir << "'\n";

    const auto result = discrim::Evaluate(scores.probabilities(), scores.labels(), cfg.evaluation());

    std::cout << "\n[summary]\n";
    discrim::ResultsReport::PrintSummary(result, std::cout);
    std::cout << "\n";
    discrim::ResultsReport::PrintTable(result, std::cout);

    if (cfg.output().write_csv || cfg.output().write_root) {
      std::error_code ec;
      fs::create_directories(outdir, ec);
      if (ec) {
        std::cerr << "[error] failed to create outdir '" << outdir
                  << "': " << ec.message() << "\n";
        return 1;
      }
    }
    if (cfg.output().write_csv) {
      const std::string path = (fs::path(outdir) / "results.csv").string();
      discrim::ResultsReport::WriteCSV(result, path);
      std::cout << "\n[output] " << path << "\n";
    }
    if (cfg.output().write_root) {
      const std::string path = (fs::path(outdir) / "results.root").string();
      discrim::ResultsHistograms::WriteROOT(result, path);
      std::cout << "[output] " << path << "\n";
    }
    return 0;
  } catch (const discrim::DegenerateClassDistributionError& e) {
    std::cerr << "ERROR: model evaluation unavailable for single-class sample: "
              << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  }
}
