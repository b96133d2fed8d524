// apps/emx_sweep.cpp
//
// Characterize an approximate arithmetic unit over a parameter sweep and
// synthesize one error model per sweep point.
//
// Usage:
//   ./emx_sweep [options] <test> [args...]
//
// Arguments are literals ("32"), ranges ("4:16:4", "8:4"), or named
// ("width=4:16"). Every range argument adds a sweep dimension.
//
// Exit codes: 0 ok, 2 usage/config, 3 batch failure, 5 output failure.

#include "emx/core/config.h"
#include "emx/core/error.h"
#include "emx/core/logging.h"
#include "emx/core/timer.h"
#include "emx/harness/harness_runner.h"
#include "emx/io/write_results.h"
#include "emx/model/error_model.h"
#include "emx/sweep/sweep_orchestrator.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace emx {
namespace apps {

namespace {

inline bool IsHelpRequested(const ArgMap& args) {
  return args.Has("help") || args.Has("h");
}

void PrintUsage() {
  std::cerr
      << "emx_sweep: sweep an approximate arithmetic characterization and fit error models\n\n"
      << "Usage:\n"
      << "  emx_sweep [options] <test> [args...]\n\n"
      << "Arguments:\n"
      << "  <value>           literal for the next declared parameter\n"
      << "  <start:stop>      inclusive range, step +1 or -1\n"
      << "  <start:stop:step> inclusive range with explicit step\n"
      << "  name=<value>      bind by parameter name (value may be a range)\n\n"
      << "Options:\n"
      << "  --harness=PATH         harness program (default: sbt)\n"
      << "  --style=sbt|direct     command line style (default: sbt)\n"
      << "  --harness_dir=DIR      harness working directory (default: .)\n"
      << "  --output_root=DIR      result root below harness_dir (default: output)\n"
      << "  --result_file=NAME     result file name (default: errors.bin)\n"
      << "  --timeout_ms=N         kill a harness run after N ms (0 = no limit)\n"
      << "  --verbose, -v          forward harness log lines\n"
      << "  --out_dir=DIR          report directory (default: results)\n"
      << "  --report_file=NAME     report file name (default: sweep_report.csv)\n"
      << "  --log_level=LEVEL      trace|debug|info|warn|error|off\n"
      << "  --log_timestamp=BOOL   prefix log lines with a timestamp\n";
}

}  // namespace

}  // namespace apps
}  // namespace emx

int main(int argc, char** argv) {
  const emx::ArgMap args = emx::ArgMap::FromArgv(argc, argv);
  if (emx::apps::IsHelpRequested(args)) {
    emx::apps::PrintUsage();
    return 0;
  }

  emx::Config cfg;
  emx::Error err;
  if (!emx::Config::FromArgs(args, &cfg, &err) || !cfg.Validate(&err)) {
    EMX_LOG_ERROR("Config validation failed:", err.ToString());
    emx::apps::PrintUsage();
    return 2;
  }

  emx::Logger::Instance().SetConfig(cfg.logging);
  EMX_LOG_DEBUG("Config:", cfg.ToJsonLite());

  emx::Stopwatch total;

  // Sweep.
  emx::harness::ProcessHarnessRunner runner(cfg.harness);
  emx::sweep::SweepOrchestrator orchestrator(&runner, cfg.harness, cfg.sweep);

  emx::sweep::SweepRequest req;
  req.test_name = cfg.test_name;
  req.tokens = cfg.args;

  std::vector<emx::CharacterizationResult> results;
  if (!orchestrator.Run(req, &results, &err)) {
    EMX_LOG_ERROR("Sweep failed:", err.code, err.message);
    if (!err.detail.empty()) emx::Logger::Instance().LogBlock(emx::LogLevel::Error, err.detail);
    return 3;
  }

  // Models.
  const std::vector<emx::model::ErrorModel> models = emx::model::SynthesizeModels(results);
  const std::vector<emx::usize> differing = emx::DifferingParameterIndices(results);
  for (emx::usize i = 0; i < models.size(); ++i) {
    EMX_LOG_INFO("Model", emx::ModelLabel(results[i], differing) + ":", emx::model::Summarize(models[i]));
  }

  // Report.
  const std::string report_path = (fs::path(cfg.output.out_dir) / cfg.output.report_file).string();
  if (!emx::io::AppendSweepReportCSV(report_path, results, models, &err)) {
    EMX_LOG_ERROR("Cannot write report:", report_path, "err=", err.message);
    return 5;
  }

  EMX_LOG_INFO("Wrote", results.size(), "row(s) to", report_path, "in", total.ElapsedMillis(), "ms");
  return 0;
}
