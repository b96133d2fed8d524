#pragma once
// emx/harness/harness_runner.h
//
// Invocation of the external characterization harness.
//
// The orchestrator only depends on IHarnessRunner, so a scripted in-process
// runner can stand in for the real build tool in tests.
//
// Semantics:
//  - Run() blocks until the harness exits (or the configured timeout fires).
//  - A run that starts and exits, whatever its exit code, is a successful Run();
//    its verdict is derived from the captured text (harness/output_classifier.h).
//  - Run() fails only when the harness could not be started
//    (HarnessLaunchFailed) or was killed on timeout (HarnessTimeout).

#include "emx/core/config.h"
#include "emx/core/error.h"
#include "emx/core/types.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace emx {
namespace harness {

struct HarnessInvocation {
  std::string test_name;

  // One flag per bound parameter, in declared order. Empty for a probe run.
  std::vector<std::pair<std::string, std::string>> params;

  bool IsProbe() const noexcept { return params.empty(); }
};

struct HarnessOutput {
  std::string text;  // combined stdout + stderr
  int exit_code = 0;
  double elapsed_ms = 0.0;
};

class IHarnessRunner {
 public:
  virtual ~IHarnessRunner() = default;

  virtual std::string_view Name() const noexcept = 0;

  virtual bool Run(const HarnessInvocation& inv, HarnessOutput* out, Error* err) = 0;
};

// Render the command line for `inv` according to cfg.style:
//   sbt    : <program> "testOnly <test> -- -D<k>=<v> ..." exit
//   direct : <program> <test> <k>=<v> ...
std::vector<std::string> BuildArgv(const HarnessConfig& cfg, const HarnessInvocation& inv);

// Runs the configured program as a child process in cfg.working_dir.
class ProcessHarnessRunner final : public IHarnessRunner {
 public:
  explicit ProcessHarnessRunner(HarnessConfig cfg) : cfg_(std::move(cfg)) {}

  std::string_view Name() const noexcept override { return "process"; }

  bool Run(const HarnessInvocation& inv, HarnessOutput* out, Error* err) override;

  const HarnessConfig& config() const noexcept { return cfg_; }

 private:
  HarnessConfig cfg_;
};

}  // namespace harness
}  // namespace emx
