#pragma once
// emx/sweep/sweep_orchestrator.h
//
// Runs one characterization test over a parameter sweep.
//
// Protocol per batch:
//   1) probe: run the test without parameters and parse the declared parameter
//      names/defaults from its error report
//   2) bind the user's tokens to those names (sweep/argument_binder.h)
//   3) expand range-valued arguments into sweep points (Cartesian product,
//      declared order, last range varying fastest)
//   4) per point: run the harness, classify its output, decode the result file
//
// The batch is all-or-nothing: the first failing point aborts it and no
// results are returned. Points run strictly one after another.

#include "emx/core/config.h"
#include "emx/core/error.h"
#include "emx/core/types.h"
#include "emx/harness/harness_runner.h"
#include "emx/harness/output_classifier.h"
#include "emx/model/characterization.h"
#include "emx/sweep/argument_binder.h"

#include <string>
#include <utility>
#include <vector>

namespace emx {
namespace sweep {

// One concrete assignment of values to the declared parameters.
struct SweepPoint {
  std::vector<std::pair<std::string, std::string>> values;  // declared order

  std::string ToString() const;
};

// Upper bound on the number of points a single batch may expand to.
inline constexpr usize kMaxSweepPoints = usize{1} << 20;

// Cartesian product over the range-valued arguments; literal arguments are
// held fixed. With no range argument the result is a single point.
// Fails with InvalidRange (naming the range tokens) when the product exceeds
// kMaxSweepPoints.
bool ExpandSweepPoints(const std::vector<BoundArgument>& bound,
                       std::vector<SweepPoint>* out,
                       Error* err = nullptr);

struct SweepRequest {
  std::string test_name;
  std::vector<std::string> tokens;  // literals, ranges, or name=value
};

class SweepOrchestrator {
 public:
  SweepOrchestrator(harness::IHarnessRunner* runner,
                    HarnessConfig harness_cfg,
                    SweepConfig sweep_cfg,
                    harness::HarnessDialect dialect = {},
                    harness::SeverityVocabulary vocab = {});

  bool Probe(const std::string& test_name,
             std::vector<harness::DeclaredParameter>* out,
             Error* err = nullptr);

  // Run a single point and decode its result.
  bool RunPoint(const std::string& test_name,
                const SweepPoint& point,
                CharacterizationResult* out,
                Error* err = nullptr);

  // Full batch. `out` is only filled when every point succeeded.
  bool Run(const SweepRequest& req,
           std::vector<CharacterizationResult>* out,
           Error* err = nullptr);

 private:
  void ForwardHarnessLines(const harness::Classification& c) const;

  harness::IHarnessRunner* runner_ = nullptr;
  HarnessConfig harness_cfg_;
  SweepConfig sweep_cfg_;
  harness::HarnessDialect dialect_;
  harness::SeverityVocabulary vocab_;
};

}  // namespace sweep
}  // namespace emx
