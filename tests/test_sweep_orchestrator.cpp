// tests/test_sweep_orchestrator.cpp
//
// Sweep orchestration against a scripted in-process harness:
//  - probe, binding and Cartesian product order
//  - result decoding and tagging per sweep point
//  - fail-fast batches without partial results
//  - sweeps too large to expand

#include "emx/core/config.h"
#include "emx/core/error.h"
#include "emx/core/types.h"
#include "emx/harness/harness_runner.h"
#include "emx/io/result_codec.h"
#include "emx/sweep/sweep_orchestrator.h"

#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb,
               const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)

using emx::ErrorCode;
using emx::i64;
using emx::usize;
using emx::harness::HarnessInvocation;
using emx::harness::HarnessOutput;

// Plays the harness: answers probes with a fixed listing and, for real runs,
// writes a result file and prints whatever `respond` returns.
class ScriptedHarness final : public emx::harness::IHarnessRunner {
 public:
  using Responder = std::function<std::string(const HarnessInvocation&, const emx::HarnessConfig&)>;

  ScriptedHarness(emx::HarnessConfig cfg, std::string probe_text, Responder respond)
      : cfg_(std::move(cfg)), probe_text_(std::move(probe_text)), respond_(std::move(respond)) {}

  std::string_view Name() const noexcept override { return "scripted"; }

  bool Run(const HarnessInvocation& inv, HarnessOutput* out, emx::Error* /*err*/) override {
    calls.push_back(inv);
    *out = HarnessOutput{};
    out->text = inv.IsProbe() ? probe_text_ : respond_(inv, cfg_);
    out->elapsed_ms = 1.5;
    return true;
  }

  std::vector<HarnessInvocation> calls;

 private:
  emx::HarnessConfig cfg_;
  std::string probe_text_;
  Responder respond_;
};

const char* kProbe =
    "[info] AdderSpec:\n"
    "[emixa-error] Missing arguments. Expected:\n"
    "[emixa-error] - width : Int (missing)\n"
    "[emixa-error] - approxWidth : Int (missing)\n"
    "[emixa-error] - depth : Int (got 7)\n";

std::string ValueOf(const HarnessInvocation& inv, const std::string& name) {
  for (const auto& kv : inv.params) {
    if (kv.first == name) return kv.second;
  }
  return {};
}

// Width-2 exhaustive grid whose every cell is width * 100 + approxWidth.
std::string WriteGridAndReport(const HarnessInvocation& inv, const emx::HarnessConfig& cfg) {
  const i64 tag = std::stoll(ValueOf(inv, "width")) * 100 + std::stoll(ValueOf(inv, "approxWidth"));
  emx::Error err;
  if (!emx::io::WriteResultFile(cfg.ResultPath(inv.test_name),
                                emx::io::EncodeExhaustive(2, std::vector<i64>(16, tag)), &err)) {
    return "[emixa-error] cannot write result\n";
  }
  return "[info] compiling\n[emixa-info] exhaustive unsigned adder characterization\n[info] passed\n";
}

emx::HarnessConfig MakeConfig(const fs::path& root) {
  emx::HarnessConfig cfg;
  cfg.working_dir = root.string();
  return cfg;
}

static void TestExpandOrder(TestContext& t) {
  std::vector<emx::sweep::BoundArgument> bound(2);
  bound[0].name = "p0";
  bound[0].raw = "1:2";
  bound[0].is_range = emx::sweep::ParseRange("1:2", &bound[0].range);
  bound[1].name = "p1";
  bound[1].raw = "10:11";
  bound[1].is_range = emx::sweep::ParseRange("10:11", &bound[1].range);

  std::vector<emx::sweep::SweepPoint> points;
  CHECK(t, emx::sweep::ExpandSweepPoints(bound, &points));
  CHECK_EQ(t, points.size(), static_cast<usize>(4));
  if (points.size() != 4) return;
  const std::pair<const char*, const char*> want[] = {{"1", "10"}, {"1", "11"}, {"2", "10"}, {"2", "11"}};
  for (usize i = 0; i < 4; ++i) {
    CHECK_EQ(t, points[i].values[0].second, std::string(want[i].first));
    CHECK_EQ(t, points[i].values[1].second, std::string(want[i].second));
  }

  // No ranges: one point with the literal values.
  std::vector<emx::sweep::BoundArgument> literal(1);
  literal[0].name = "w";
  literal[0].raw = "8";
  std::vector<emx::sweep::SweepPoint> single;
  CHECK(t, emx::sweep::ExpandSweepPoints(literal, &single));
  CHECK_EQ(t, single.size(), static_cast<usize>(1));
  if (!single.empty()) CHECK_EQ(t, single[0].ToString(), std::string("(w=8)"));
}

static void TestOversizedSweep(TestContext& t, const fs::path& root) {
  // 2^32 * 2^32 points wraps a 64-bit product to zero.
  std::vector<emx::sweep::BoundArgument> bound(2);
  for (usize i = 0; i < 2; ++i) {
    bound[i].name = "p" + std::to_string(i);
    bound[i].raw = "0:4294967295";
    bound[i].is_range = emx::sweep::ParseRange(bound[i].raw, &bound[i].range);
  }
  std::vector<emx::sweep::SweepPoint> points;
  emx::Error err;
  CHECK(t, !emx::sweep::ExpandSweepPoints(bound, &points, &err));
  CHECK_EQ(t, err.code, ErrorCode::InvalidRange);
  CHECK(t, err.message.find("p1=0:4294967295") != std::string::npos);
  CHECK(t, points.empty());

  // One range just over the limit.
  std::vector<emx::sweep::BoundArgument> wide(1);
  wide[0].name = "n";
  wide[0].raw = "1:" + std::to_string(emx::sweep::kMaxSweepPoints + 1);
  wide[0].is_range = emx::sweep::ParseRange(wide[0].raw, &wide[0].range);
  err.Clear();
  CHECK(t, !emx::sweep::ExpandSweepPoints(wide, &points, &err));
  CHECK_EQ(t, err.code, ErrorCode::InvalidRange);

  // A batch over such a sweep fails after the probe without running a point.
  const emx::HarnessConfig cfg = MakeConfig(root);
  ScriptedHarness harness(cfg, kProbe, WriteGridAndReport);
  emx::sweep::SweepOrchestrator orch(&harness, cfg, emx::SweepConfig{});
  emx::sweep::SweepRequest req;
  req.test_name = "AdderSpec";
  req.tokens = {"0:4294967295", "0:4294967295"};
  std::vector<emx::CharacterizationResult> results;
  err.Clear();
  CHECK(t, !orch.Run(req, &results, &err));
  CHECK_EQ(t, err.code, ErrorCode::InvalidRange);
  CHECK(t, results.empty());
  CHECK_EQ(t, harness.calls.size(), static_cast<usize>(1));
}

static void TestBatchSuccess(TestContext& t, const fs::path& root) {
  const emx::HarnessConfig cfg = MakeConfig(root);
  ScriptedHarness harness(cfg, kProbe, WriteGridAndReport);
  emx::sweep::SweepOrchestrator orch(&harness, cfg, emx::SweepConfig{});

  emx::sweep::SweepRequest req;
  req.test_name = "AdderSpec";
  req.tokens = {"1:2", "approxWidth=10:11"};

  std::vector<emx::CharacterizationResult> results;
  emx::Error err;
  CHECK(t, orch.Run(req, &results, &err));
  if (!err.ok()) std::cerr << "  " << err.ToString() << "\n";

  // One probe plus four points, last-declared range fastest.
  CHECK_EQ(t, harness.calls.size(), static_cast<usize>(5));
  CHECK(t, harness.calls.size() == 5 && harness.calls[0].IsProbe());
  CHECK_EQ(t, results.size(), static_cast<usize>(4));
  if (results.size() != 4) return;

  const char* want[4][3] = {{"1", "10", "7"}, {"1", "11", "7"}, {"2", "10", "7"}, {"2", "11", "7"}};
  for (usize i = 0; i < 4; ++i) {
    const auto& r = results[i];
    CHECK_EQ(t, r.name, std::string("AdderSpec"));
    CHECK_EQ(t, r.kind(), emx::CharacterizationKind::Exhaustive);
    CHECK_EQ(t, r.module, emx::ModuleKind::Adder);
    CHECK(t, !r.is_signed);
    CHECK_EQ(t, r.bit_width, 2);
    CHECK(t, r.param_names == std::vector<std::string>({"width", "approxWidth", "depth"}));
    CHECK(t, r.params == std::vector<std::string>({want[i][0], want[i][1], want[i][2]}));

    // Every point read its own result file.
    const i64 tag = std::stoll(want[i][0]) * 100 + std::stoll(want[i][1]);
    CHECK_EQ(t, std::get<emx::ExhaustiveErrors>(r.data).At(3, 3), tag);
    CHECK_EQ(t, r.elapsed_ms, 1.5);
  }

  // Sweep flags go out in declared order.
  const auto& last = harness.calls.back();
  CHECK_EQ(t, last.params.size(), static_cast<usize>(3));
  if (last.params.size() == 3) {
    CHECK_EQ(t, last.params[0].first, std::string("width"));
    CHECK_EQ(t, last.params[2].first, std::string("depth"));
    CHECK_EQ(t, last.params[2].second, std::string("7"));
  }

  const auto differing = emx::DifferingParameterIndices(results);
  CHECK(t, differing == std::vector<usize>({0, 1}));
  CHECK_EQ(t, emx::ModelLabel(results[3], differing), std::string("adder_2_11"));
}

static void TestFailFast(TestContext& t, const fs::path& root) {
  const emx::HarnessConfig cfg = MakeConfig(root);
  // The second point fails to compile.
  ScriptedHarness harness(cfg, kProbe, [](const HarnessInvocation& inv, const emx::HarnessConfig& c) {
    if (ValueOf(inv, "width") == "2") {
      return std::string("[error] Spec.scala:3:1: boom\n[error] ^\n");
    }
    return WriteGridAndReport(inv, c);
  });
  emx::sweep::SweepOrchestrator orch(&harness, cfg, emx::SweepConfig{});

  emx::sweep::SweepRequest req;
  req.test_name = "AdderSpec";
  req.tokens = {"1:3", "5"};

  std::vector<emx::CharacterizationResult> results;
  emx::Error err;
  CHECK(t, !orch.Run(req, &results, &err));
  CHECK_EQ(t, err.code, ErrorCode::CompileError);
  CHECK(t, err.detail.find("boom") != std::string::npos);
  CHECK(t, err.message.find("width=2") != std::string::npos);
  CHECK(t, results.empty());
  // Probe, point 1, point 2; point 3 never runs.
  CHECK_EQ(t, harness.calls.size(), static_cast<usize>(3));
}

static void TestProbeFailures(TestContext& t, const fs::path& root) {
  const emx::HarnessConfig cfg = MakeConfig(root);
  ScriptedHarness missing(cfg, "[info] No tests to run for Test / testOnly\n", WriteGridAndReport);
  emx::sweep::SweepOrchestrator orch(&missing, cfg, emx::SweepConfig{});

  emx::sweep::SweepRequest req;
  req.test_name = "Nope";
  std::vector<emx::CharacterizationResult> results;
  emx::Error err;
  CHECK(t, !orch.Run(req, &results, &err));
  CHECK_EQ(t, err.code, ErrorCode::NotFound);
  CHECK_EQ(t, missing.calls.size(), static_cast<usize>(1));

  // Binding errors stop before any point runs.
  ScriptedHarness harness(cfg, kProbe, WriteGridAndReport);
  emx::sweep::SweepOrchestrator orch2(&harness, cfg, emx::SweepConfig{});
  req.test_name = "AdderSpec";
  req.tokens = {"4"};
  err.Clear();
  CHECK(t, !orch2.Run(req, &results, &err));
  CHECK_EQ(t, err.code, ErrorCode::MissingArgument);
  CHECK(t, err.detail.find("approxWidth") != std::string::npos);
  CHECK_EQ(t, harness.calls.size(), static_cast<usize>(1));
}

static void TestUnsupportedModuleAndMissingFile(TestContext& t, const fs::path& root) {
  const emx::HarnessConfig cfg = MakeConfig(root);
  ScriptedHarness divider(cfg, kProbe, [](const HarnessInvocation&, const emx::HarnessConfig&) {
    return std::string("[emixa-info] exhaustive unsigned divider characterization\n");
  });
  emx::sweep::SweepOrchestrator orch(&divider, cfg, emx::SweepConfig{true});

  emx::sweep::SweepRequest req;
  req.test_name = "DividerSpec";
  req.tokens = {"4", "2"};
  std::vector<emx::CharacterizationResult> results;
  emx::Error err;
  CHECK(t, !orch.Run(req, &results, &err));
  CHECK_EQ(t, err.code, ErrorCode::UnsupportedModule);

  // Success text but the harness wrote nothing.
  ScriptedHarness silent(cfg, kProbe, [](const HarnessInvocation&, const emx::HarnessConfig&) {
    return std::string("[emixa-info] random2d signed adder characterization\n");
  });
  emx::sweep::SweepOrchestrator orch2(&silent, cfg, emx::SweepConfig{});
  req.test_name = "NoFileSpec";
  err.Clear();
  CHECK(t, !orch2.Run(req, &results, &err));
  CHECK_EQ(t, err.code, ErrorCode::ResultFileUnavailable);
}

}  // namespace

int main() {
  TestContext t;

  const fs::path tmp_root = fs::temp_directory_path() / "emx_sweep_orchestrator_test";
  std::error_code ec;
  fs::remove_all(tmp_root, ec);
  fs::create_directories(tmp_root);

  TestExpandOrder(t);
  TestBatchSuccess(t, tmp_root);
  TestFailFast(t, tmp_root);
  TestOversizedSweep(t, tmp_root);
  TestProbeFailures(t, tmp_root);
  TestUnsupportedModuleAndMissingFile(t, tmp_root);

  fs::remove_all(tmp_root, ec);

  if (t.fails == 0) {
    std::cout << "[OK] test_sweep_orchestrator\n";
    return 0;
  }
  std::cerr << "[FAILED] test_sweep_orchestrator: " << t.fails << " failure(s)\n";
  return 1;
}
