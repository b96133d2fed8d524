// tests/test_output_classifier.cpp
//
// Harness output classification:
//  - verdict precedence (existence first)
//  - extracted diagnostic blocks for each failure kind
//  - severity relabeling and ANSI stripping
//  - metadata parsing and unsupported modules
//  - probe listings of declared parameters

#include "emx/core/error.h"
#include "emx/core/types.h"
#include "emx/harness/output_classifier.h"

#include <iostream>
#include <string>
#include <vector>

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
using emx::harness::Classification;
using emx::harness::DeclaredParameter;
using emx::harness::HarnessDialect;
using emx::harness::SeverityVocabulary;
using emx::harness::Verdict;

const HarnessDialect kDialect{};
const SeverityVocabulary kVocab{};

bool Classify(const std::string& text, Classification* c, emx::Error* err) {
  return emx::harness::ClassifyOutput(text, "AdderSpec", kDialect, kVocab, c, err);
}

static void TestSuccessMetadata(TestContext& t) {
  const std::string text =
      "[info] welcome to sbt\n"
      "[info] compiling 3 Scala sources\n"
      "[emixa-info] Exhaustive unsigned adder characterization\n"
      "[emixa-warning] sampling skipped for width 4\n"
      "[info] Tests: succeeded 1, failed 0\n";

  Classification c;
  emx::Error err;
  CHECK(t, Classify(text, &c, &err));
  CHECK_EQ(t, c.verdict, Verdict::Success);
  CHECK_EQ(t, c.meta.kind, emx::CharacterizationKind::Exhaustive);
  CHECK(t, !c.meta.is_signed);
  CHECK_EQ(t, c.meta.module, emx::ModuleKind::Adder);
  CHECK(t, c.diagnostics.empty());

  // Harness lines are kept for verbose forwarding, relabeled.
  CHECK_EQ(t, c.harness_lines.size(), static_cast<emx::usize>(2));
  if (c.harness_lines.size() == 2) {
    CHECK_EQ(t, c.harness_lines[0], std::string("[info] Exhaustive unsigned adder characterization"));
    CHECK_EQ(t, c.harness_lines[1], std::string("[warning] sampling skipped for width 4"));
  }

  const std::string signed_mult = "[emixa-info] random3d signed multiplier characterization\n";
  CHECK(t, Classify(signed_mult, &c, &err));
  CHECK_EQ(t, c.meta.kind, emx::CharacterizationKind::Random3D);
  CHECK(t, c.meta.is_signed);
  CHECK_EQ(t, c.meta.module, emx::ModuleKind::Multiplier);
}

static void TestColoredLabels(TestContext& t) {
  const std::string text =
      "\x1b[32m[emixa-info]\x1b[0m Random2D signed adder characterization\n";
  Classification c;
  emx::Error err;
  CHECK(t, Classify(text, &c, &err));
  CHECK_EQ(t, c.meta.kind, emx::CharacterizationKind::Random2D);
  CHECK(t, c.meta.is_signed);

  CHECK_EQ(t, emx::harness::StripAnsi("\x1b[1;31mred\x1b[0m text"), std::string("red text"));
}

static void TestPrecedence(TestContext& t) {
  // Both markers: existence is checked first.
  const std::string text =
      "[error] /src/AdderSpec.scala:12:5: not found: value x\n"
      "[error]     x + 1\n"
      "[error]     ^\n"
      "[info] No tests to run for Test / testOnly\n";
  Classification c;
  emx::Error err;
  CHECK(t, !Classify(text, &c, &err));
  CHECK_EQ(t, c.verdict, Verdict::NotFound);
  CHECK_EQ(t, err.code, ErrorCode::NotFound);

  // Harness errors win over build tool errors printed after a failed test.
  const std::string runtime =
      "[emixa-info] exhaustive unsigned adder characterization\n"
      "[emixa-error] width must be positive\n"
      "[emixa-info] aborting\n"
      "[error] Failed tests: AdderSpec\n";
  err.Clear();
  CHECK(t, !Classify(runtime, &c, &err));
  CHECK_EQ(t, c.verdict, Verdict::RuntimeError);
  CHECK_EQ(t, err.code, ErrorCode::RuntimeError);
}

static void TestCompileErrorBlock(TestContext& t) {
  const std::string text =
      "[info] compiling 2 Scala sources\n"
      "[error] /src/AdderSpec.scala:12:5: type mismatch;\n"
      "[error]  found   : Int\n"
      "[error]     val w: UInt = 4\n"
      "[error]                   ^\n"
      "[error] /src/AdderSpec.scala:20:1: second problem\n"
      "[error] two errors found\n";
  Classification c;
  emx::Error err;
  CHECK(t, !Classify(text, &c, &err));
  CHECK_EQ(t, c.verdict, Verdict::CompileError);
  CHECK_EQ(t, err.code, ErrorCode::CompileError);
  CHECK(t, err.detail.find("type mismatch") != std::string::npos);
  CHECK(t, err.detail.find("^") != std::string::npos);
  CHECK(t, err.detail.find("second problem") == std::string::npos);
  CHECK_EQ(t, err.detail, c.diagnostics);
}

static void TestDidNotExecuteWindow(TestContext& t) {
  const std::string text =
      "[info] loading project\n"
      "[info] AdderSpec:\n"
      "[info] - should characterize *** FAILED ***\n"
      "[info]   requirement failed\n"
      "[info]   at AdderSpec.scala:30\n"
      "[info]   line outside the window\n"
      "[error] No tests were executed\n";
  Classification c;
  emx::Error err;
  CHECK(t, !Classify(text, &c, &err));
  CHECK_EQ(t, c.verdict, Verdict::DidNotExecute);
  CHECK_EQ(t, err.code, ErrorCode::DidNotExecute);
  CHECK(t, err.detail.find("AdderSpec:") != std::string::npos);
  CHECK(t, err.detail.find("AdderSpec.scala:30") != std::string::npos);
  CHECK(t, err.detail.find("outside the window") == std::string::npos);
  CHECK(t, err.detail.find("loading project") == std::string::npos);
}

static void TestRuntimeErrorBlock(TestContext& t) {
  const std::string text =
      "[emixa-info] exhaustive unsigned adder characterization\n"
      "[info] unrelated build line\n"
      "[emixa-error] width must be positive\n"
      "[emixa-warning] cleaning up\n";
  Classification c;
  emx::Error err;
  CHECK(t, !Classify(text, &c, &err));
  CHECK_EQ(t, err.detail, std::string("[error] width must be positive\n[warning] cleaning up"));
}

static void TestMetadataErrors(TestContext& t) {
  Classification c;
  emx::Error err;
  CHECK(t, !Classify("[emixa-info] exhaustive unsigned divider characterization\n", &c, &err));
  CHECK_EQ(t, err.code, ErrorCode::UnsupportedModule);

  err.Clear();
  CHECK(t, !Classify("[emixa-info] random4d unsigned adder\n", &c, &err));
  CHECK_EQ(t, err.code, ErrorCode::MalformedMetadata);

  err.Clear();
  CHECK(t, !Classify("[emixa-info] exhaustive maybe adder\n", &c, &err));
  CHECK_EQ(t, err.code, ErrorCode::MalformedMetadata);

  err.Clear();
  CHECK(t, !Classify("[emixa-info] exhaustive\n", &c, &err));
  CHECK_EQ(t, err.code, ErrorCode::MalformedMetadata);

  err.Clear();
  CHECK(t, !Classify("[info] all good\n", &c, &err));
  CHECK_EQ(t, err.code, ErrorCode::MalformedMetadata);
}

static void TestRelabel(TestContext& t) {
  SeverityVocabulary v;
  v.info = "I:";
  v.warning = "W:";
  v.error = "E:";
  CHECK_EQ(t, emx::harness::Relabel("[emixa-error] boom", kDialect, v), std::string("E: boom"));
  CHECK_EQ(t, emx::harness::Relabel("[warn] deprecated", kDialect, v), std::string("W: deprecated"));
  CHECK_EQ(t, emx::harness::Relabel("[error] x [info] y", kDialect, v), std::string("E: x I: y"));
  CHECK_EQ(t, emx::harness::Relabel("no labels", kDialect, v), std::string("no labels"));
}

static void TestProbeListing(TestContext& t) {
  const std::string text =
      "[info] AdderSpec:\n"
      "[emixa-error] Missing arguments. Expected:\n"
      "[emixa-error] - width : Int (got 32)\n"
      "[emixa-error] - approxWidth : Int (missing)\n"
      "\x1b[31m[emixa-error]\x1b[0m - depth : Int\n"
      "[emixa-error] - width : Int (got 32)\n"
      "[error] Failed tests: AdderSpec\n";

  std::vector<DeclaredParameter> params;
  emx::Error err;
  CHECK(t, emx::harness::ParseDeclaredParameters(text, "AdderSpec", kDialect, kVocab, &params, &err));
  CHECK_EQ(t, params.size(), static_cast<emx::usize>(3));
  if (params.size() == 3) {
    CHECK_EQ(t, params[0].name, std::string("width"));
    CHECK(t, params[0].default_value.has_value());
    CHECK_EQ(t, params[0].default_value.value_or(""), std::string("32"));
    CHECK_EQ(t, params[1].name, std::string("approxWidth"));
    CHECK(t, !params[1].default_value.has_value());
    CHECK_EQ(t, params[2].name, std::string("depth"));
    CHECK(t, !params[2].default_value.has_value());
  }

  const std::string listing = emx::harness::DescribeParameters(params);
  CHECK(t, listing.find("width (defaults to 32)") != std::string::npos);
  CHECK(t, listing.find("approxWidth") != std::string::npos);

  err.Clear();
  CHECK(t, !emx::harness::ParseDeclaredParameters("[info] No tests to run for Test / testOnly\n",
                                                  "Missing", kDialect, kVocab, &params, &err));
  CHECK_EQ(t, err.code, ErrorCode::NotFound);

  err.Clear();
  CHECK(t, !emx::harness::ParseDeclaredParameters("[error] a.scala:1:1: bad\n[error] x\n[error] ^\n",
                                                  "AdderSpec", kDialect, kVocab, &params, &err));
  CHECK_EQ(t, err.code, ErrorCode::CompileError);

  // A test without parameters lists nothing and is not an error.
  err.Clear();
  CHECK(t, emx::harness::ParseDeclaredParameters("[emixa-info] exhaustive unsigned adder\n", "AdderSpec",
                                                 kDialect, kVocab, &params, &err));
  CHECK(t, params.empty());
}

}  // namespace

int main() {
  TestContext t;

  TestSuccessMetadata(t);
  TestColoredLabels(t);
  TestPrecedence(t);
  TestCompileErrorBlock(t);
  TestDidNotExecuteWindow(t);
  TestRuntimeErrorBlock(t);
  TestMetadataErrors(t);
  TestRelabel(t);
  TestProbeListing(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_output_classifier\n";
    return 0;
  }
  std::cerr << "[FAILED] test_output_classifier: " << t.fails << " failure(s)\n";
  return 1;
}
