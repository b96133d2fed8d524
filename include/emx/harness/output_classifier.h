#pragma once
// emx/harness/output_classifier.h
//
// Interpretation of the text a harness invocation prints.
//
// A run is classified, in this order of precedence, as
//   NotFound       the build tool found no test with the given identifier
//   DidNotExecute  the test exists but zero tests were executed
//   RuntimeError   the harness logged an error-level line while running
//   CompileError   the build tool reported build errors
//   Success        otherwise; the first harness info line carries the metadata
//                  "<kind> <signed|unsigned> <adder|multiplier> ..."
//
// Every block surfaced to the user is relabeled to one severity vocabulary
// (see Relabel), independent of the labels the build tool or harness used.

#include "emx/core/error.h"
#include "emx/core/types.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace emx {
namespace harness {

// Markers emitted by the build tool and by the characterization harness.
struct HarnessDialect {
  std::string no_tests_marker = "No tests to run";
  std::string not_executed_marker = "No tests were executed";
  std::string build_info_label = "[info]";
  std::string build_warning_label = "[warn]";
  std::string build_error_label = "[error]";

  std::string harness_tag = "emixa-";  // present on every harness-emitted line
  std::string harness_info_label = "[emixa-info]";
  std::string harness_warning_label = "[emixa-warning]";
  std::string harness_error_label = "[emixa-error]";

  char caret = '^';
  usize not_executed_window = 4;
};

struct SeverityVocabulary {
  std::string info = "[info]";
  std::string warning = "[warning]";
  std::string error = "[error]";
};

enum class Verdict : u8 {
  Success = 0,
  NotFound,
  DidNotExecute,
  RuntimeError,
  CompileError,
};

std::string_view ToString(Verdict v) noexcept;

inline std::ostream& operator<<(std::ostream& os, Verdict v) {
  os << ToString(v);
  return os;
}

struct RunMetadata {
  CharacterizationKind kind = CharacterizationKind::Unknown;
  bool is_signed = false;
  ModuleKind module = ModuleKind::Unknown;
};

struct Classification {
  Verdict verdict = Verdict::Success;
  RunMetadata meta;

  // Relabeled diagnostic block for failures (empty on success).
  std::string diagnostics;

  // Relabeled harness-emitted lines, for verbose forwarding.
  std::vector<std::string> harness_lines;
};

// A parameter the test declares, as listed by a zero-argument probe run.
struct DeclaredParameter {
  std::string name;
  std::optional<std::string> default_value;
};

// Remove ANSI color/control escape sequences (ESC '[' ... final byte).
std::string StripAnsi(std::string_view text);

// Map the build tool's and the harness's severity labels onto `vocab`
// (also strips ANSI escapes). Pure; no global state.
std::string Relabel(std::string_view text,
                    const HarnessDialect& dialect,
                    const SeverityVocabulary& vocab);

// Classify the captured output of one run of `test_name`.
// Returns true only for Success with valid metadata. Otherwise `err` carries
// NotFound / DidNotExecute / RuntimeError / CompileError (with the extracted
// block in err->detail), UnsupportedModule, or MalformedMetadata; `out` still
// records the verdict and diagnostics.
bool ClassifyOutput(std::string_view output,
                    std::string_view test_name,
                    const HarnessDialect& dialect,
                    const SeverityVocabulary& vocab,
                    Classification* out,
                    Error* err = nullptr);

// Parse the parameter listing printed by a zero-argument probe run. A line
// declares a parameter when the token after the harness label is "-": the next
// token is the name, and a trailing "(got <value>)" supplies its default.
// Fails NotFound when the test does not exist, CompileError when the probe
// listed nothing and the build tool reported errors.
bool ParseDeclaredParameters(std::string_view output,
                             std::string_view test_name,
                             const HarnessDialect& dialect,
                             const SeverityVocabulary& vocab,
                             std::vector<DeclaredParameter>* out,
                             Error* err = nullptr);

// One "  - name (defaults to v)" line per parameter, for binding error reports.
std::string DescribeParameters(const std::vector<DeclaredParameter>& params);

}  // namespace harness
}  // namespace emx
