// src/harness/output_classifier.cpp
//
// Text classification of harness output, probe listing parser, and severity
// relabeling.

#include "emx/harness/output_classifier.h"

#include "emx/core/logging.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace emx {
namespace harness {

namespace {

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  usize start = 0;
  while (start <= text.size()) {
    const usize nl = text.find('\n', start);
    std::string_view line = (nl == std::string_view::npos) ? text.substr(start) : text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
  // A trailing newline does not open another line.
  if (!lines.empty() && lines.back().empty()) lines.pop_back();
  return lines;
}

std::vector<std::string_view> Tokenize(std::string_view line) {
  std::vector<std::string_view> out;
  usize i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    const usize start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i > start) out.push_back(line.substr(start, i - start));
  }
  return out;
}

bool Contains(std::string_view hay, std::string_view needle) {
  return !needle.empty() && hay.find(needle) != std::string_view::npos;
}

std::string JoinRelabeled(const std::vector<std::string_view>& lines,
                          const HarnessDialect& dialect,
                          const SeverityVocabulary& vocab) {
  std::string out;
  for (usize i = 0; i < lines.size(); ++i) {
    if (i) out.push_back('\n');
    out += Relabel(lines[i], dialect, vocab);
  }
  return out;
}

ErrorCode CodeFor(Verdict v) {
  switch (v) {
    case Verdict::NotFound: return ErrorCode::NotFound;
    case Verdict::DidNotExecute: return ErrorCode::DidNotExecute;
    case Verdict::RuntimeError: return ErrorCode::RuntimeError;
    case Verdict::CompileError: return ErrorCode::CompileError;
    case Verdict::Success: break;
  }
  return ErrorCode::Ok;
}

// Lines carrying the build tool's error label, cut after the first line that
// holds the caret marker (the source pointer of the first diagnostic).
std::vector<std::string_view> CompileErrorBlock(const std::vector<std::string_view>& lines,
                                                const HarnessDialect& dialect) {
  std::vector<std::string_view> block;
  for (std::string_view l : lines) {
    if (!Contains(l, dialect.build_error_label)) continue;
    block.push_back(l);
    if (l.find(dialect.caret) != std::string_view::npos) break;
  }
  return block;
}

bool HasCaretLine(const std::vector<std::string_view>& block, char caret) {
  return std::any_of(block.begin(), block.end(),
                     [caret](std::string_view l) { return l.find(caret) != std::string_view::npos; });
}

// Parse "<label> <kind> <signedness> <module> ..." starting at the label.
bool ParseMetadataLine(std::string_view line,
                       const HarnessDialect& dialect,
                       RunMetadata* meta,
                       Error* err) {
  const usize at = line.find(dialect.harness_info_label);
  const std::vector<std::string_view> tok = Tokenize(line.substr(at));
  if (tok.size() < 4) {
    SetErr(err, ErrorCode::MalformedMetadata,
           "harness metadata line has too few fields: '" + std::string(line) + "'");
    return false;
  }

  if (!ParseCharacterizationKind(tok[1], &meta->kind)) {
    SetErr(err, ErrorCode::MalformedMetadata,
           "unknown characterization kind '" + std::string(tok[1]) + "'");
    return false;
  }

  if (detail::EqualsIgnoreCase(tok[2], "signed")) {
    meta->is_signed = true;
  } else if (detail::EqualsIgnoreCase(tok[2], "unsigned")) {
    meta->is_signed = false;
  } else {
    SetErr(err, ErrorCode::MalformedMetadata, "unknown signedness '" + std::string(tok[2]) + "'");
    return false;
  }

  if (!ParseModuleKind(tok[3], &meta->module)) {
    SetErr(err, ErrorCode::UnsupportedModule,
           "cannot produce outputs for module of type " + std::string(tok[3]) +
               ", only adders and multipliers are supported");
    return false;
  }
  return true;
}

}  // namespace

std::string_view ToString(Verdict v) noexcept {
  switch (v) {
    case Verdict::Success: return "success";
    case Verdict::NotFound: return "not_found";
    case Verdict::DidNotExecute: return "did_not_execute";
    case Verdict::RuntimeError: return "runtime_error";
    case Verdict::CompileError: return "compile_error";
  }
  return "unknown";
}

std::string StripAnsi(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (usize i = 0; i < text.size(); ++i) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      // CSI: parameters/intermediates until a final byte in [0x40, 0x7e].
      usize j = i + 2;
      while (j < text.size() && !(text[j] >= 0x40 && text[j] <= 0x7e)) ++j;
      i = j;
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string Relabel(std::string_view text,
                    const HarnessDialect& dialect,
                    const SeverityVocabulary& vocab) {
  const std::string plain = StripAnsi(text);
  const std::pair<std::string_view, std::string_view> table[] = {
      {dialect.harness_info_label, vocab.info},
      {dialect.harness_warning_label, vocab.warning},
      {dialect.harness_error_label, vocab.error},
      {dialect.build_info_label, vocab.info},
      {dialect.build_warning_label, vocab.warning},
      {"[warning]", vocab.warning},
      {dialect.build_error_label, vocab.error},
  };

  std::string out;
  out.reserve(plain.size());
  usize i = 0;
  while (i < plain.size()) {
    bool replaced = false;
    for (const auto& row : table) {
      if (!row.first.empty() && plain.compare(i, row.first.size(), row.first) == 0) {
        out.append(row.second.data(), row.second.size());
        i += row.first.size();
        replaced = true;
        break;
      }
    }
    if (!replaced) out.push_back(plain[i++]);
  }
  return out;
}

bool ClassifyOutput(std::string_view output,
                    std::string_view test_name,
                    const HarnessDialect& dialect,
                    const SeverityVocabulary& vocab,
                    Classification* out,
                    Error* err) {
  if (!out) return false;
  *out = Classification{};

  const std::string plain = StripAnsi(output);
  const std::vector<std::string_view> lines = SplitLines(plain);

  std::vector<std::string_view> harness_lines;
  for (std::string_view l : lines) {
    if (Contains(l, dialect.harness_tag)) harness_lines.push_back(l);
  }
  for (std::string_view l : harness_lines) out->harness_lines.push_back(Relabel(l, dialect, vocab));

  auto fail = [&](Verdict v, std::string msg, const std::vector<std::string_view>& block) {
    out->verdict = v;
    out->diagnostics = JoinRelabeled(block, dialect, vocab);
    SetErr(err, CodeFor(v), std::move(msg), out->diagnostics);
    return false;
  };

  // 1) Existence.
  if (Contains(plain, dialect.no_tests_marker)) {
    return fail(Verdict::NotFound, "the specified test " + std::string(test_name) + " does not exist", {});
  }

  // 2) Execution: window of lines starting at the first mention of the test.
  if (Contains(plain, dialect.not_executed_marker)) {
    usize first = 0;
    for (usize i = 0; i < lines.size(); ++i) {
      if (Contains(lines[i], test_name)) {
        first = i;
        break;
      }
    }
    const usize last = std::min(lines.size(), first + dialect.not_executed_window);
    const std::vector<std::string_view> block(lines.begin() + static_cast<std::ptrdiff_t>(first),
                                              lines.begin() + static_cast<std::ptrdiff_t>(last));
    return fail(Verdict::DidNotExecute,
                "the specified test " + std::string(test_name) + " could not be executed", block);
  }

  // 3) Harness-reported errors: every harness line from the first error onward.
  const auto first_err = std::find_if(harness_lines.begin(), harness_lines.end(), [&](std::string_view l) {
    return Contains(l, dialect.harness_error_label);
  });
  if (first_err != harness_lines.end()) {
    const std::vector<std::string_view> block(first_err, harness_lines.end());
    return fail(Verdict::RuntimeError, "characterizer " + std::string(test_name) + " reports errors", block);
  }

  // 4) Build errors.
  const std::vector<std::string_view> build_block = CompileErrorBlock(lines, dialect);
  if (!build_block.empty()) {
    return fail(Verdict::CompileError,
                "the specified test " + std::string(test_name) + " does not compile", build_block);
  }

  // 5) Success: metadata from the first harness info line.
  const auto info = std::find_if(lines.begin(), lines.end(), [&](std::string_view l) {
    return Contains(l, dialect.harness_info_label);
  });
  out->verdict = Verdict::Success;
  if (info == lines.end()) {
    SetErr(err, ErrorCode::MalformedMetadata,
           "characterizer " + std::string(test_name) + " printed no metadata line");
    return false;
  }
  return ParseMetadataLine(*info, dialect, &out->meta, err);
}

bool ParseDeclaredParameters(std::string_view output,
                             std::string_view test_name,
                             const HarnessDialect& dialect,
                             const SeverityVocabulary& vocab,
                             std::vector<DeclaredParameter>* out,
                             Error* err) {
  if (!out) return false;
  out->clear();

  const std::string plain = StripAnsi(output);
  if (Contains(plain, dialect.no_tests_marker)) {
    SetErr(err, ErrorCode::NotFound, "the specified test " + std::string(test_name) + " does not exist");
    return false;
  }

  const std::vector<std::string_view> lines = SplitLines(plain);
  for (std::string_view line : lines) {
    const std::vector<std::string_view> tok = Tokenize(line);
    usize k = 0;
    while (k < tok.size() && !Contains(tok[k], dialect.harness_tag)) ++k;
    if (k + 2 >= tok.size() || tok[k + 1] != "-") continue;

    DeclaredParameter p;
    p.name = std::string(tok[k + 2]);

    // "(got v)" in the missing-arguments report, "(defaults to v)" in help.
    for (std::string_view marker : {std::string_view("(got "), std::string_view("(defaults to ")}) {
      const usize at = line.rfind(marker);
      if (at == std::string_view::npos) continue;
      const usize close = line.rfind(')');
      if (close != std::string_view::npos && close > at) {
        p.default_value = std::string(line.substr(at + marker.size(), close - at - marker.size()));
      }
      break;
    }

    const bool seen = std::any_of(out->begin(), out->end(),
                                  [&](const DeclaredParameter& q) { return q.name == p.name; });
    if (!seen) out->push_back(std::move(p));
  }

  if (out->empty()) {
    const std::vector<std::string_view> build_block = CompileErrorBlock(lines, dialect);
    if (HasCaretLine(build_block, dialect.caret)) {
      SetErr(err, ErrorCode::CompileError,
             "the specified test " + std::string(test_name) + " does not compile",
             JoinRelabeled(build_block, dialect, vocab));
      return false;
    }
  }

  EMX_LOG_DEBUG("Probe of", test_name, "declares", out->size(), "parameter(s)");
  return true;
}

std::string DescribeParameters(const std::vector<DeclaredParameter>& params) {
  if (params.empty()) return "(test takes no parameters)";
  std::ostringstream oss;
  for (usize i = 0; i < params.size(); ++i) {
    if (i) oss << '\n';
    oss << "  - " << params[i].name;
    if (params[i].default_value) oss << " (defaults to " << *params[i].default_value << ")";
  }
  return oss.str();
}

}  // namespace harness
}  // namespace emx
