#pragma once
// emx/core/config.h
//
// Run configuration (CLI-friendly).
//
// Convention:
//  - CLI uses --key=value or --key value (e.g., --harness=sbt --timeout_ms 600000).
//  - Tokens that do not start with '-' are positional: the test name followed
//    by the raw sweep arguments (literals, start:stop[:step] ranges, name=value).
//  - A token such as "-3" or "-4:4" is a positional (negative literal/range),
//    not a flag.

#include "emx/core/error.h"
#include "emx/core/logging.h"
#include "emx/core/types.h"

#include <cctype>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace emx {

// How the harness command line is rendered (see harness/harness_runner.h).
enum class HarnessStyle : u8 {
  Sbt = 0,     // program "testOnly <test> -- -D<k>=<v> ..." exit
  Direct = 1,  // program <test> <k>=<v> ...
  Unknown = 255,
};

inline constexpr std::string_view ToString(HarnessStyle s) noexcept {
  switch (s) {
    case HarnessStyle::Sbt: return "sbt";
    case HarnessStyle::Direct: return "direct";
    case HarnessStyle::Unknown: return "unknown";
  }
  return "unknown";
}

inline bool ParseHarnessStyle(std::string_view s, HarnessStyle* out) noexcept {
  if (!out) return false;
  if (detail::EqualsIgnoreCase(s, "sbt")) { *out = HarnessStyle::Sbt; return true; }
  if (detail::EqualsIgnoreCase(s, "direct")) { *out = HarnessStyle::Direct; return true; }
  *out = HarnessStyle::Unknown;
  return false;
}

// --------------------------
// Small key/value argument map
// --------------------------
class ArgMap {
 public:
  ArgMap() = default;

  static ArgMap FromArgv(int argc, char** argv) {
    std::vector<std::string> tokens;
    tokens.reserve(argc > 0 ? static_cast<usize>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
    return FromTokens(tokens);
  }

  static ArgMap FromTokens(const std::vector<std::string>& tokens) {
    ArgMap m;
    for (usize i = 0; i < tokens.size(); ++i) {
      std::string_view token(tokens[i]);
      if (IsPositional(token)) {
        m.positional_.emplace_back(token);
        continue;
      }
      token.remove_prefix(token.rfind("--", 0) == 0 ? 2 : 1);
      const auto eq_pos = token.find('=');
      if (eq_pos != std::string_view::npos) {
        m.kv_[std::string(token.substr(0, eq_pos))] = std::string(token.substr(eq_pos + 1));
        continue;
      }
      // If next arg exists and isn't another flag, treat as value; else as boolean flag = true.
      const std::string key(token);
      if (i + 1 < tokens.size() && IsPositional(tokens[i + 1]) && TakesValue(key)) {
        m.kv_[key] = tokens[i + 1];
        ++i;
      } else {
        m.kv_[key] = "true";
      }
    }
    return m;
  }

  bool Has(std::string_view key) const {
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string_view> Get(std::string_view key) const {
    auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return std::nullopt;
    return std::string_view(it->second);
  }

  const std::vector<std::string>& Positional() const { return positional_; }

 private:
  static bool IsPositional(std::string_view token) {
    if (token.empty() || token[0] != '-') return true;
    return token.size() > 1 && std::isdigit(static_cast<unsigned char>(token[1])) != 0;
  }

  // Boolean switches never consume the following token (it is the test name
  // or a sweep argument).
  static bool TakesValue(std::string_view key) {
    return !(key == "v" || key == "verbose" || key == "h" || key == "help");
  }

  std::unordered_map<std::string, std::string> kv_;
  std::vector<std::string> positional_;
};

namespace detail {

inline bool ParseBool(std::string_view s, bool* out) noexcept {
  if (!out) return false;
  if (s.empty()) return false;
  if (EqualsIgnoreCase(s, "1") || EqualsIgnoreCase(s, "true") || EqualsIgnoreCase(s, "yes") ||
      EqualsIgnoreCase(s, "on")) {
    *out = true;
    return true;
  }
  if (EqualsIgnoreCase(s, "0") || EqualsIgnoreCase(s, "false") || EqualsIgnoreCase(s, "no") ||
      EqualsIgnoreCase(s, "off")) {
    *out = false;
    return true;
  }
  return false;
}

inline bool ParseI64(std::string_view s, i64* out) {
  if (!out) return false;
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    const long long v = std::stoll(std::string(s), &idx, 10);
    if (idx != s.size()) return false;
    *out = static_cast<i64>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

inline bool ParseLogLevel(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  if (EqualsIgnoreCase(s, "trace")) { *out = LogLevel::Trace; return true; }
  if (EqualsIgnoreCase(s, "debug")) { *out = LogLevel::Debug; return true; }
  if (EqualsIgnoreCase(s, "info")) { *out = LogLevel::Info; return true; }
  if (EqualsIgnoreCase(s, "warn") || EqualsIgnoreCase(s, "warning")) { *out = LogLevel::Warn; return true; }
  if (EqualsIgnoreCase(s, "error")) { *out = LogLevel::Error; return true; }
  if (EqualsIgnoreCase(s, "off")) { *out = LogLevel::Off; return true; }
  return false;
}

}  // namespace detail

// --------------------------
// Harness config
// --------------------------
struct HarnessConfig {
  std::string program = "sbt";
  HarnessStyle style = HarnessStyle::Sbt;

  // Working directory of the harness process (the characterizer project root).
  std::string working_dir = ".";

  // Result files live at <working_dir>/<output_root>/<test>/<result_file>.
  std::string output_root = "output";
  std::string result_file = "errors.bin";

  // 0 = wait for the harness indefinitely.
  i64 timeout_ms = 0;

  std::string ResultPath(std::string_view test_name) const {
    namespace fs = std::filesystem;
    return (fs::path(working_dir) / output_root / std::string(test_name) / result_file).string();
  }
};

struct SweepConfig {
  // Forward the harness's own info/warning lines (relabeled) to the log.
  bool verbose = false;
};

struct OutputConfig {
  std::string out_dir = "results";
  std::string report_file = "sweep_report.csv";
};

struct Config {
  HarnessConfig harness;
  SweepConfig sweep;
  OutputConfig output;
  LoggingConfig logging;

  // Test identifier and raw sweep arguments (from positionals).
  std::string test_name;
  std::vector<std::string> args;

  bool Validate(Error* err = nullptr) const {
    auto fail = [&](std::string msg) {
      SetErr(err, ErrorCode::InvalidConfig, std::move(msg));
      return false;
    };

    if (harness.program.empty()) return fail("harness.program must be set");
    if (harness.style == HarnessStyle::Unknown) return fail("harness.style must be sbt or direct");
    if (harness.timeout_ms < 0) return fail("harness.timeout_ms must be >= 0");
    if (harness.result_file.empty()) return fail("harness.result_file must be set");
    if (test_name.empty()) return fail("no test name specified");
    return true;
  }

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss << "{"
        << "\"harness\":{\"program\":\"" << harness.program << "\","
        << "\"style\":\"" << ToString(harness.style) << "\","
        << "\"working_dir\":\"" << harness.working_dir << "\","
        << "\"output_root\":\"" << harness.output_root << "\","
        << "\"result_file\":\"" << harness.result_file << "\","
        << "\"timeout_ms\":" << harness.timeout_ms << "},"
        << "\"sweep\":{\"verbose\":" << (sweep.verbose ? "true" : "false") << "},"
        << "\"output\":{\"out_dir\":\"" << output.out_dir << "\","
        << "\"report_file\":\"" << output.report_file << "\"},"
        << "\"logging\":{\"level\":\"" << ToString(logging.level) << "\"},"
        << "\"test\":\"" << test_name << "\","
        << "\"args\":" << args.size()
        << "}";
    return oss.str();
  }

  // Parse from CLI arguments. Malformed option values fail with InvalidConfig.
  static bool FromArgs(const ArgMap& args, Config* out, Error* err = nullptr) {
    if (!out) return false;
    Config cfg;

    auto bad = [&](std::string_view key, std::string_view val) {
      SetErr(err, ErrorCode::InvalidConfig,
             "invalid value '" + std::string(val) + "' for --" + std::string(key));
      return false;
    };

    // ------------- harness -------------
    if (auto v = args.Get("harness")) cfg.harness.program = std::string(*v);
    if (auto v = args.Get("style")) {
      if (!ParseHarnessStyle(*v, &cfg.harness.style)) return bad("style", *v);
    }
    if (auto v = args.Get("harness_dir")) cfg.harness.working_dir = std::string(*v);
    if (auto v = args.Get("output_root")) cfg.harness.output_root = std::string(*v);
    if (auto v = args.Get("result_file")) cfg.harness.result_file = std::string(*v);
    if (auto v = args.Get("timeout_ms")) {
      if (!detail::ParseI64(*v, &cfg.harness.timeout_ms)) return bad("timeout_ms", *v);
    }

    // ------------- sweep -------------
    if (auto v = args.Get("verbose")) {
      if (!detail::ParseBool(*v, &cfg.sweep.verbose)) return bad("verbose", *v);
    }
    if (args.Has("v")) cfg.sweep.verbose = true;

    // ------------- output -------------
    if (auto v = args.Get("out_dir")) cfg.output.out_dir = std::string(*v);
    if (auto v = args.Get("report_file")) cfg.output.report_file = std::string(*v);

    // ------------- logging -------------
    if (auto v = args.Get("log_level")) {
      if (!detail::ParseLogLevel(*v, &cfg.logging.level)) return bad("log_level", *v);
    }
    if (auto v = args.Get("log_timestamp")) {
      if (!detail::ParseBool(*v, &cfg.logging.with_timestamp)) return bad("log_timestamp", *v);
    }

    // ------------- positionals -------------
    const auto& pos = args.Positional();
    if (!pos.empty()) {
      cfg.test_name = pos.front();
      cfg.args.assign(pos.begin() + 1, pos.end());
    }

    *out = std::move(cfg);
    return true;
  }
};

}  // namespace emx
