#pragma once
// emx/core/logging.h
//
// Process-wide logger. Arguments are joined with single spaces:
//   EMX_LOG_INFO("Running", test, point.ToString());
//
// Record layout:
//   [HH:MM:SS.mmm ][tid ]LEVEL [tag] message
// The tag marks text that did not originate here, e.g. forwarded harness
// output ("harness"). Default sink is stderr.

#include "emx/core/types.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace emx {

enum class LogLevel : u8 { Trace = 0, Debug, Info, Warn, Error, Off };

inline constexpr std::string_view ToString(LogLevel lvl) noexcept {
  constexpr std::string_view kNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
  const auto i = static_cast<usize>(lvl);
  return i < 6 ? kNames[i] : std::string_view("UNKNOWN");
}

struct LoggingConfig {
  LogLevel level = LogLevel::Info;
  bool with_timestamp = true;
  bool with_thread_id = false;
};

class Logger {
 public:
  static Logger& Instance() {
    static Logger inst;
    return inst;
  }

  void SetConfig(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
    level_.store(cfg.level, std::memory_order_relaxed);
  }

  void SetLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
  LogLevel Level() const { return level_.load(std::memory_order_relaxed); }

  bool Enabled(LogLevel lvl) const {
    const LogLevel cur = Level();
    return cur != LogLevel::Off && lvl >= cur;
  }

  // Caller keeps ownership; nullptr restores stderr.
  void SetOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lk(mu_);
    out_ = out ? out : &std::cerr;
  }

  template <class... Args>
  void Log(LogLevel lvl, Args&&... args) {
    if (!Enabled(lvl)) return;
    std::ostringstream body;
    bool first = true;
    ((body << (first ? "" : " ") << std::forward<Args>(args), first = false), ...);
    Write(lvl, {}, body.str());
  }

  // One record per line of `block`; blank lines are dropped.
  void LogBlock(LogLevel lvl, std::string_view block, std::string_view tag = {}) {
    if (!Enabled(lvl)) return;
    usize start = 0;
    while (start < block.size()) {
      usize nl = block.find('\n', start);
      if (nl == std::string_view::npos) nl = block.size();
      std::string_view line = block.substr(start, nl - start);
      if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
      if (!line.empty()) Write(lvl, tag, line);
      start = nl + 1;
    }
  }

 private:
  Logger() = default;

  void Write(LogLevel lvl, std::string_view tag, std::string_view body) {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream rec;
    if (cfg_.with_timestamp) {
      const auto now = std::chrono::system_clock::now();
      const auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
      const std::time_t t = std::chrono::system_clock::to_time_t(now);
      std::tm tm{};
      localtime_r(&t, &tm);
      rec << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << ' ';
    }
    if (cfg_.with_thread_id) rec << std::this_thread::get_id() << ' ';
    rec << ToString(lvl) << ' ';
    if (!tag.empty()) rec << '[' << tag << "] ";
    rec << body << '\n';
    (*out_) << rec.str() << std::flush;
  }

  std::atomic<LogLevel> level_{LogLevel::Info};
  LoggingConfig cfg_{};
  std::ostream* out_ = &std::cerr;
  mutable std::mutex mu_;
};

#define EMX_LOG_TRACE(...) ::emx::Logger::Instance().Log(::emx::LogLevel::Trace, __VA_ARGS__)
#define EMX_LOG_DEBUG(...) ::emx::Logger::Instance().Log(::emx::LogLevel::Debug, __VA_ARGS__)
#define EMX_LOG_INFO(...) ::emx::Logger::Instance().Log(::emx::LogLevel::Info, __VA_ARGS__)
#define EMX_LOG_WARN(...) ::emx::Logger::Instance().Log(::emx::LogLevel::Warn, __VA_ARGS__)
#define EMX_LOG_ERROR(...) ::emx::Logger::Instance().Log(::emx::LogLevel::Error, __VA_ARGS__)

}  // namespace emx
