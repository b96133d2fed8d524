#pragma once
// emx/core/timer.h
//
// Monotonic timing for harness runs: a Stopwatch for elapsed wall time and a
// Deadline for the optional per-run timeout.

#include "emx/core/types.h"

#include <algorithm>
#include <chrono>
#include <limits>

namespace emx {

class Stopwatch {
 public:
  using Clock = std::chrono::steady_clock;

  Stopwatch() : start_(Clock::now()) {}

  double ElapsedMillis() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
  }

 private:
  Clock::time_point start_;
};

// budget_ms <= 0 means no deadline.
class Deadline {
 public:
  explicit Deadline(i64 budget_ms) : budget_ms_(budget_ms) {}

  bool Bounded() const noexcept { return budget_ms_ > 0; }

  bool Expired() const { return Bounded() && sw_.ElapsedMillis() >= static_cast<double>(budget_ms_); }

  // Milliseconds left, as a poll(2) timeout: -1 when unbounded, 0 when expired.
  int PollTimeoutMs() const {
    if (!Bounded()) return -1;
    const double left = static_cast<double>(budget_ms_) - sw_.ElapsedMillis();
    if (left <= 0.0) return 0;
    const double capped = std::min(left + 1.0, static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(capped);
  }

 private:
  i64 budget_ms_;
  Stopwatch sw_;
};

}  // namespace emx
