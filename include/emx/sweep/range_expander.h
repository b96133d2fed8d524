#pragma once
// emx/sweep/range_expander.h
//
// Sweep-argument ranges: "start:stop" or "start:stop:step" (integers with an
// optional leading sign).
//
// Semantics:
//   - Two-part form: step is +1, or -1 when stop < start.
//   - Three-part form: explicit step whose sign must agree with the direction
//     from start to stop; a zero step is rejected.
//   - In both forms the sequence runs over the half-open interval
//     [start, stop + step), so `stop` itself is included when it lies on the
//     step grid ("0:10:2" -> 0 2 4 6 8 10, "4:0" -> 4 3 2 1 0).
//   - A token without ':' is a literal scalar, not a range.

#include "emx/core/error.h"
#include "emx/core/types.h"

#include <string>
#include <string_view>

namespace emx {
namespace sweep {

inline constexpr char kRangeSeparator = ':';

class IntRange;

// Parse a range token. Failures:
//   InvalidRangeComponent : start/stop/step is not an integer (message names it)
//   InvalidRange          : wrong number of parts, zero step, step sign
//                           disagreeing with the direction, or overflow
bool ParseRange(std::string_view token, IntRange* out, Error* err = nullptr);

class IntRange {
 public:
  IntRange() = default;

  i64 start() const noexcept { return start_; }
  i64 stop() const noexcept { return stop_; }
  i64 step() const noexcept { return step_; }

  // Exclusive bound (stop + step).
  i64 end() const noexcept { return end_; }

  usize Size() const noexcept;

  // The i-th element; requires i < Size().
  i64 At(usize i) const noexcept;

  std::string ToString() const;

 private:
  friend bool ParseRange(std::string_view token, IntRange* out, Error* err);

  i64 start_ = 0;
  i64 stop_ = 0;
  i64 step_ = 1;
  i64 end_ = 1;
};

// True if the token has the shape of a range (contains the separator).
inline bool IsRangeToken(std::string_view token) noexcept {
  return token.find(kRangeSeparator) != std::string_view::npos;
}

}  // namespace sweep
}  // namespace emx
