// src/sweep/range_expander.cpp

#include "emx/sweep/range_expander.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <vector>

namespace emx {
namespace sweep {

namespace {

// Strict integer parse: optional sign, digits only, no surrounding spaces.
bool ParseStrictI64(std::string_view s, i64* out) {
  if (s.empty()) return false;
  usize i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (usize k = i; k < s.size(); ++k) {
    if (s[k] < '0' || s[k] > '9') return false;
  }
  const std::string tmp(s);
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(tmp.c_str(), &end, 10);
  if (errno == ERANGE || end != tmp.c_str() + tmp.size()) return false;
  *out = static_cast<i64>(v);
  return true;
}

std::vector<std::string_view> SplitParts(std::string_view token) {
  std::vector<std::string_view> parts;
  usize start = 0;
  while (true) {
    const usize pos = token.find(kRangeSeparator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(token.substr(start));
      break;
    }
    parts.push_back(token.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

}  // namespace

usize IntRange::Size() const noexcept {
  // Work in unsigned 64-bit: end_ - start_ may not fit in i64.
  if (step_ > 0) {
    if (end_ <= start_) return 0;
    const u64 span = static_cast<u64>(end_) - static_cast<u64>(start_);
    const u64 st = static_cast<u64>(step_);
    return static_cast<usize>((span + st - 1) / st);
  }
  if (end_ >= start_) return 0;
  const u64 span = static_cast<u64>(start_) - static_cast<u64>(end_);
  const u64 st = static_cast<u64>(0) - static_cast<u64>(step_);
  return static_cast<usize>((span + st - 1) / st);
}

i64 IntRange::At(usize i) const noexcept {
  return static_cast<i64>(static_cast<u64>(start_) + static_cast<u64>(i) * static_cast<u64>(step_));
}

std::string IntRange::ToString() const {
  std::ostringstream oss;
  oss << start_ << ':' << stop_ << ':' << step_;
  return oss.str();
}

bool ParseRange(std::string_view token, IntRange* out, Error* err) {
  if (!out) return false;

  const std::vector<std::string_view> parts = SplitParts(token);
  if (parts.size() != 2 && parts.size() != 3) {
    SetErr(err, ErrorCode::InvalidRange,
           "got invalid range-type argument '" + std::string(token) + "', expected start:stop[:step]");
    return false;
  }

  static constexpr const char* kLabels[] = {"start", "stop", "step"};
  i64 ints[3] = {0, 0, 0};
  for (usize i = 0; i < parts.size(); ++i) {
    if (!ParseStrictI64(parts[i], &ints[i])) {
      SetErr(err, ErrorCode::InvalidRangeComponent,
             std::string("got invalid ") + kLabels[i] + " part '" + std::string(parts[i]) +
                 "' in range-type argument '" + std::string(token) + "'");
      return false;
    }
  }

  const i64 start = ints[0];
  const i64 stop = ints[1];
  i64 step = 0;
  if (parts.size() == 2) {
    step = (stop < start) ? -1 : 1;
  } else {
    step = ints[2];
    if (step == 0 || (stop < start && step > 0) || (stop > start && step < 0)) {
      SetErr(err, ErrorCode::InvalidRange,
             "got malformed range(" + std::to_string(start) + ", " + std::to_string(stop) + ", " +
                 std::to_string(step) + ") in argument '" + std::string(token) + "'");
      return false;
    }
  }

  if ((step > 0 && stop > std::numeric_limits<i64>::max() - step) ||
      (step < 0 && stop < std::numeric_limits<i64>::min() - step)) {
    SetErr(err, ErrorCode::InvalidRange,
           "range bound overflows 64-bit integers in argument '" + std::string(token) + "'");
    return false;
  }

  IntRange r;
  r.start_ = start;
  r.stop_ = stop;
  r.step_ = step;
  r.end_ = stop + step;
  *out = r;
  return true;
}

}  // namespace sweep
}  // namespace emx
