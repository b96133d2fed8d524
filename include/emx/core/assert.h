#pragma once
// emx/core/assert.h
//
// Always-on checks for internal invariants. User input and harness output are
// never checked this way; they fail through emx::Error.
//
// A failed check is logged at Error level (one record, with file/line) and the
// process aborts.

#include "emx/core/logging.h"

#include <cstdlib>
#include <sstream>
#include <string>

namespace emx {
namespace detail {

[[noreturn]] inline void InvariantFailed(const char* file, int line, const std::string& what) {
  Logger::Instance().Log(LogLevel::Error, "invariant violated at", std::string(file) + ":" + std::to_string(line),
                         "--", what);
  std::abort();
}

template <class A, class B>
[[noreturn]] void ComparisonFailed(const char* file, int line, const char* text, const A& lhs, const B& rhs) {
  std::ostringstream oss;
  oss << text << " (" << lhs << " vs " << rhs << ")";
  InvariantFailed(file, line, oss.str());
}

}  // namespace detail
}  // namespace emx

#define EMX_ASSERT(cond)                                                   \
  do {                                                                     \
    if (!(cond)) ::emx::detail::InvariantFailed(__FILE__, __LINE__, #cond); \
  } while (0)

#define EMX_UNREACHABLE() ::emx::detail::InvariantFailed(__FILE__, __LINE__, "unreachable code")

#define EMX_CHECK_EQ(a, b)                                                               \
  do {                                                                                   \
    const auto& emx_lhs_ = (a);                                                          \
    const auto& emx_rhs_ = (b);                                                          \
    if (!(emx_lhs_ == emx_rhs_)) {                                                       \
      ::emx::detail::ComparisonFailed(__FILE__, __LINE__, #a " == " #b, emx_lhs_, emx_rhs_); \
    }                                                                                    \
  } while (0)
