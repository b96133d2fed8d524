#pragma once
// emx/core/error.h
//
// Error reporting for fallible operations.
//
// Convention (project-wide):
//  - Functions that can fail return bool (or a nullable pointer) and take an
//    optional `Error* err` out-parameter as their last argument.
//  - On failure the callee fills code/message, and `detail` when there is a
//    multi-line block worth surfacing (harness diagnostics, expected parameters).
//  - Nothing is thrown across module boundaries.

#include "emx/core/types.h"

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace emx {

enum class ErrorCode : u8 {
  Ok = 0,

  // Binary result protocol
  MalformedHeader,
  SizeMismatch,

  // Sweep arguments
  InvalidRange,
  InvalidRangeComponent,

  // Argument binding
  MissingArgument,
  DuplicateNamedArgument,
  UnknownNamedArgument,

  // Harness classification
  NotFound,
  CompileError,
  DidNotExecute,
  RuntimeError,
  UnsupportedModule,
  MalformedMetadata,

  // Harness plumbing
  ResultFileUnavailable,
  HarnessLaunchFailed,
  HarnessTimeout,

  InvalidConfig,
  OutputWriteFailed,
};

inline constexpr std::string_view ToString(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::Ok: return "ok";
    case ErrorCode::MalformedHeader: return "malformed_header";
    case ErrorCode::SizeMismatch: return "size_mismatch";
    case ErrorCode::InvalidRange: return "invalid_range";
    case ErrorCode::InvalidRangeComponent: return "invalid_range_component";
    case ErrorCode::MissingArgument: return "missing_argument";
    case ErrorCode::DuplicateNamedArgument: return "duplicate_named_argument";
    case ErrorCode::UnknownNamedArgument: return "unknown_named_argument";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::CompileError: return "compile_error";
    case ErrorCode::DidNotExecute: return "did_not_execute";
    case ErrorCode::RuntimeError: return "runtime_error";
    case ErrorCode::UnsupportedModule: return "unsupported_module";
    case ErrorCode::MalformedMetadata: return "malformed_metadata";
    case ErrorCode::ResultFileUnavailable: return "result_file_unavailable";
    case ErrorCode::HarnessLaunchFailed: return "harness_launch_failed";
    case ErrorCode::HarnessTimeout: return "harness_timeout";
    case ErrorCode::InvalidConfig: return "invalid_config";
    case ErrorCode::OutputWriteFailed: return "output_write_failed";
  }
  return "unknown";
}

struct Error {
  ErrorCode code = ErrorCode::Ok;
  std::string message;
  std::string detail;

  bool ok() const noexcept { return code == ErrorCode::Ok; }

  void Clear() {
    code = ErrorCode::Ok;
    message.clear();
    detail.clear();
  }

  // "<code>: <message>" followed by the detail block on its own lines.
  std::string ToString() const {
    std::string out(emx::ToString(code));
    out += ": ";
    out += message;
    if (!detail.empty()) {
      out += "\n";
      out += detail;
    }
    return out;
  }
};

inline std::ostream& operator<<(std::ostream& os, ErrorCode c) {
  os << ToString(c);
  return os;
}

inline void SetErr(Error* err, ErrorCode code, std::string msg, std::string detail = {}) {
  if (!err) return;
  err->code = code;
  err->message = std::move(msg);
  err->detail = std::move(detail);
}

}  // namespace emx
