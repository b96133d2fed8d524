// src/sweep/argument_binder.cpp

#include "emx/sweep/argument_binder.h"

#include "emx/core/logging.h"

#include <optional>
#include <utility>

namespace emx {
namespace sweep {

namespace {

// "name=value" with a non-empty name made of identifier characters. A bare
// literal such as "-3" or a range never matches.
bool SplitNamed(std::string_view token, std::string_view* name, std::string_view* value) {
  const usize eq = token.find('=');
  if (eq == std::string_view::npos || eq == 0) return false;
  const std::string_view key = token.substr(0, eq);
  for (char c : key) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '.' || c == '-';
    if (!ok) return false;
  }
  *name = key;
  *value = token.substr(eq + 1);
  return true;
}

}  // namespace

bool BindArguments(const std::vector<harness::DeclaredParameter>& declared,
                   const std::vector<std::string>& tokens,
                   std::vector<BoundArgument>* out,
                   Error* err) {
  if (!out) return false;
  out->clear();

  const std::string expected = "expected parameters:\n" + harness::DescribeParameters(declared);

  std::vector<std::optional<BoundArgument>> slots(declared.size());
  auto index_of = [&](std::string_view name) -> usize {
    for (usize i = 0; i < declared.size(); ++i) {
      if (declared[i].name == name) return i;
    }
    return declared.size();
  };

  usize next_positional = 0;
  usize ignored = 0;
  for (const std::string& token : tokens) {
    std::string_view name, value;
    if (SplitNamed(token, &name, &value)) {
      const usize idx = index_of(name);
      if (idx == declared.size()) {
        SetErr(err, ErrorCode::UnknownNamedArgument,
               "named argument '" + std::string(name) + "' does not match any parameter", expected);
        return false;
      }
      if (slots[idx]) {
        SetErr(err, ErrorCode::DuplicateNamedArgument,
               "parameter '" + std::string(name) + "' is bound more than once (already '" +
                   slots[idx]->raw + "')",
               expected);
        return false;
      }
      BoundArgument b;
      b.name = declared[idx].name;
      b.raw = std::string(value);
      b.source = BoundArgument::Source::Named;
      slots[idx] = std::move(b);
      continue;
    }

    // Positional: next slot in declared order that is still free.
    while (next_positional < slots.size() && slots[next_positional]) ++next_positional;
    if (next_positional == slots.size()) {
      ++ignored;
      continue;
    }
    BoundArgument b;
    b.name = declared[next_positional].name;
    b.raw = token;
    b.source = BoundArgument::Source::Positional;
    slots[next_positional] = std::move(b);
  }
  if (ignored > 0) {
    EMX_LOG_WARN("Ignoring", ignored, "surplus positional argument(s)");
  }

  for (usize i = 0; i < slots.size(); ++i) {
    if (slots[i]) continue;
    if (!declared[i].default_value) {
      SetErr(err, ErrorCode::MissingArgument, "missing argument for parameter '" + declared[i].name + "'",
             expected);
      return false;
    }
    BoundArgument b;
    b.name = declared[i].name;
    b.raw = *declared[i].default_value;
    b.source = BoundArgument::Source::Default;
    slots[i] = std::move(b);
  }

  out->reserve(slots.size());
  for (auto& slot : slots) {
    BoundArgument b = std::move(*slot);
    if (b.source != BoundArgument::Source::Default && IsRangeToken(b.raw)) {
      if (!ParseRange(b.raw, &b.range, err)) {
        if (err) err->message = "parameter '" + b.name + "': " + err->message;
        return false;
      }
      b.is_range = true;
    }
    out->push_back(std::move(b));
  }
  return true;
}

}  // namespace sweep
}  // namespace emx
