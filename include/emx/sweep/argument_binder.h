#pragma once
// emx/sweep/argument_binder.h
//
// Binding of raw sweep arguments to the parameters a test declares.
//
// Tokens are either positional ("32", "4:16:4") or named ("width=32",
// "width=4:16:4"). Rules:
//   - positional tokens fill the declared parameters in order; surplus
//     positionals are ignored (logged at Warn)
//   - a named token must name a declared parameter (UnknownNamedArgument) and
//     may bind each parameter only once, also counting positional binding
//     (DuplicateNamedArgument)
//   - unbound parameters take their default, else MissingArgument
// Every binding error carries the listing of expected parameters in
// err->detail.
//
// Each bound value is then classified as a literal or a range
// (sweep/range_expander.h).

#include "emx/core/error.h"
#include "emx/core/types.h"
#include "emx/harness/output_classifier.h"
#include "emx/sweep/range_expander.h"

#include <string>
#include <vector>

namespace emx {
namespace sweep {

struct BoundArgument {
  std::string name;
  std::string raw;  // token text as bound (value part for named tokens)

  enum class Source : u8 { Positional, Named, Default } source = Source::Positional;

  bool is_range = false;
  IntRange range;  // valid when is_range
};

bool BindArguments(const std::vector<harness::DeclaredParameter>& declared,
                   const std::vector<std::string>& tokens,
                   std::vector<BoundArgument>* out,
                   Error* err = nullptr);

}  // namespace sweep
}  // namespace emx
