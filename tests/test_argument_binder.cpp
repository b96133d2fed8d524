// tests/test_argument_binder.cpp
//
// Binding of sweep tokens to declared parameters: positional, named and
// defaulted values, and each binding error.

#include "emx/core/error.h"
#include "emx/core/types.h"
#include "emx/harness/output_classifier.h"
#include "emx/sweep/argument_binder.h"

#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb,
               const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)

using emx::ErrorCode;
using emx::harness::DeclaredParameter;
using emx::sweep::BindArguments;
using emx::sweep::BoundArgument;

std::vector<DeclaredParameter> Declared() {
  std::vector<DeclaredParameter> d(3);
  d[0].name = "width";
  d[1].name = "approxWidth";
  d[2].name = "depth";
  d[2].default_value = "2";
  return d;
}

static void TestPositionalAndDefault(TestContext& t) {
  std::vector<BoundArgument> bound;
  emx::Error err;
  CHECK(t, BindArguments(Declared(), {"16", "4:8"}, &bound, &err));
  CHECK_EQ(t, bound.size(), static_cast<emx::usize>(3));
  if (bound.size() != 3) return;

  CHECK_EQ(t, bound[0].name, std::string("width"));
  CHECK_EQ(t, bound[0].raw, std::string("16"));
  CHECK(t, !bound[0].is_range);

  CHECK_EQ(t, bound[1].name, std::string("approxWidth"));
  CHECK(t, bound[1].is_range);
  CHECK_EQ(t, bound[1].range.Size(), static_cast<emx::usize>(5));

  CHECK_EQ(t, bound[2].raw, std::string("2"));
  CHECK(t, bound[2].source == BoundArgument::Source::Default);
}

static void TestNamedBinding(TestContext& t) {
  std::vector<BoundArgument> bound;
  emx::Error err;
  // Named tokens may appear in any order; positionals fill the remaining slots.
  CHECK(t, BindArguments(Declared(), {"depth=3", "approxWidth=-2:2", "32"}, &bound, &err));
  if (bound.size() != 3) {
    CHECK(t, false);
    return;
  }
  CHECK_EQ(t, bound[0].raw, std::string("32"));
  CHECK(t, bound[0].source == BoundArgument::Source::Positional);
  CHECK(t, bound[1].is_range);
  CHECK_EQ(t, bound[1].range.start(), static_cast<emx::i64>(-2));
  CHECK_EQ(t, bound[2].raw, std::string("3"));
  CHECK(t, bound[2].source == BoundArgument::Source::Named);

  // Negative literals stay positional.
  CHECK(t, BindArguments(Declared(), {"-4", "-1"}, &bound, &err));
  CHECK_EQ(t, bound[0].raw, std::string("-4"));
  CHECK_EQ(t, bound[1].raw, std::string("-1"));
}

static void TestSurplusPositionalsIgnored(TestContext& t) {
  std::vector<BoundArgument> bound;
  emx::Error err;
  CHECK(t, BindArguments(Declared(), {"1", "2", "3", "4", "5"}, &bound, &err));
  CHECK_EQ(t, bound.size(), static_cast<emx::usize>(3));
  if (bound.size() == 3) CHECK_EQ(t, bound[2].raw, std::string("3"));
}

static void TestBindingErrors(TestContext& t) {
  std::vector<BoundArgument> bound;
  emx::Error err;

  CHECK(t, !BindArguments(Declared(), {"16"}, &bound, &err));
  CHECK_EQ(t, err.code, ErrorCode::MissingArgument);
  CHECK(t, err.message.find("approxWidth") != std::string::npos);
  // Expected parameters are listed for the user.
  CHECK(t, err.detail.find("width") != std::string::npos);
  CHECK(t, err.detail.find("depth (defaults to 2)") != std::string::npos);

  err.Clear();
  CHECK(t, !BindArguments(Declared(), {"16", "8", "size=4"}, &bound, &err));
  CHECK_EQ(t, err.code, ErrorCode::UnknownNamedArgument);
  CHECK(t, !err.detail.empty());

  err.Clear();
  CHECK(t, !BindArguments(Declared(), {"depth=1", "depth=2", "16", "8"}, &bound, &err));
  CHECK_EQ(t, err.code, ErrorCode::DuplicateNamedArgument);

  // Rebinding a slot that a positional already filled.
  err.Clear();
  CHECK(t, !BindArguments(Declared(), {"16", "width=8", "4"}, &bound, &err));
  CHECK_EQ(t, err.code, ErrorCode::DuplicateNamedArgument);
  CHECK(t, !err.detail.empty());

  err.Clear();
  CHECK(t, !BindArguments(Declared(), {"16", "0:10:-1"}, &bound, &err));
  CHECK_EQ(t, err.code, ErrorCode::InvalidRange);
  CHECK(t, err.message.find("approxWidth") != std::string::npos);

  err.Clear();
  CHECK(t, !BindArguments(Declared(), {"16", "x:4"}, &bound, &err));
  CHECK_EQ(t, err.code, ErrorCode::InvalidRangeComponent);
}

static void TestNoParameters(TestContext& t) {
  std::vector<BoundArgument> bound;
  emx::Error err;
  CHECK(t, BindArguments({}, {}, &bound, &err));
  CHECK(t, bound.empty());
}

}  // namespace

int main() {
  TestContext t;

  TestPositionalAndDefault(t);
  TestNamedBinding(t);
  TestSurplusPositionalsIgnored(t);
  TestBindingErrors(t);
  TestNoParameters(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_argument_binder\n";
    return 0;
  }
  std::cerr << "[FAILED] test_argument_binder: " << t.fails << " failure(s)\n";
  return 1;
}
