#pragma once
// emx/model/error_model.h
//
// Closed-form error models synthesized from a CharacterizationResult, and the
// reference evaluator that reproduces the approximate operator from a model.
//
// Variant mapping:
//   Exhaustive -> ExactLookupModel          (grid reused as-is)
//   Random2D   -> SegmentedRegressionModel  (slope/intercept per result domain)
//   Random3D   -> SegmentedMedModel         (mean error per operand-domain cell)
//
// Domains are the two most-significant bits of a value relative to the bit
// width: d = (v >> (w - 2)) & 3, with the shift clamped at 0 for w < 2.

#include "emx/core/types.h"
#include "emx/model/characterization.h"

#include <array>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace emx {
namespace model {

inline constexpr i32 kDomainBits = 2;
inline constexpr usize kDomainCount = static_cast<usize>(1) << kDomainBits;

enum class ModelKind : u8 {
  ExactLookup = 0,
  SegmentedRegression = 1,
  SegmentedMed = 2,
};

inline constexpr std::string_view ToString(ModelKind k) noexcept {
  switch (k) {
    case ModelKind::ExactLookup: return "exact_lookup";
    case ModelKind::SegmentedRegression: return "segmented_regression";
    case ModelKind::SegmentedMed: return "segmented_med";
    default: return "unknown";
  }
}

inline std::ostream& operator<<(std::ostream& os, ModelKind k) {
  os << ToString(k);
  return os;
}

struct ExactLookupModel {
  ExhaustiveErrors grid;
};

struct RegressionSegment {
  double slope = 0.0;
  double intercept = 0.0;
  usize keys = 0;        // distinct result keys in this domain
  bool fitted = false;   // false: no keys observed, coefficients are (0, 0)
};

struct SegmentedRegressionModel {
  std::array<RegressionSegment, kDomainCount> segments{};
};

struct SegmentedMedModel {
  // [domain of operand A][domain of operand B]
  std::array<std::array<double, kDomainCount>, kDomainCount> med{};
  std::array<std::array<usize, kDomainCount>, kDomainCount> count{};
};

using ModelData = std::variant<ExactLookupModel, SegmentedRegressionModel, SegmentedMedModel>;

struct ErrorModel {
  // Origin metadata, copied from the result the model was derived from.
  std::string name;
  bool is_signed = false;
  i32 bit_width = 0;
  ModuleKind module = ModuleKind::Unknown;
  std::vector<std::string> params;

  ModelData data;

  ModelKind kind() const noexcept { return static_cast<ModelKind>(data.index()); }
};

// Domain index of `value` for a `width`-bit quantity.
inline usize DomainOf(i64 value, i32 width) noexcept {
  const i32 shift = (width > kDomainBits) ? (width - kDomainBits) : 0;
  return static_cast<usize>((static_cast<u64>(value) >> shift) & (kDomainCount - 1));
}

// Deterministic: identical input always yields identical coefficients.
ErrorModel SynthesizeModel(const CharacterizationResult& result);

std::vector<ErrorModel> SynthesizeModels(const std::vector<CharacterizationResult>& results);

// Output of the approximate operator for operands (a, b) as described by
// `model`. Operands are taken modulo 2^w. Signed models return the
// sign-extended w-bit value, unsigned models the masked value.
i64 ApplyModel(const ErrorModel& model, i64 a, i64 b);

// One-line description for logs: kind plus per-segment coefficients.
std::string Summarize(const ErrorModel& model);

}  // namespace model
}  // namespace emx
