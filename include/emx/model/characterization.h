#pragma once
// emx/model/characterization.h
//
// In-memory shapes of one harness run (one sweep point).
//
// A CharacterizationResult is created by the orchestrator right after the
// result file was decoded and is never mutated afterwards. The payload is one
// of three variants, selected by the characterization kind the harness reported:
//   - ExhaustiveErrors : full 2^w x 2^w grid of signed errors, row = operand A
//   - Random2DErrors   : exact result value -> sampled errors for that result
//   - Random3DErrors   : (operand A, operand B) -> representative error

#include "emx/core/types.h"

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace emx {

struct ExhaustiveErrors {
  i32 width = 0;
  std::vector<i64> cells;  // row-major, Side() * Side() entries

  usize Side() const noexcept { return static_cast<usize>(1) << width; }

  i64 At(usize a, usize b) const { return cells[a * Side() + b]; }
};

struct Random2DErrors {
  std::map<i64, std::vector<i64>> samples;
};

struct Random3DErrors {
  std::map<std::pair<i64, i64>, i64> errors;
};

using ResultData = std::variant<ExhaustiveErrors, Random2DErrors, Random3DErrors>;

inline CharacterizationKind KindOf(const ResultData& data) noexcept {
  switch (data.index()) {
    case 0: return CharacterizationKind::Exhaustive;
    case 1: return CharacterizationKind::Random2D;
    case 2: return CharacterizationKind::Random3D;
    default: return CharacterizationKind::Unknown;
  }
}

struct CharacterizationResult {
  std::string name;  // test identifier
  bool is_signed = false;
  i32 bit_width = 0;
  ModuleKind module = ModuleKind::Unknown;

  // Bound parameter values in declared positional order, with their names.
  std::vector<std::string> params;
  std::vector<std::string> param_names;

  ResultData data;

  // Wall time of the harness invocation that produced this result.
  double elapsed_ms = 0.0;

  CharacterizationKind kind() const noexcept { return KindOf(data); }

  // Number of decoded entries (grid cells, result keys, or operand pairs).
  usize EntryCount() const {
    if (const auto* ex = std::get_if<ExhaustiveErrors>(&data)) return ex->cells.size();
    if (const auto* r2 = std::get_if<Random2DErrors>(&data)) return r2->samples.size();
    if (const auto* r3 = std::get_if<Random3DErrors>(&data)) return r3->errors.size();
    return 0;
  }
};

// Positions of `params` whose value is not the same across every result of a
// batch. Downstream artifacts use these to get distinct names per sweep point.
std::vector<usize> DifferingParameterIndices(const std::vector<CharacterizationResult>& results);

// "<module>_<params[i0]>_<params[i1]>..." for the given indices.
std::string ModelLabel(const CharacterizationResult& result, const std::vector<usize>& indices);

}  // namespace emx
