// src/model/model_synthesizer.cpp

#include "emx/model/error_model.h"

#include "emx/core/assert.h"
#include "emx/core/logging.h"
#include "emx/core/stats.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace emx {
namespace model {

namespace {

u64 WidthMask(i32 width) noexcept {
  if (width >= 64) return ~static_cast<u64>(0);
  if (width <= 0) return 0;
  return (static_cast<u64>(1) << width) - 1;
}

i64 SignExtend(u64 v, i32 width) noexcept {
  if (width <= 0 || width >= 64) return static_cast<i64>(v);
  const u64 sign = static_cast<u64>(1) << (width - 1);
  return static_cast<i64>((v ^ sign) - sign);
}

// Masked w-bit result to the value the model reports.
i64 Finish(u64 raw, const ErrorModel& m) noexcept {
  const u64 v = raw & WidthMask(m.bit_width);
  return m.is_signed ? SignExtend(v, m.bit_width) : static_cast<i64>(v);
}

// C-style truncation toward zero, saturated at the i64 range.
i64 Trunc(double x) noexcept {
  if (!std::isfinite(x)) return 0;
  if (x >= 9.2233720368547758e18) return std::numeric_limits<i64>::max();
  if (x <= -9.2233720368547758e18) return std::numeric_limits<i64>::min();
  return static_cast<i64>(x);
}

ExactLookupModel FromExhaustive(const ExhaustiveErrors& grid) {
  ExactLookupModel m;
  m.grid = grid;
  return m;
}

SegmentedRegressionModel FromRandom2D(const Random2DErrors& data, i32 width, const std::string& name) {
  std::array<LinearFit, kDomainCount> fits;
  for (const auto& [key, samples] : data.samples) {
    if (samples.empty()) continue;
    OnlineStats st;
    for (i64 s : samples) st.Push(static_cast<double>(s));
    fits[DomainOf(key, width)].Push(static_cast<double>(key), st.Mean());
  }

  SegmentedRegressionModel m;
  for (usize d = 0; d < kDomainCount; ++d) {
    RegressionSegment& seg = m.segments[d];
    seg.keys = fits[d].Count();
    if (seg.keys == 0) {
      EMX_LOG_WARN("Regression domain", d, "of", name, "has no samples; using zero coefficients");
      continue;
    }
    seg.slope = fits[d].Slope();
    seg.intercept = fits[d].Intercept();
    seg.fitted = true;
  }
  return m;
}

SegmentedMedModel FromRandom3D(const Random3DErrors& data, i32 width) {
  std::array<std::array<OnlineStats, kDomainCount>, kDomainCount> cells;
  for (const auto& [operands, error] : data.errors) {
    cells[DomainOf(operands.first, width)][DomainOf(operands.second, width)].Push(
        static_cast<double>(error));
  }

  SegmentedMedModel m;
  for (usize i = 0; i < kDomainCount; ++i) {
    for (usize j = 0; j < kDomainCount; ++j) {
      m.count[i][j] = cells[i][j].Count();
      m.med[i][j] = cells[i][j].Mean();
    }
  }
  return m;
}

}  // namespace

ErrorModel SynthesizeModel(const CharacterizationResult& result) {
  ErrorModel model;
  model.name = result.name;
  model.is_signed = result.is_signed;
  model.bit_width = result.bit_width;
  model.module = result.module;
  model.params = result.params;

  switch (result.kind()) {
    case CharacterizationKind::Exhaustive:
      model.data = FromExhaustive(std::get<ExhaustiveErrors>(result.data));
      break;
    case CharacterizationKind::Random2D:
      model.data = FromRandom2D(std::get<Random2DErrors>(result.data), result.bit_width, result.name);
      break;
    case CharacterizationKind::Random3D:
      model.data = FromRandom3D(std::get<Random3DErrors>(result.data), result.bit_width);
      break;
    default:
      EMX_UNREACHABLE();
  }

  EMX_LOG_DEBUG("Synthesized", ToString(model.kind()), "for", result.name, "from", result.EntryCount(),
                "entries");
  return model;
}

std::vector<ErrorModel> SynthesizeModels(const std::vector<CharacterizationResult>& results) {
  std::vector<ErrorModel> out;
  out.reserve(results.size());
  for (const auto& r : results) out.push_back(SynthesizeModel(r));
  return out;
}

i64 ApplyModel(const ErrorModel& model, i64 a, i64 b) {
  const u64 mask = WidthMask(model.bit_width);
  const u64 ua = static_cast<u64>(a) & mask;
  const u64 ub = static_cast<u64>(b) & mask;
  const u64 exact = ((model.module == ModuleKind::Multiplier) ? ua * ub : ua + ub) & mask;

  if (const auto* lut = std::get_if<ExactLookupModel>(&model.data)) {
    EMX_CHECK_EQ(lut->grid.width, model.bit_width);
    const i64 e = lut->grid.At(static_cast<usize>(ua), static_cast<usize>(ub));
    return Finish(exact + static_cast<u64>(e), model);
  }

  if (const auto* reg = std::get_if<SegmentedRegressionModel>(&model.data)) {
    const RegressionSegment& seg = reg->segments[DomainOf(static_cast<i64>(exact), model.bit_width)];
    // Keys were recorded as masked w-bit results, so x stays unsigned here.
    const i64 x = static_cast<i64>(exact);
    const i64 e = Trunc(seg.slope * static_cast<double>(x) + seg.intercept);
    return Finish(exact + static_cast<u64>(e), model);
  }

  const auto& med = std::get<SegmentedMedModel>(model.data);
  const double m = med.med[DomainOf(static_cast<i64>(ua), model.bit_width)]
                          [DomainOf(static_cast<i64>(ub), model.bit_width)];
  return Finish(static_cast<u64>(Trunc(static_cast<double>(exact) + m)), model);
}

std::string Summarize(const ErrorModel& model) {
  std::ostringstream oss;
  oss << ToString(model.kind()) << " " << (model.is_signed ? "signed" : "unsigned") << " "
      << ToString(model.module) << " w=" << model.bit_width;
  oss << std::setprecision(6);
  if (const auto* lut = std::get_if<ExactLookupModel>(&model.data)) {
    oss << " cells=" << lut->grid.cells.size();
  } else if (const auto* reg = std::get_if<SegmentedRegressionModel>(&model.data)) {
    for (usize d = 0; d < kDomainCount; ++d) {
      const auto& s = reg->segments[d];
      oss << " d" << d << "=(" << s.slope << "," << s.intercept << (s.fitted ? "" : ",empty") << ")";
    }
  } else if (const auto* med = std::get_if<SegmentedMedModel>(&model.data)) {
    oss << " med=[";
    for (usize i = 0; i < kDomainCount; ++i) {
      if (i) oss << ";";
      for (usize j = 0; j < kDomainCount; ++j) {
        if (j) oss << ",";
        oss << med->med[i][j];
      }
    }
    oss << "]";
  }
  return oss.str();
}

}  // namespace model
}  // namespace emx
