// src/sweep/sweep_orchestrator.cpp

#include "emx/sweep/sweep_orchestrator.h"

#include "emx/core/assert.h"
#include "emx/core/logging.h"
#include "emx/core/timer.h"
#include "emx/io/result_codec.h"

#include <sstream>
#include <string>
#include <utility>

namespace emx {
namespace sweep {

std::string SweepPoint::ToString() const {
  std::ostringstream oss;
  oss << "(";
  for (usize i = 0; i < values.size(); ++i) {
    if (i) oss << ", ";
    oss << values[i].first << "=" << values[i].second;
  }
  oss << ")";
  return oss.str();
}

bool ExpandSweepPoints(const std::vector<BoundArgument>& bound,
                       std::vector<SweepPoint>* out,
                       Error* err) {
  if (!out) return false;

  std::vector<usize> ranged;
  for (usize i = 0; i < bound.size(); ++i) {
    if (bound[i].is_range) ranged.push_back(i);
  }

  usize total = 1;
  for (usize i : ranged) {
    const usize n = bound[i].range.Size();
    if (n != 0 && total > kMaxSweepPoints / n) {
      std::string tokens;
      for (usize j : ranged) {
        if (!tokens.empty()) tokens += ", ";
        tokens += bound[j].name + "=" + bound[j].raw;
      }
      SetErr(err, ErrorCode::InvalidRange,
             "sweep over (" + tokens + ") exceeds " + std::to_string(kMaxSweepPoints) + " points");
      return false;
    }
    total *= n;
  }

  std::vector<SweepPoint> points;
  points.reserve(total);

  // Mixed-radix counter over the ranged arguments, last digit fastest.
  std::vector<usize> digit(ranged.size(), 0);
  for (usize n = 0; n < total; ++n) {
    SweepPoint p;
    p.values.reserve(bound.size());
    usize r = 0;
    for (usize i = 0; i < bound.size(); ++i) {
      if (bound[i].is_range) {
        p.values.emplace_back(bound[i].name, std::to_string(bound[i].range.At(digit[r])));
        ++r;
      } else {
        p.values.emplace_back(bound[i].name, bound[i].raw);
      }
    }
    points.push_back(std::move(p));

    for (usize k = ranged.size(); k-- > 0;) {
      if (++digit[k] < bound[ranged[k]].range.Size()) break;
      digit[k] = 0;
    }
  }
  *out = std::move(points);
  return true;
}

SweepOrchestrator::SweepOrchestrator(harness::IHarnessRunner* runner,
                                     HarnessConfig harness_cfg,
                                     SweepConfig sweep_cfg,
                                     harness::HarnessDialect dialect,
                                     harness::SeverityVocabulary vocab)
    : runner_(runner),
      harness_cfg_(std::move(harness_cfg)),
      sweep_cfg_(sweep_cfg),
      dialect_(std::move(dialect)),
      vocab_(std::move(vocab)) {
  EMX_ASSERT(runner_ != nullptr);
}

void SweepOrchestrator::ForwardHarnessLines(const harness::Classification& c) const {
  if (!sweep_cfg_.verbose) return;
  for (const auto& line : c.harness_lines) Logger::Instance().LogBlock(LogLevel::Info, line, "harness");
}

bool SweepOrchestrator::Probe(const std::string& test_name,
                              std::vector<harness::DeclaredParameter>* out,
                              Error* err) {
  harness::HarnessInvocation inv;
  inv.test_name = test_name;

  EMX_LOG_INFO("Probing", test_name, "via", runner_->Name(), "runner");
  harness::HarnessOutput run;
  if (!runner_->Run(inv, &run, err)) return false;

  if (!harness::ParseDeclaredParameters(run.text, test_name, dialect_, vocab_, out, err)) return false;
  EMX_LOG_DEBUG("Declared parameters:", out->size());
  for (const auto& p : *out) {
    EMX_LOG_DEBUG("  ", p.name, p.default_value ? "default=" + *p.default_value : std::string("required"));
  }
  return true;
}

bool SweepOrchestrator::RunPoint(const std::string& test_name,
                                 const SweepPoint& point,
                                 CharacterizationResult* out,
                                 Error* err) {
  harness::HarnessInvocation inv;
  inv.test_name = test_name;
  inv.params = point.values;

  EMX_LOG_INFO("Running", test_name, point.ToString());
  harness::HarnessOutput run;
  if (!runner_->Run(inv, &run, err)) return false;

  harness::Classification c;
  const bool ok = harness::ClassifyOutput(run.text, test_name, dialect_, vocab_, &c, err);
  ForwardHarnessLines(c);
  if (!ok) {
    if (err) err->message += " at " + point.ToString();
    return false;
  }
  EMX_LOG_DEBUG("Classified", ToString(c.verdict), ToString(c.meta.kind),
                c.meta.is_signed ? "signed" : "unsigned", ToString(c.meta.module));

  io::DecodedResult decoded;
  if (!io::ReadResultFile(harness_cfg_.ResultPath(test_name), c.meta.kind, &decoded, err)) {
    if (err) err->message += " at " + point.ToString();
    return false;
  }

  CharacterizationResult r;
  r.name = test_name;
  r.is_signed = c.meta.is_signed;
  r.bit_width = decoded.bit_width;
  r.module = c.meta.module;
  r.params.reserve(point.values.size());
  r.param_names.reserve(point.values.size());
  for (const auto& [name, value] : point.values) {
    r.param_names.push_back(name);
    r.params.push_back(value);
  }
  r.data = std::move(decoded.data);
  r.elapsed_ms = run.elapsed_ms;

  EMX_LOG_INFO("Decoded", ToString(r.kind()), "w=", r.bit_width, "entries=",
               static_cast<unsigned long long>(r.EntryCount()));
  *out = std::move(r);
  return true;
}

bool SweepOrchestrator::Run(const SweepRequest& req,
                            std::vector<CharacterizationResult>* out,
                            Error* err) {
  if (!out) return false;
  Stopwatch sw;

  std::vector<harness::DeclaredParameter> declared;
  if (!Probe(req.test_name, &declared, err)) return false;

  std::vector<BoundArgument> bound;
  if (!BindArguments(declared, req.tokens, &bound, err)) return false;

  std::vector<SweepPoint> points;
  if (!ExpandSweepPoints(bound, &points, err)) return false;
  EMX_LOG_INFO("Sweep of", req.test_name, "has", static_cast<unsigned long long>(points.size()), "point(s)");

  std::vector<CharacterizationResult> results;
  results.reserve(points.size());
  for (usize i = 0; i < points.size(); ++i) {
    CharacterizationResult r;
    if (!RunPoint(req.test_name, points[i], &r, err)) {
      EMX_LOG_ERROR("Sweep point", i + 1, "of", points.size(), "failed; aborting batch");
      return false;
    }
    results.push_back(std::move(r));
  }

  EMX_LOG_INFO("Sweep done:", static_cast<unsigned long long>(results.size()), "result(s) in",
               sw.ElapsedMillis(), "ms");
  *out = std::move(results);
  return true;
}

}  // namespace sweep
}  // namespace emx
