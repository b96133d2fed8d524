// src/io/write_results.cpp
//
// Sweep run report writers.

#include "emx/io/write_results.h"

#include "emx/core/logging.h"
#include "emx/io/csv_io.h"

#include <filesystem>
#include <string_view>

namespace emx {
namespace io {

namespace {

bool EnsureDirExists(const std::filesystem::path& dir, Error* err) {
  std::error_code ec;
  if (dir.empty()) return true;
  if (std::filesystem::exists(dir, ec)) {
    if (std::filesystem::is_directory(dir, ec)) return true;
    SetErr(err, ErrorCode::OutputWriteFailed, "Path exists but is not a directory: " + dir.string());
    return false;
  }
  // A regular file somewhere up the chain makes create_directories fail with
  // ENOTDIR; report it the same way as the direct case above.
  for (auto p = dir.parent_path(); !p.empty() && p != p.root_path(); p = p.parent_path()) {
    if (std::filesystem::exists(p, ec) && !std::filesystem::is_directory(p, ec)) {
      SetErr(err, ErrorCode::OutputWriteFailed, "Path exists but is not a directory: " + p.string());
      return false;
    }
  }
  if (!std::filesystem::create_directories(dir, ec)) {
    SetErr(err, ErrorCode::OutputWriteFailed,
           "Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    return false;
  }
  return true;
}

bool FileNonEmpty(const std::filesystem::path& p) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return false;
  const auto sz = std::filesystem::file_size(p, ec);
  return !ec && sz > 0;
}

std::string JoinParams(const CharacterizationResult& r) {
  std::string out;
  for (usize i = 0; i < r.params.size(); ++i) {
    if (i) out += ';';
    if (i < r.param_names.size()) {
      out += r.param_names[i];
      out += '=';
    }
    out += r.params[i];
  }
  return out;
}

bool AppendSweepReportDelimited(const std::string& path,
                                const std::vector<CharacterizationResult>& results,
                                const std::vector<model::ErrorModel>& models,
                                char sep,
                                Error* err) {
  if (!models.empty() && models.size() != results.size()) {
    SetErr(err, ErrorCode::OutputWriteFailed,
           "models/results size mismatch: " + std::to_string(models.size()) + " vs " +
               std::to_string(results.size()));
    return false;
  }

  const std::filesystem::path p(path);
  if (!EnsureDirExists(p.parent_path(), err)) return false;

  const bool need_header = !FileNonEmpty(p);

  csv::Writer w(path, csv::Dialect{sep, '"'}, err);
  if (!w.Ok()) return false;

  if (need_header) {
    if (!w.Write(SweepReportHeader(), err)) return false;
  }

  const std::vector<usize> differing = DifferingParameterIndices(results);
  for (usize i = 0; i < results.size(); ++i) {
    const CharacterizationResult& r = results[i];
    csv::Row row(w.dialect());
    row.Add(r.name)
        .Add(ModelLabel(r, differing))
        .Add(ToString(r.kind()))
        .Add(r.is_signed ? "signed" : "unsigned")
        .Add(ToString(r.module))
        .Add(r.bit_width)
        .Add(JoinParams(r))
        .Add(models.empty() ? std::string_view() : ToString(models[i].kind()))
        .Add(r.EntryCount())
        .AddFixed(r.elapsed_ms, 3);
    if (!w.Write(row, err)) return false;
  }
  EMX_LOG_DEBUG("Appended", results.size(), "row(s) to", path);
  return true;
}

}  // namespace

std::vector<std::string> SweepReportHeader() {
  return {"test", "label", "kind", "signedness", "module", "width",
          "params", "model", "entries", "elapsed_ms"};
}

bool AppendSweepReportCSV(const std::string& path,
                          const std::vector<CharacterizationResult>& results,
                          const std::vector<model::ErrorModel>& models,
                          Error* err) {
  return AppendSweepReportDelimited(path, results, models, ',', err);
}

bool AppendSweepReportTSV(const std::string& path,
                          const std::vector<CharacterizationResult>& results,
                          const std::vector<model::ErrorModel>& models,
                          Error* err) {
  return AppendSweepReportDelimited(path, results, models, '\t', err);
}

}  // namespace io
}  // namespace emx
