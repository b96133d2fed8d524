#pragma once
// emx/io/write_results.h
//
// Run report for a sweep: one row per sweep point, appended to a CSV/TSV file.
// The header is written only when the file is new or empty, so repeated
// sweeps can share one report.
//
// Columns:
//   test, label, kind, signedness, module, width, params, model, entries, elapsed_ms
// `params` is "name=value" pairs joined by ';'.

#include "emx/core/error.h"
#include "emx/model/characterization.h"
#include "emx/model/error_model.h"

#include <string>
#include <vector>

namespace emx {
namespace io {

std::vector<std::string> SweepReportHeader();

// `models` must be empty or parallel to `results`.
bool AppendSweepReportCSV(const std::string& path,
                          const std::vector<CharacterizationResult>& results,
                          const std::vector<model::ErrorModel>& models,
                          Error* err = nullptr);

bool AppendSweepReportTSV(const std::string& path,
                          const std::vector<CharacterizationResult>& results,
                          const std::vector<model::ErrorModel>& models,
                          Error* err = nullptr);

}  // namespace io
}  // namespace emx
