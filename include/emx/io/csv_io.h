#pragma once
// emx/io/csv_io.h
//
// Append-mode CSV/TSV output for run reports.
//
//   csv::Writer w(path, csv::Dialect{','}, &err);
//   csv::Row row(w.dialect());
//   row.Add(test).Add(width).AddFixed(ms, 3);
//   w.Write(row, &err);
//
// Cells holding the separator, a quote, or a line break are quoted with
// embedded quotes doubled.

#include "emx/core/error.h"
#include "emx/core/types.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace emx {
namespace csv {

struct Dialect {
  char sep = ',';
  char quote = '"';
};

inline std::string EscapeCell(std::string_view cell, const Dialect& d) {
  if (cell.find_first_of(std::string{d.sep, d.quote, '\n', '\r'}) == std::string_view::npos) {
    return std::string(cell);
  }
  std::string out(1, d.quote);
  for (char c : cell) {
    out.push_back(c);
    if (c == d.quote) out.push_back(d.quote);
  }
  out.push_back(d.quote);
  return out;
}

// One record, escaped as cells are added.
class Row {
 public:
  explicit Row(Dialect d) : d_(d) {}

  Row& Add(std::string_view cell) {
    if (cells_ > 0) line_.push_back(d_.sep);
    line_ += EscapeCell(cell, d_);
    ++cells_;
    return *this;
  }

  Row& Add(i64 v) { return Add(std::to_string(v)); }
  Row& Add(usize v) { return Add(std::to_string(v)); }
  Row& Add(i32 v) { return Add(std::to_string(v)); }

  Row& AddFixed(double v, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return Add(oss.str());
  }

  usize size() const noexcept { return cells_; }
  const std::string& line() const noexcept { return line_; }

 private:
  Dialect d_;
  std::string line_;
  usize cells_ = 0;
};

class Writer {
 public:
  // Opens `path` for appending.
  Writer(const std::string& path, Dialect d, Error* err = nullptr)
      : d_(d), path_(path), out_(path, std::ios::out | std::ios::app) {
    if (!out_) SetErr(err, ErrorCode::OutputWriteFailed, "cannot open " + path + " for appending");
  }

  bool Ok() const noexcept { return static_cast<bool>(out_); }
  const Dialect& dialect() const noexcept { return d_; }

  bool Write(const Row& row, Error* err = nullptr) {
    if (Ok()) out_ << row.line() << '\n';
    if (!Ok()) {
      SetErr(err, ErrorCode::OutputWriteFailed, "write failed: " + path_);
      return false;
    }
    return true;
  }

  bool Write(const std::vector<std::string>& cells, Error* err = nullptr) {
    Row row(d_);
    for (const auto& c : cells) row.Add(c);
    return Write(row, err);
  }

 private:
  Dialect d_;
  std::string path_;
  std::ofstream out_;
};

}  // namespace csv
}  // namespace emx
