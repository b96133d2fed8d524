#pragma once
// emx/core/stats.h
//
// Statistics helpers for model synthesis.
// Provides:
//  - OnlineStats: Welford's algorithm for mean/variance, plus min/max.
//  - LinearFit: ordinary least squares y = slope * x + intercept over
//    (x, y) pairs, accumulated in a numerically stable, single pass.

#include "emx/core/types.h"

#include <cmath>
#include <limits>

namespace emx {

class OnlineStats {
 public:
  OnlineStats() { Clear(); }

  void Clear() {
    n_ = 0;
    mean_ = 0.0L;
    m2_ = 0.0L;
    min_ = std::numeric_limits<long double>::infinity();
    max_ = -std::numeric_limits<long double>::infinity();
  }

  void Push(double x) {
    const long double v = static_cast<long double>(x);
    ++n_;
    const long double delta = v - mean_;
    mean_ += delta / static_cast<long double>(n_);
    const long double delta2 = v - mean_;
    m2_ += delta * delta2;
    if (v < min_) min_ = v;
    if (v > max_) max_ = v;
  }

  usize Count() const { return n_; }

  double Mean() const { return (n_ == 0) ? 0.0 : static_cast<double>(mean_); }

  // Population variance by default (dividing by n).
  double Variance(bool unbiased = false) const {
    if (n_ < (unbiased ? 2 : 1)) return 0.0;
    const long double denom = unbiased ? static_cast<long double>(n_ - 1) : static_cast<long double>(n_);
    return static_cast<double>(m2_ / denom);
  }

  double Min() const { return (n_ == 0) ? 0.0 : static_cast<double>(min_); }
  double Max() const { return (n_ == 0) ? 0.0 : static_cast<double>(max_); }

 private:
  usize n_{0};
  long double mean_{0.0L};
  long double m2_{0.0L};
  long double min_{0.0L};
  long double max_{0.0L};
};

// Single-variable least squares. Points are centered on the running means
// (co-moment update), so large x values such as 60-bit results do not lose
// precision the way sum(x*x) accumulation would.
class LinearFit {
 public:
  void Push(double x, double y) {
    const long double lx = static_cast<long double>(x);
    const long double ly = static_cast<long double>(y);
    ++n_;
    const long double dx = lx - mean_x_;
    mean_x_ += dx / static_cast<long double>(n_);
    mean_y_ += (ly - mean_y_) / static_cast<long double>(n_);
    sxx_ += dx * (lx - mean_x_);
    sxy_ += dx * (ly - mean_y_);
  }

  usize Count() const { return n_; }

  // Zero-variance x (including a single point) has no defined slope; the fit
  // degenerates to the horizontal line through mean(y).
  double Slope() const {
    if (n_ < 2 || !(sxx_ > 0.0L)) return 0.0;
    return static_cast<double>(sxy_ / sxx_);
  }

  double Intercept() const {
    if (n_ == 0) return 0.0;
    return static_cast<double>(mean_y_ - static_cast<long double>(Slope()) * mean_x_);
  }

 private:
  usize n_{0};
  long double mean_x_{0.0L};
  long double mean_y_{0.0L};
  long double sxx_{0.0L};
  long double sxy_{0.0L};
};

}  // namespace emx
