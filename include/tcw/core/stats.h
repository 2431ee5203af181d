#pragma once
// tcw/core/stats.h
//
// Weighted quantiles over integer samples (timestamps in nanoseconds).
//
// Definition (weighted empirical CDF, SAS "definition 5"):
//   - sort the samples ascending and accumulate their weights,
//   - target = q * total_weight,
//   - take the first sample whose cumulative weight reaches the target,
//   - if the cumulative weight equals the target (|diff| < 1e-10) and the
//     sample is not the last one, return the midpoint with the next sample.
// With uniform weights and q = 0.5 this is the classical median.

#include "tcw/core/types.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace tcw {

inline constexpr double kQuantileExactHitTolerance = 1e-10;

// Floor of the midpoint without overflow; requires a <= b.
inline constexpr i64 MidpointFloor(i64 a, i64 b) noexcept {
  return a + (b - a) / 2;
}

inline bool WeightedQuantile(Span<const i64> values,
                             Span<const double> weights,
                             double q,
                             i64* out,
                             std::string* err = nullptr) {
  if (!out) {
    SetErr(err, "WeightedQuantile: out is null");
    return false;
  }
  if (values.empty()) {
    SetErr(err, "WeightedQuantile: no values");
    return false;
  }
  if (weights.size() != values.size()) {
    SetErr(err, "WeightedQuantile: number of weights does not match number of values: " +
                    std::to_string(weights.size()) + " != " + std::to_string(values.size()));
    return false;
  }
  if (!(q >= 0.0 && q <= 1.0)) {
    SetErr(err, "WeightedQuantile: q must be in [0,1], got " + std::to_string(q));
    return false;
  }
  for (usize i = 0; i < weights.size(); ++i) {
    if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
      SetErr(err, "WeightedQuantile: weight must be finite and >= 0, got " + std::to_string(weights[i]) +
                      " at index " + std::to_string(i));
      return false;
    }
  }

  std::vector<usize> order(values.size());
  std::iota(order.begin(), order.end(), usize{0});
  std::stable_sort(order.begin(), order.end(),
                   [&](usize a, usize b) { return values[a] < values[b]; });

  std::vector<double> cumulative(order.size());
  double sum = 0.0;
  for (usize i = 0; i < order.size(); ++i) {
    sum += weights[order[i]];
    cumulative[i] = sum;
  }
  if (!(sum > 0.0)) {
    SetErr(err, "WeightedQuantile: total weight must be > 0");
    return false;
  }

  const double target = q * sum;
  usize idx = static_cast<usize>(
      std::lower_bound(cumulative.begin(), cumulative.end(), target) - cumulative.begin());
  if (idx >= order.size()) idx = order.size() - 1;

  i64 result = values[order[idx]];
  if (std::fabs(target - cumulative[idx]) < kQuantileExactHitTolerance && idx + 1 < order.size()) {
    result = MidpointFloor(result, values[order[idx + 1]]);
  }
  *out = result;
  return true;
}

inline bool WeightedMedian(Span<const i64> values,
                           Span<const double> weights,
                           i64* out,
                           std::string* err = nullptr) {
  return WeightedQuantile(values, weights, 0.5, out, err);
}

// Unweighted median: uniform weight 1 per value.
inline bool Median(Span<const i64> values, i64* out, std::string* err = nullptr) {
  const std::vector<double> ones(values.size(), 1.0);
  return WeightedQuantile(values, Span<const double>(ones), 0.5, out, err);
}

}  // namespace tcw
