#pragma once
// tcw/impact/probability_points.h
//
// Locations with their probability of being impacted. Coordinates are kept in
// fixed-point arc units (geometry/arc.h); probabilities must lie in [0, 1].

#include "tcw/core/types.h"
#include "tcw/geometry/arc.h"

#include <string>
#include <vector>

namespace tcw {
namespace impact {

class ProbabilityPoints {
 public:
  ProbabilityPoints() = default;

  // Degrees are converted to arc units. Fails on length mismatch, non-finite
  // coordinates or probabilities outside [0, 1] (all offenders are listed).
  static bool FromDegrees(const std::vector<double>& latitudes,
                          const std::vector<double>& longitudes,
                          std::vector<double> probabilities,
                          ProbabilityPoints* out,
                          std::string* err = nullptr);

  usize size() const noexcept { return probabilities_.size(); }
  bool empty() const noexcept { return probabilities_.empty(); }

  const std::vector<i64>& Latitudes() const noexcept { return latitudes_; }
  const std::vector<i64>& Longitudes() const noexcept { return longitudes_; }
  const std::vector<double>& Probabilities() const noexcept { return probabilities_; }

  ArcPoint PointAt(usize i) const noexcept { return ArcPoint{latitudes_[i], longitudes_[i]}; }

  bool AnyPositive() const noexcept {
    for (double p : probabilities_) {
      if (p > 0.0) return true;
    }
    return false;
  }

 private:
  std::vector<i64> latitudes_;
  std::vector<i64> longitudes_;
  std::vector<double> probabilities_;
};

}  // namespace impact
}  // namespace tcw
