#pragma once
// tcw/tracks/track.h
//
// One ensemble member's forecast track: parallel sequences of latitude,
// longitude (degrees) and timestamp, plus the member's probability weight
// ("frequency"). Tracks are immutable once created.

#include "tcw/core/types.h"
#include "tcw/geometry/point.h"

#include <string>
#include <vector>

namespace tcw {

class Track {
 public:
  // Empty track; only useful as an output slot for Create.
  Track() = default;

  // Validates that the three sequences have the same, non-zero length, that
  // coordinates are finite and that the frequency is finite and >= 0.
  static bool Create(std::vector<double> latitudes,
                     std::vector<double> longitudes,
                     std::vector<Timestamp> times,
                     double frequency,
                     Track* out,
                     std::string* err = nullptr);

  usize size() const noexcept { return times_.size(); }
  bool empty() const noexcept { return times_.empty(); }

  double Latitude(usize i) const noexcept { return latitudes_[i]; }
  double Longitude(usize i) const noexcept { return longitudes_[i]; }
  Timestamp Time(usize i) const noexcept { return times_[i]; }
  LatLon PointAt(usize i) const noexcept { return MakeLatLon(latitudes_[i], longitudes_[i]); }

  const std::vector<double>& Latitudes() const noexcept { return latitudes_; }
  const std::vector<double>& Longitudes() const noexcept { return longitudes_; }
  double Frequency() const noexcept { return frequency_; }

  friend bool operator==(const Track& a, const Track& b) {
    return a.frequency_ == b.frequency_ && a.latitudes_ == b.latitudes_ &&
           a.longitudes_ == b.longitudes_ && a.times_ == b.times_;
  }
  friend bool operator!=(const Track& a, const Track& b) { return !(a == b); }

 private:
  std::vector<double> latitudes_;
  std::vector<double> longitudes_;
  std::vector<Timestamp> times_;
  double frequency_ = 1.0;
};

}  // namespace tcw
