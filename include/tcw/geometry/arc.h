#pragma once
// tcw/geometry/arc.h
//
// Fixed-point coordinates for probability grids.
//
// Grid coordinates are stored as integer arc-milliseconds (1 degree =
// 3'600'000 units) so that equality and lattice alignment are exact. Values in
// degrees are only produced at the boundaries (I/O, polygon output).

#include "tcw/core/types.h"

#include <cmath>
#include <ostream>

namespace tcw {

inline constexpr i64 kArcUnitsPerDegree = 3600000;

// Degrees recovered from arc units are rounded to 12 decimals, which is finer
// than one arc unit and removes the binary noise of the division.
inline constexpr double kDegreeRounding = 1e12;

inline i64 ToArcUnits(double degrees) {
  return static_cast<i64>(std::llround(degrees * static_cast<double>(kArcUnitsPerDegree)));
}

// Fractional arc units (contour vertices lie between lattice nodes).
inline double FromArcUnits(double arc) {
  const double deg = arc / static_cast<double>(kArcUnitsPerDegree);
  return std::round(deg * kDegreeRounding) / kDegreeRounding;
}

inline double FromArcUnits(i64 arc) { return FromArcUnits(static_cast<double>(arc)); }

struct ArcPoint {
  i64 latitude = 0;
  i64 longitude = 0;

  friend constexpr bool operator==(const ArcPoint& a, const ArcPoint& b) noexcept {
    return a.latitude == b.latitude && a.longitude == b.longitude;
  }
  friend constexpr bool operator!=(const ArcPoint& a, const ArcPoint& b) noexcept { return !(a == b); }

  // Row-major order: latitude first.
  friend constexpr bool operator<(const ArcPoint& a, const ArcPoint& b) noexcept {
    return (a.latitude != b.latitude) ? (a.latitude < b.latitude) : (a.longitude < b.longitude);
  }
};

inline std::ostream& operator<<(std::ostream& os, const ArcPoint& p) {
  os << "(" << FromArcUnits(p.latitude) << "," << FromArcUnits(p.longitude) << ")";
  return os;
}

}  // namespace tcw
