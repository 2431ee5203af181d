#pragma once
// tcw/geometry/point.h
//
// Track coordinates in degree space. Distances between them are plain
// Euclidean distances over (latitude, longitude); densification only needs
// a consistent spacing measure, not geodesic length.

#include "tcw/core/types.h"

#include <cmath>
#include <ostream>
#include <sstream>
#include <string>

namespace tcw {

struct LatLon {
  Scalar lat = 0.0;
  Scalar lon = 0.0;

  friend constexpr bool operator==(const LatLon& a, const LatLon& b) noexcept {
    return a.lat == b.lat && a.lon == b.lon;
  }
  friend constexpr bool operator!=(const LatLon& a, const LatLon& b) noexcept { return !(a == b); }

  // "(lat,lon)"
  std::string ToString() const {
    std::ostringstream oss;
    oss << '(' << lat << ',' << lon << ')';
    return oss.str();
  }
};

inline std::ostream& operator<<(std::ostream& os, const LatLon& p) { return os << p.ToString(); }

inline constexpr LatLon MakeLatLon(Scalar latitude, Scalar longitude) noexcept {
  return LatLon{latitude, longitude};
}

inline Scalar PlanarDistance(const LatLon& a, const LatLon& b) {
  return std::hypot(b.lat - a.lat, b.lon - a.lon);
}

// Point at fraction t along a->b (t = 0 gives a, t = 1 gives b).
inline LatLon Lerp(const LatLon& a, const LatLon& b, Scalar t) {
  return LatLon{a.lat + (b.lat - a.lat) * t, a.lon + (b.lon - a.lon) * t};
}

}  // namespace tcw
