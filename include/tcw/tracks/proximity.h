#pragma once
// tcw/tracks/proximity.h
//
// Distances between track points and country geometries (kilometres).

#include "tcw/core/types.h"
#include "tcw/geometry/geo.h"
#include "tcw/tracks/track.h"

#include <optional>
#include <string>

namespace tcw {

struct ClosestPoint {
  usize index = 0;
  Timestamp time = 0;
  double distance_km = 0.0;
};

// Time of the first point (in track order) within `radius_km` of `geometry`.
// *out is left empty when no point is close enough; that is not an error.
bool FindFirstTimeCloserThan(const Track& track,
                             const GeoMultiPolygon& geometry,
                             double radius_km,
                             std::optional<Timestamp>* out,
                             std::string* err = nullptr);

// Point of `track` closest to `geometry`. Among equally close points the later
// one wins. An empty track is an error.
bool FindClosestPoint(const Track& track,
                      const GeoMultiPolygon& geometry,
                      ClosestPoint* out,
                      std::string* err = nullptr);

}  // namespace tcw
