// src/tracks/proximity.cpp

#include "tcw/tracks/proximity.h"

#include <limits>

namespace tcw {

namespace {

bool CheckGeometry(const GeoMultiPolygon& geometry, const char* fn, std::string* err) {
  if (bg::is_empty(geometry)) {
    SetErr(err, std::string(fn) + ": geometry is empty");
    return false;
  }
  return true;
}

}  // namespace

bool FindFirstTimeCloserThan(const Track& track,
                             const GeoMultiPolygon& geometry,
                             double radius_km,
                             std::optional<Timestamp>* out,
                             std::string* err) {
  if (!out) {
    SetErr(err, "FindFirstTimeCloserThan: out is null");
    return false;
  }
  if (!CheckGeometry(geometry, "FindFirstTimeCloserThan", err)) return false;

  out->reset();
  for (usize i = 0; i < track.size(); ++i) {
    if (DistanceKm(geometry, track.Latitude(i), track.Longitude(i)) <= radius_km) {
      *out = track.Time(i);
      return true;
    }
  }
  return true;
}

bool FindClosestPoint(const Track& track,
                      const GeoMultiPolygon& geometry,
                      ClosestPoint* out,
                      std::string* err) {
  if (!out) {
    SetErr(err, "FindClosestPoint: out is null");
    return false;
  }
  if (track.empty()) {
    SetErr(err, "FindClosestPoint: track does not contain any points");
    return false;
  }
  if (!CheckGeometry(geometry, "FindClosestPoint", err)) return false;

  ClosestPoint best;
  best.distance_km = std::numeric_limits<double>::infinity();
  for (usize i = 0; i < track.size(); ++i) {
    const double d = DistanceKm(geometry, track.Latitude(i), track.Longitude(i));
    if (d <= best.distance_km) {
      best.index = i;
      best.time = track.Time(i);
      best.distance_km = d;
    }
  }
  *out = best;
  return true;
}

}  // namespace tcw
