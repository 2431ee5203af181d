// src/geometry/geo.cpp

#include "tcw/geometry/geo.h"

#include <boost/geometry/strategies/geographic/distance_vincenty.hpp>

namespace tcw {

double KilometersPerDegree(double latitude) {
  const GeodeticPoint a(0.0, latitude);
  const GeodeticPoint b(1.0, latitude);
  const bg::strategy::distance::vincenty<> strategy;
  return bg::distance(a, b, strategy) / 1000.0;
}

double DistanceDegrees(const GeoMultiPolygon& geometry, double latitude, double longitude) {
  return bg::distance(MakeGeoXY(latitude, longitude), geometry);
}

double DistanceKm(const GeoMultiPolygon& geometry, double latitude, double longitude) {
  return DistanceDegrees(geometry, latitude, longitude) * KilometersPerDegree(latitude);
}

}  // namespace tcw
