#pragma once
// tcw/geometry/geo.h
//
// Geographic geometry types on top of Boost.Geometry.
//
// Polygons use planar (x = longitude, y = latitude) degree coordinates,
// counter-clockwise outer rings and closed rings. Distances from track points
// to country geometries are computed in that plane and converted to
// kilometres with a latitude-dependent scale (geodesic length of one degree of
// longitude on the WGS84 ellipsoid).

#include "tcw/core/types.h"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>

namespace tcw {

namespace bg = boost::geometry;

using GeoXY = bg::model::d2::point_xy<double>;
using GeoRing = bg::model::ring<GeoXY, /*clockwise=*/false, /*closed=*/true>;
using GeoPolygon = bg::model::polygon<GeoXY, /*clockwise=*/false, /*closed=*/true>;
using GeoMultiPolygon = bg::model::multi_polygon<GeoPolygon>;
using GeoBox = bg::model::box<GeoXY>;

// Point on the WGS84 ellipsoid (longitude, latitude in degrees).
using GeodeticPoint = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;

inline GeoXY MakeGeoXY(double latitude, double longitude) { return GeoXY(longitude, latitude); }

// Kilometres spanned by one degree of longitude at `latitude`.
double KilometersPerDegree(double latitude);

// Planar distance (degrees) from (latitude, longitude) to `geometry`; 0 inside.
double DistanceDegrees(const GeoMultiPolygon& geometry, double latitude, double longitude);

// DistanceDegrees scaled by KilometersPerDegree(latitude).
double DistanceKm(const GeoMultiPolygon& geometry, double latitude, double longitude);

}  // namespace tcw
