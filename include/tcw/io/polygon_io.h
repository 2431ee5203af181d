#pragma once
// tcw/io/polygon_io.h
//
// Warning-region and country geometry I/O.
//  - WKT: POLYGON / MULTIPOLYGON text, written with 17 significant digits so
//    that write -> read is lossless. An empty region is "MULTIPOLYGON EMPTY".
//  - GeoJSON: FeatureCollection with one Polygon feature per polygon (holes
//    included) and a named CRS, coordinates as [longitude, latitude].

#include "tcw/core/types.h"
#include "tcw/geometry/geo.h"

#include <string>
#include <string_view>

namespace tcw {
namespace io {

inline constexpr std::string_view kDefaultCrs = "EPSG:4326";

// Accepts POLYGON and MULTIPOLYGON (optionally EMPTY). Ring orientation and
// closure are corrected after parsing.
bool ParseWkt(std::string_view wkt, GeoMultiPolygon* out, std::string* err = nullptr);

std::string ToWkt(const GeoMultiPolygon& geometry);

std::string ToGeoJson(const GeoMultiPolygon& geometry, std::string_view crs = kDefaultCrs);

bool WriteWkt(const std::string& path, const GeoMultiPolygon& geometry, std::string* err = nullptr);
bool ReadWkt(const std::string& path, GeoMultiPolygon* out, std::string* err = nullptr);

bool WriteGeoJson(const std::string& path,
                  const GeoMultiPolygon& geometry,
                  std::string_view crs = kDefaultCrs,
                  std::string* err = nullptr);

}  // namespace io
}  // namespace tcw
