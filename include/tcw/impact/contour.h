#pragma once
// tcw/impact/contour.h
//
// Contour tracing of a grid at one level and conversion of the contours into
// polygons with holes.
//
// Tracing is marching squares over the cells between grid nodes; a node is
// inside when its value is >= level and crossing points are interpolated
// linearly along cell edges. Saddle cells are joined when the average of the
// four corners is inside. Rings keep the inside on their left, so outer
// boundaries are counter-clockwise (positive area) and holes clockwise.
//
// The outer edge of the grid must be outside (zero border); a region touching
// the edge cannot be closed and is reported as an error.
//
// A path is one outer ring plus the holes it directly contains. Each path
// becomes a polygon (outer ring minus its holes, after repairing invalid
// rings with a zero-distance buffer); the final result is the union of all
// paths.

#include "tcw/core/types.h"
#include "tcw/geometry/geo.h"
#include "tcw/impact/grid.h"

#include <string>
#include <vector>

namespace tcw {
namespace impact {

struct ContourRing {
  GeoRing ring;             // closed, (longitude, latitude) degrees
  double signed_area = 0.0; // > 0 outer, < 0 hole

  bool IsOuter() const noexcept { return signed_area > 0.0; }
};

struct ContourPath {
  GeoRing outer;
  std::vector<GeoRing> holes;
};

bool TraceContours(const Grid& grid, double level, std::vector<ContourRing>* out, std::string* err = nullptr);

bool GroupRings(const std::vector<ContourRing>& rings, std::vector<ContourPath>* out, std::string* err = nullptr);

// Valid polygons are returned as they are; invalid ones are buffered by 0.
// Returns false if the repaired geometry is still invalid or empty.
bool RepairPolygon(const GeoPolygon& polygon, GeoMultiPolygon* out);

bool PolygonFromPath(const ContourPath& path, usize path_index, GeoMultiPolygon* out, std::string* err = nullptr);

// Trace + group + per-path polygons + union.
bool ExtractPolygons(const Grid& grid, double level, GeoMultiPolygon* out, std::string* err = nullptr);

}  // namespace impact
}  // namespace tcw
