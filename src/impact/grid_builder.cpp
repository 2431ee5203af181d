// src/impact/grid_builder.cpp

#include "tcw/impact/grid_builder.h"

#include "tcw/core/assert.h"
#include "tcw/core/logging.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace tcw {
namespace impact {

namespace {

// Allowed distance of a coordinate from its lattice node, in 1/100 of the
// resolution.
constexpr i64 kLatticeTolerancePercent = 1;

i64 FloorDiv(i64 a, i64 b) {
  i64 q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// Nearest lattice index of `v`, or -1 if `v` is too far from any node.
i64 LatticeIndex(const AxisLattice& lat, i64 v) {
  const i64 offset = v - lat.start;
  const i64 lower = FloorDiv(offset, lat.resolution);
  const i64 rem = offset - lower * lat.resolution;
  const i64 idx = (2 * rem >= lat.resolution) ? lower + 1 : lower;
  const i64 dist = std::min(rem, lat.resolution - rem);
  if (dist * 100 > lat.resolution * kLatticeTolerancePercent) return -1;
  return idx;
}

}  // namespace

bool InferLattice(const std::vector<i64>& values,
                  i64 default_resolution,
                  const char* name,
                  AxisLattice* out,
                  std::string* err) {
  if (!out) {
    SetErr(err, "InferLattice: out is null");
    return false;
  }
  if (values.empty()) {
    SetErr(err, std::string("InferLattice: no ") + name + " values");
    return false;
  }
  std::vector<i64> distinct(values);
  std::sort(distinct.begin(), distinct.end());
  distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

  AxisLattice lat;
  lat.start = distinct.front();
  if (distinct.size() == 1) {
    if (default_resolution <= 0) {
      SetErr(err, "InferLattice: default resolution must be > 0");
      return false;
    }
    lat.resolution = default_resolution;
    lat.count = 1;
    *out = lat;
    return true;
  }

  lat.resolution = distinct[1] - distinct[0];
  for (usize i = 2; i < distinct.size(); ++i) lat.resolution = std::min(lat.resolution, distinct[i] - distinct[i - 1]);

  i64 max_idx = 0;
  for (const i64 v : distinct) {
    const i64 idx = LatticeIndex(lat, v);
    if (idx < 0) {
      std::ostringstream oss;
      oss << name << " " << FromArcUnits(v) << " is not on the lattice starting at " << FromArcUnits(lat.start)
          << " with resolution " << FromArcUnits(lat.resolution);
      SetErr(err, oss.str());
      return false;
    }
    max_idx = std::max(max_idx, idx);
  }
  lat.count = static_cast<usize>(max_idx) + 1;
  *out = lat;
  return true;
}

bool BuildGrid(const ProbabilityPoints& points, i64 default_resolution, Grid* out, std::string* err) {
  if (!out) {
    SetErr(err, "BuildGrid: out is null");
    return false;
  }
  if (points.empty()) {
    SetErr(err, "BuildGrid: no points");
    return false;
  }

  AxisLattice rows, cols;
  if (!InferLattice(points.Latitudes(), default_resolution, "latitude", &rows, err)) return false;
  if (!InferLattice(points.Longitudes(), default_resolution, "longitude", &cols, err)) return false;
  if (rows.count > kMaxGridCells / cols.count) {
    std::ostringstream oss;
    oss << "Grid of " << rows.count << " x " << cols.count << " cells exceeds the limit of " << kMaxGridCells
        << " cells (resolution " << FromArcUnits(rows.resolution) << " x " << FromArcUnits(cols.resolution)
        << " degrees)";
    SetErr(err, oss.str());
    return false;
  }

  std::vector<double> values(rows.count * cols.count, 0.0);
  std::vector<bool> seen(values.size(), false);
  for (usize i = 0; i < points.size(); ++i) {
    const ArcPoint p = points.PointAt(i);
    const i64 ri = LatticeIndex(rows, p.latitude);
    const i64 ci = LatticeIndex(cols, p.longitude);
    TCW_ASSERT(ri >= 0 && ci >= 0);  // lattices were inferred from these values
    const usize r = static_cast<usize>(ri);
    const usize c = static_cast<usize>(ci);
    const usize k = r * cols.count + c;
    if (seen[k]) {
      std::ostringstream oss;
      oss << "Duplicate grid cell for point " << p << " at index " << i;
      SetErr(err, oss.str());
      return false;
    }
    seen[k] = true;
    values[k] = points.Probabilities()[i];
  }

  if (!Grid::Create(rows.count, cols.count, std::move(values), ArcPoint{rows.start, cols.start},
                    ArcPoint{rows.resolution, cols.resolution}, out, err)) {
    return false;
  }
  TCW_LOG_DEBUG("grid", "built", out->Rows(), "x", out->Cols(), "grid from", points.size(), "points");
  return true;
}

Grid EnsureMinimumGrid(const Grid& grid, usize minimum_size) {
  const usize size = std::min(grid.Rows(), grid.Cols());
  if (size >= minimum_size) return grid;
  const usize border = (minimum_size - size + 1) / 2;
  TCW_LOG_DEBUG("grid", "padding", grid.Rows(), "x", grid.Cols(), "grid with a border of", border);
  return grid.AddBorder(border);
}

}  // namespace impact
}  // namespace tcw
