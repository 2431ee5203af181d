// src/impact/contour.cpp

#include "tcw/impact/contour.h"

#include "tcw/core/logging.h"

#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace tcw {
namespace impact {

namespace {

// Edge keys: horizontal edge (r,c)-(r,c+1) -> 2*(r*C+c), vertical edge
// (r,c)-(r+1,c) -> 2*(r*C+c)+1.
using EdgeKey = u64;

class CellEdges {
 public:
  CellEdges(const Grid& grid, double level) : grid_(grid), level_(level), cols_(grid.Cols()) {}

  EdgeKey Horizontal(usize r, usize c) const { return static_cast<EdgeKey>(r * cols_ + c) * 2; }
  EdgeKey Vertical(usize r, usize c) const { return static_cast<EdgeKey>(r * cols_ + c) * 2 + 1; }

  // Crossing point of `key` in (column, row) index space.
  void Crossing(EdgeKey key, double* x, double* y) const {
    const usize node = static_cast<usize>(key / 2);
    const usize r = node / cols_;
    const usize c = node % cols_;
    const double v0 = grid_.At(r, c);
    if (key % 2 == 0) {
      const double v1 = grid_.At(r, c + 1);
      *x = static_cast<double>(c) + (level_ - v0) / (v1 - v0);
      *y = static_cast<double>(r);
    } else {
      const double v1 = grid_.At(r + 1, c);
      *x = static_cast<double>(c);
      *y = static_cast<double>(r) + (level_ - v0) / (v1 - v0);
    }
  }

 private:
  const Grid& grid_;
  double level_;
  usize cols_;
};

std::string PathLabel(usize path_index) { return "contour path " + std::to_string(path_index); }

}  // namespace

bool TraceContours(const Grid& grid, double level, std::vector<ContourRing>* out, std::string* err) {
  if (!out) {
    SetErr(err, "TraceContours: out is null");
    return false;
  }
  out->clear();
  const usize rows = grid.Rows();
  const usize cols = grid.Cols();
  auto inside = [&](usize r, usize c) { return grid.At(r, c) >= level; };

  for (usize r = 0; r < rows; ++r) {
    for (usize c = 0; c < cols; ++c) {
      if ((r == 0 || c == 0 || r + 1 == rows || c + 1 == cols) && inside(r, c)) {
        std::ostringstream oss;
        oss << "Region touches the grid edge at cell (" << r << ", " << c << "); contours cannot be closed";
        SetErr(err, oss.str());
        return false;
      }
    }
  }
  if (rows < 2 || cols < 2) return true;

  const CellEdges edges(grid, level);
  std::map<EdgeKey, EdgeKey> next;
  bool duplicate = false;
  auto link = [&](EdgeKey from, EdgeKey to) { duplicate = !next.emplace(from, to).second || duplicate; };

  for (usize r = 0; r + 1 < rows; ++r) {
    for (usize c = 0; c + 1 < cols; ++c) {
      const unsigned idx = (inside(r, c) ? 1u : 0u) | (inside(r, c + 1) ? 2u : 0u) |
                           (inside(r + 1, c + 1) ? 4u : 0u) | (inside(r + 1, c) ? 8u : 0u);
      const EdgeKey b = edges.Horizontal(r, c);
      const EdgeKey t = edges.Horizontal(r + 1, c);
      const EdgeKey l = edges.Vertical(r, c);
      const EdgeKey rt = edges.Vertical(r, c + 1);
      switch (idx) {
        case 0:
        case 15: break;
        case 1: link(b, l); break;
        case 2: link(rt, b); break;
        case 4: link(t, rt); break;
        case 8: link(l, t); break;
        case 14: link(l, b); break;
        case 13: link(b, rt); break;
        case 11: link(rt, t); break;
        case 7: link(t, l); break;
        case 3: link(rt, l); break;
        case 12: link(l, rt); break;
        case 6: link(t, b); break;
        case 9: link(b, t); break;
        case 5:
        case 10: {
          const double center = (grid.At(r, c) + grid.At(r, c + 1) + grid.At(r + 1, c + 1) + grid.At(r + 1, c)) / 4.0;
          const bool joined = center >= level;
          if (idx == 5) {
            if (joined) {
              link(b, rt);
              link(t, l);
            } else {
              link(b, l);
              link(t, rt);
            }
          } else {
            if (joined) {
              link(l, b);
              link(rt, t);
            } else {
              link(rt, b);
              link(l, t);
            }
          }
          break;
        }
        default: break;
      }
    }
  }
  if (duplicate) {
    SetErr(err, "TraceContours: an edge crossing was linked twice");
    return false;
  }

  const ArcPoint start = grid.Start();
  const ArcPoint res = grid.Resolution();
  while (!next.empty()) {
    const EdgeKey first = next.begin()->first;
    std::vector<std::pair<double, double>> pts;  // (x, y) index space
    EdgeKey key = first;
    while (true) {
      auto it = next.find(key);
      if (it == next.end()) {
        SetErr(err, "TraceContours: open contour at edge " + std::to_string(key));
        return false;
      }
      double x = 0.0, y = 0.0;
      edges.Crossing(key, &x, &y);
      pts.emplace_back(x, y);
      key = it->second;
      next.erase(it);
      if (key == first) break;
    }

    ContourRing ring;
    double twice_area = 0.0;
    for (usize i = 0; i < pts.size(); ++i) {
      const auto& p = pts[i];
      const auto& q = pts[(i + 1) % pts.size()];
      twice_area += p.first * q.second - q.first * p.second;
      const double lon = static_cast<double>(start.longitude) + p.first * static_cast<double>(res.longitude);
      const double lat = static_cast<double>(start.latitude) + p.second * static_cast<double>(res.latitude);
      ring.ring.push_back(GeoXY(FromArcUnits(lon), FromArcUnits(lat)));
    }
    ring.ring.push_back(ring.ring.front());
    ring.signed_area = twice_area / 2.0 * FromArcUnits(res.latitude) * FromArcUnits(res.longitude);
    out->push_back(std::move(ring));
  }
  return true;
}

bool GroupRings(const std::vector<ContourRing>& rings, std::vector<ContourPath>* out, std::string* err) {
  if (!out) {
    SetErr(err, "GroupRings: out is null");
    return false;
  }
  std::vector<usize> outer_index;
  std::vector<GeoPolygon> outer_polygons;
  std::vector<ContourPath> paths;
  for (usize i = 0; i < rings.size(); ++i) {
    if (!rings[i].IsOuter()) continue;
    ContourPath path;
    path.outer = rings[i].ring;
    paths.push_back(std::move(path));
    GeoPolygon poly;
    poly.outer() = rings[i].ring;
    outer_polygons.push_back(std::move(poly));
    outer_index.push_back(i);
  }

  for (usize i = 0; i < rings.size(); ++i) {
    if (rings[i].IsOuter()) continue;
    const GeoXY sample = rings[i].ring.front();
    usize best = paths.size();
    double best_area = std::numeric_limits<double>::infinity();
    for (usize k = 0; k < paths.size(); ++k) {
      const double area = rings[outer_index[k]].signed_area;
      if (area < best_area && bg::covered_by(sample, outer_polygons[k])) {
        best = k;
        best_area = area;
      }
    }
    if (best == paths.size()) {
      std::ostringstream oss;
      oss << "Hole ring " << i << " at (" << sample.y() << "," << sample.x() << ") has no enclosing outer ring";
      SetErr(err, oss.str());
      return false;
    }
    paths[best].holes.push_back(rings[i].ring);
  }
  *out = std::move(paths);
  return true;
}

bool RepairPolygon(const GeoPolygon& polygon, GeoMultiPolygon* out) {
  GeoPolygon p = polygon;
  bg::correct(p);
  out->clear();
  if (bg::is_valid(p)) {
    out->push_back(std::move(p));
    return true;
  }

  const bg::strategy::buffer::distance_symmetric<double> distance(0.0);
  const bg::strategy::buffer::side_straight side;
  const bg::strategy::buffer::join_miter join;
  const bg::strategy::buffer::end_flat end;
  const bg::strategy::buffer::point_square point;
  GeoMultiPolygon buffered;
  bg::buffer(p, buffered, distance, side, join, end, point);
  if (bg::is_empty(buffered) || !bg::is_valid(buffered)) return false;
  *out = std::move(buffered);
  return true;
}

bool PolygonFromPath(const ContourPath& path, usize path_index, GeoMultiPolygon* out, std::string* err) {
  if (!out) {
    SetErr(err, "PolygonFromPath: out is null");
    return false;
  }
  GeoPolygon outer;
  outer.outer() = path.outer;
  GeoMultiPolygon acc;
  if (!RepairPolygon(outer, &acc)) {
    SetErr(err, "Cannot repair outer ring of " + PathLabel(path_index));
    return false;
  }
  for (usize h = 0; h < path.holes.size(); ++h) {
    GeoPolygon hole;
    hole.outer() = path.holes[h];
    GeoMultiPolygon hole_mp;
    if (!RepairPolygon(hole, &hole_mp)) {
      SetErr(err, "Cannot repair hole " + std::to_string(h) + " of " + PathLabel(path_index));
      return false;
    }
    GeoMultiPolygon diff;
    bg::difference(acc, hole_mp, diff);
    acc = std::move(diff);
  }
  *out = std::move(acc);
  return true;
}

bool ExtractPolygons(const Grid& grid, double level, GeoMultiPolygon* out, std::string* err) {
  if (!out) {
    SetErr(err, "ExtractPolygons: out is null");
    return false;
  }
  std::vector<ContourRing> rings;
  if (!TraceContours(grid, level, &rings, err)) return false;
  std::vector<ContourPath> paths;
  if (!GroupRings(rings, &paths, err)) return false;

  GeoMultiPolygon result;
  for (usize i = 0; i < paths.size(); ++i) {
    GeoMultiPolygon poly;
    if (!PolygonFromPath(paths[i], i, &poly, err)) return false;
    if (result.empty()) {
      result = std::move(poly);
      continue;
    }
    GeoMultiPolygon merged;
    bg::union_(result, poly, merged);
    result = std::move(merged);
  }

  TCW_LOG_DEBUG("contour", "traced", rings.size(), "rings into", paths.size(), "paths and", result.size(),
                "polygons");
  *out = std::move(result);
  return true;
}

}  // namespace impact
}  // namespace tcw
