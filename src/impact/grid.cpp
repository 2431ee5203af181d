// src/impact/grid.cpp

#include "tcw/impact/grid.h"

#include <cstdlib>
#include <sstream>
#include <utility>

namespace tcw {
namespace impact {

bool Grid::Create(usize rows,
                  usize cols,
                  std::vector<double> values,
                  ArcPoint start,
                  ArcPoint resolution,
                  Grid* out,
                  std::string* err) {
  if (!out) {
    SetErr(err, "Grid::Create: out is null");
    return false;
  }
  if (rows == 0 || cols == 0) {
    SetErr(err, "Grid::Create: grid must have at least one row and one column");
    return false;
  }
  if (values.size() != rows * cols) {
    SetErr(err, "Size of values and number of points do not match: " + std::to_string(rows * cols) +
                    " != " + std::to_string(values.size()));
    return false;
  }
  if (resolution.latitude <= 0 || resolution.longitude <= 0) {
    std::ostringstream oss;
    oss << "Grid::Create: resolution must be > 0, got (" << resolution.latitude << ", " << resolution.longitude
        << ")";
    SetErr(err, oss.str());
    return false;
  }
  Grid g;
  g.rows_ = rows;
  g.cols_ = cols;
  g.values_ = std::move(values);
  g.start_ = start;
  g.resolution_ = resolution;
  *out = std::move(g);
  return true;
}

bool Grid::FromCoordinates(usize rows,
                           usize cols,
                           std::vector<double> values,
                           const std::vector<ArcPoint>& coordinates,
                           i64 default_resolution,
                           Grid* out,
                           std::string* err) {
  if (coordinates.size() != values.size()) {
    SetErr(err, "Size of values and number of points do not match: " + std::to_string(values.size()) +
                    " != " + std::to_string(coordinates.size()));
    return false;
  }
  if (coordinates.empty()) {
    SetErr(err, "Grid::FromCoordinates: no coordinates");
    return false;
  }
  const ArcPoint first = coordinates.front();
  const ArcPoint last = coordinates.back();
  ArcPoint res;
  res.latitude = (rows == 1) ? default_resolution
                             : std::llabs(last.latitude - first.latitude) / static_cast<i64>(rows - 1);
  res.longitude = (cols == 1) ? default_resolution
                              : std::llabs(last.longitude - first.longitude) / static_cast<i64>(cols - 1);
  if (!Create(rows, cols, std::move(values), first, res, out, err)) return false;

  for (usize i = 0; i < coordinates.size(); ++i) {
    if (coordinates[i] != out->CoordinateAt(i / cols, i % cols)) {
      std::ostringstream oss;
      oss << "Coordinate " << coordinates[i] << " at index " << i << " is not on the grid lattice";
      SetErr(err, oss.str());
      return false;
    }
  }
  return true;
}

std::vector<ArcPoint> Grid::Coordinates() const {
  std::vector<ArcPoint> out;
  out.reserve(values_.size());
  for (usize r = 0; r < rows_; ++r) {
    for (usize c = 0; c < cols_; ++c) out.push_back(CoordinateAt(r, c));
  }
  return out;
}

std::vector<double> Grid::Latitudes() const {
  std::vector<double> out(rows_);
  for (usize r = 0; r < rows_; ++r) out[r] = FromArcUnits(CoordinateAt(r, 0).latitude);
  return out;
}

std::vector<double> Grid::Longitudes() const {
  std::vector<double> out(cols_);
  for (usize c = 0; c < cols_; ++c) out[c] = FromArcUnits(CoordinateAt(0, c).longitude);
  return out;
}

bool Grid::WithNewValues(std::vector<double> values, Grid* out, std::string* err) const {
  if (values.size() != values_.size()) {
    SetErr(err, "Shape of new values (" + std::to_string(values.size()) + " cells) does not match requirements (" +
                    std::to_string(rows_) + "x" + std::to_string(cols_) + ")");
    return false;
  }
  return Create(rows_, cols_, std::move(values), start_, resolution_, out, err);
}

bool Grid::HasBorder() const noexcept {
  if (empty()) return true;
  for (usize c = 0; c < cols_; ++c) {
    if (At(0, c) != 0.0 || At(rows_ - 1, c) != 0.0) return false;
  }
  for (usize r = 0; r < rows_; ++r) {
    if (At(r, 0) != 0.0 || At(r, cols_ - 1) != 0.0) return false;
  }
  return true;
}

Grid Grid::AddBorder(usize border) const {
  Grid g;
  g.rows_ = rows_ + 2 * border;
  g.cols_ = cols_ + 2 * border;
  g.values_.assign(g.rows_ * g.cols_, 0.0);
  for (usize r = 0; r < rows_; ++r) {
    for (usize c = 0; c < cols_; ++c) g.values_[(r + border) * g.cols_ + (c + border)] = At(r, c);
  }
  const i64 n = static_cast<i64>(border);
  g.start_ = ArcPoint{start_.latitude - resolution_.latitude * n, start_.longitude - resolution_.longitude * n};
  g.resolution_ = resolution_;
  return g;
}

usize Grid::CountNonZero() const noexcept {
  usize n = 0;
  for (double v : values_) {
    if (v != 0.0) ++n;
  }
  return n;
}

}  // namespace impact
}  // namespace tcw
