#pragma once
// tcw/impact/grid.h
//
// Regular rectangular grid of values.
//
// Rows are latitudes, columns longitudes, both ascending; values are stored
// row-major. `start` is the coordinate of cell (0, 0) and `resolution` the
// spacing between rows (latitude) and columns (longitude), both in arc units.
// Coordinates are derived: coordinate(r, c) = start + resolution * (r, c).
// Grids are immutable; transforms return new grids.

#include "tcw/core/assert.h"
#include "tcw/core/types.h"
#include "tcw/geometry/arc.h"

#include <string>
#include <vector>

namespace tcw {
namespace impact {

class Grid {
 public:
  Grid() = default;

  // Fails unless rows, cols > 0, values.size() == rows * cols and both
  // resolutions are > 0.
  static bool Create(usize rows,
                     usize cols,
                     std::vector<double> values,
                     ArcPoint start,
                     ArcPoint resolution,
                     Grid* out,
                     std::string* err = nullptr);

  // Grid from values and one coordinate per value (row-major). The start is
  // the first coordinate; the resolution per axis is the coordinate span
  // divided by (n - 1), or `default_resolution` for an axis of length 1.
  static bool FromCoordinates(usize rows,
                              usize cols,
                              std::vector<double> values,
                              const std::vector<ArcPoint>& coordinates,
                              i64 default_resolution,
                              Grid* out,
                              std::string* err = nullptr);

  usize Rows() const noexcept { return rows_; }
  usize Cols() const noexcept { return cols_; }
  usize size() const noexcept { return values_.size(); }
  bool empty() const noexcept { return values_.empty(); }

  ArcPoint Start() const noexcept { return start_; }
  ArcPoint Resolution() const noexcept { return resolution_; }

  const std::vector<double>& Values() const noexcept { return values_; }
  double At(usize r, usize c) const noexcept {
    TCW_DASSERT(r < rows_ && c < cols_);
    return values_[r * cols_ + c];
  }

  ArcPoint CoordinateAt(usize r, usize c) const noexcept {
    return ArcPoint{start_.latitude + resolution_.latitude * static_cast<i64>(r),
                    start_.longitude + resolution_.longitude * static_cast<i64>(c)};
  }

  // One coordinate per value, row-major.
  std::vector<ArcPoint> Coordinates() const;

  // Row latitudes / column longitudes in degrees.
  std::vector<double> Latitudes() const;
  std::vector<double> Longitudes() const;

  // Same coordinates, new values (same count required).
  bool WithNewValues(std::vector<double> values, Grid* out, std::string* err = nullptr) const;

  // True if every cell on the outer edge is 0.
  bool HasBorder() const noexcept;

  // Pads `border` zero cells on every side; the start moves back accordingly.
  Grid AddBorder(usize border = 1) const;

  usize CountNonZero() const noexcept;

 private:
  usize rows_ = 0;
  usize cols_ = 0;
  std::vector<double> values_;
  ArcPoint start_{};
  ArcPoint resolution_{};
};

}  // namespace impact
}  // namespace tcw
