#pragma once
// tcw/impact/grid_builder.h
//
// Scattered probability points -> complete rectangular Grid.
//
// The lattice is inferred per axis from the sorted distinct coordinates: the
// resolution is the smallest positive gap, every coordinate must lie on the
// lattice (within 1% of the resolution) and cells not present in the input are
// filled with 0. An axis with a single distinct value uses
// `default_resolution`.

#include "tcw/core/types.h"
#include "tcw/impact/grid.h"
#include "tcw/impact/probability_points.h"

#include <string>
#include <vector>

namespace tcw {
namespace impact {

struct AxisLattice {
  i64 start = 0;
  i64 resolution = 0;
  usize count = 0;
};

// Lattice of one axis; `name` is used in error messages.
bool InferLattice(const std::vector<i64>& values,
                  i64 default_resolution,
                  const char* name,
                  AxisLattice* out,
                  std::string* err = nullptr);

// Upper bound on rows * cols of a built grid. A global grid at 1/24 degree
// has about 37 million cells.
inline constexpr usize kMaxGridCells = 64 * 1000 * 1000;

// Two points on the same cell are an error, and so is a lattice with more
// than kMaxGridCells cells (a stray off-lattice point shrinks the resolution).
bool BuildGrid(const ProbabilityPoints& points,
               i64 default_resolution,
               Grid* out,
               std::string* err = nullptr);

// Pads `grid` with a zero border of ceil(deficit / 2) cells when its smaller
// dimension is below `minimum_size`; otherwise returns it unchanged.
Grid EnsureMinimumGrid(const Grid& grid, usize minimum_size);

}  // namespace impact
}  // namespace tcw
