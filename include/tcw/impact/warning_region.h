#pragma once
// tcw/impact/warning_region.h
//
// Probability points -> warning-region polygons.
//
//   1. no probability > 0          -> empty region
//   2. BuildGrid, EnsureMinimumGrid
//   3. smoothing collaborator (levels [0, threshold], configured operations)
//   4. smoothed grid has no non-zero cell -> empty region
//   5. add a one-cell zero border if the edge is not all zero
//   6. ExtractPolygons at the threshold level
//
// An empty region is a valid result ("no warning").

#include "tcw/core/config.h"
#include "tcw/core/timer.h"
#include "tcw/core/types.h"
#include "tcw/geometry/geo.h"
#include "tcw/impact/probability_points.h"
#include "tcw/impact/smoothing.h"

#include <string>

namespace tcw {
namespace impact {

struct WarningRegionReport {
  usize points = 0;
  usize grid_rows = 0;   // after padding to the minimum size
  usize grid_cols = 0;
  usize warned_cells = 0;
  usize polygons = 0;

  std::string ToJsonLite() const;
};

bool ComputeWarningRegion(const ProbabilityPoints& points,
                          const IRasterSmoother& smoother,
                          const ImpactSettings& settings,
                          GeoMultiPolygon* out,
                          WarningRegionReport* report = nullptr,
                          PhaseRecorder* phases = nullptr,
                          std::string* err = nullptr);

}  // namespace impact
}  // namespace tcw
