// src/impact/warning_region.cpp

#include "tcw/impact/warning_region.h"

#include "tcw/core/logging.h"
#include "tcw/impact/contour.h"
#include "tcw/impact/grid_builder.h"

#include <sstream>

namespace tcw {
namespace impact {

std::string WarningRegionReport::ToJsonLite() const {
  std::ostringstream oss;
  oss << "{\"points\":" << points << ",\"grid_rows\":" << grid_rows << ",\"grid_cols\":" << grid_cols
      << ",\"warned_cells\":" << warned_cells << ",\"polygons\":" << polygons << "}";
  return oss.str();
}

bool ComputeWarningRegion(const ProbabilityPoints& points,
                          const IRasterSmoother& smoother,
                          const ImpactSettings& settings,
                          GeoMultiPolygon* out,
                          WarningRegionReport* report,
                          PhaseRecorder* phases,
                          std::string* err) {
  if (!out) {
    SetErr(err, "ComputeWarningRegion: out is null");
    return false;
  }
  out->clear();
  WarningRegionReport rep;
  rep.points = points.size();

  if (!points.AnyPositive()) {
    TCW_LOG_INFO("warning_region", "None of", points.size(), "points has got a probability greater than 0.");
    if (report) *report = rep;
    return true;
  }

  Grid grid;
  {
    auto phase = PhaseRecorder::Scoped(phases, "grid");
    Grid raw;
    if (!BuildGrid(points, settings.default_grid_resolution, &raw, err)) return false;
    grid = EnsureMinimumGrid(raw, static_cast<usize>(settings.minimum_grid_size));
  }
  rep.grid_rows = grid.Rows();
  rep.grid_cols = grid.Cols();

  Grid warn_grid;
  {
    auto phase = PhaseRecorder::Scoped(phases, "smoothing");
    const SmoothingParameters params = SmoothingParameters::FromSettings(settings);
    std::string local_err;
    if (!smoother.Smooth(grid, params, &warn_grid, &local_err)) {
      SetErr(err, "Smoothing (" + std::string(smoother.Name()) + ") failed: " + local_err);
      return false;
    }
    if (!CheckBinaryGrid(grid, warn_grid, err)) return false;
  }

  rep.warned_cells = warn_grid.CountNonZero();
  if (rep.warned_cells == 0) {
    TCW_LOG_INFO("warning_region", "Grid", warn_grid.Rows(), "x", warn_grid.Cols(),
                 "only contains values with 0 probability.");
    if (report) *report = rep;
    return true;
  }

  {
    auto phase = PhaseRecorder::Scoped(phases, "polygons");
    const Grid bordered = warn_grid.HasBorder() ? warn_grid : warn_grid.AddBorder(1);
    if (!ExtractPolygons(bordered, settings.probability_threshold, out, err)) return false;
  }
  rep.polygons = out->size();
  TCW_LOG_DEBUG("warning_region", "warning region", rep.ToJsonLite());
  if (report) *report = rep;
  return true;
}

}  // namespace impact
}  // namespace tcw
