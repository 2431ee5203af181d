// apps/tcw_warning_region.cpp
//
// Warning region from impact probabilities.
//
// What it does:
//   1) Read probability points (CSV: lat,lon,probability)
//   2) Build the lattice grid, smooth it with the threshold smoother
//   3) Extract the region above --probability_threshold
//   4) Write <out_dir>/<event_tag>warning_region.geojson and .wkt
//
// Example:
//   ./tcw_warning_region --points=probabilities.csv --probability_threshold=0.05 --out_dir=out

#include "tcw/core/config.h"
#include "tcw/core/logging.h"
#include "tcw/core/timer.h"
#include "tcw/core/types.h"

#include "tcw/impact/probability_points.h"
#include "tcw/impact/smoothing.h"
#include "tcw/impact/warning_region.h"
#include "tcw/io/csv_io.h"
#include "tcw/io/polygon_io.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace tcw {
namespace apps {

namespace {

inline bool IsHelpRequested(const ArgMap& args) {
  return args.Has("help") || args.Has("h");
}

inline bool EnsureDir(const fs::path& p, std::string* err) {
  try {
    if (p.empty()) return true;
    fs::create_directories(p);
    return true;
  } catch (const std::exception& e) {
    SetErr(err, std::string("create_directories failed: ") + e.what());
    return false;
  }
}

inline void PrintUsage() {
  std::cerr
      << "tcw_warning_region: warning-region polygons from impact probabilities\n\n"
      << "  --points=<csv>                  columns lat,lon,probability\n"
      << "  --crs=<name>                    (default EPSG:4326) CRS tag of the GeoJSON output\n"
      << "  --probability_threshold=<f>     (default 0.05)\n"
      << "  --default_grid_resolution=<i>   (default 150000) arc-ms, single-sample axes\n"
      << "  --minimum_grid_size=<i>         (default 10)\n"
      << "  --erosion --dilation --median_filtering --gradually_decreased --small_regions_threshold\n"
      << "                                  passed to the smoother (threshold smoother ignores them)\n"
      << "  --out_dir=<dir>                 (default out)\n"
      << "  --event_tag=<prefix>            prefix for output file names\n"
      << "  --log_level=<lvl>               trace|debug|info|warn|error|off\n";
}

bool LoadProbabilityPoints(const std::string& path, impact::ProbabilityPoints* out, std::string* err) {
  csv::Table table;
  if (!csv::ReadTable(path, csv::kCsv, /*has_header=*/true, &table, err)) return false;
  const auto c_lat = table.ColumnIndex("lat");
  const auto c_lon = table.ColumnIndex("lon");
  const auto c_p = table.ColumnIndex("probability");
  if (!c_lat || !c_lon || !c_p) {
    SetErr(err, path + ": expected columns lat,lon,probability");
    return false;
  }

  std::vector<double> lats, lons, probs;
  lats.reserve(table.rows.size());
  lons.reserve(table.rows.size());
  probs.reserve(table.rows.size());
  for (usize r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    double lat = 0.0, lon = 0.0, p = 0.0;
    if (row.size() != table.header.size() || !csv::ParseDouble(row[*c_lat], &lat) ||
        !csv::ParseDouble(row[*c_lon], &lon) || !csv::ParseDouble(row[*c_p], &p)) {
      SetErr(err, path + ": " + table.Where(r) + ": malformed row");
      return false;
    }
    lats.push_back(lat);
    lons.push_back(lon);
    probs.push_back(p);
  }
  return impact::ProbabilityPoints::FromDegrees(lats, lons, std::move(probs), out, err);
}

}  // namespace

}  // namespace apps
}  // namespace tcw

int main(int argc, char** argv) {
  const tcw::ArgMap args = tcw::ArgMap::FromArgv(argc, argv);
  if (tcw::apps::IsHelpRequested(args)) {
    tcw::apps::PrintUsage();
    return 0;
  }

  tcw::Config cfg;
  std::string err;
  if (!tcw::Config::FromArgs(argc, argv, &cfg, &err) || !cfg.Validate(&err)) {
    TCW_LOG_ERROR("app", "Config validation failed:", err);
    tcw::apps::PrintUsage();
    return 2;
  }
  tcw::Logger::Instance().SetConfig(cfg.logging);
  const tcw::Stopwatch wall;
  TCW_LOG_DEBUG("app", "config", cfg.ToJsonLite());

  const auto points_path = cfg.Extra("points");
  if (!points_path || points_path->empty() || *points_path == "true") {
    TCW_LOG_ERROR("app", "Missing required --points");
    tcw::apps::PrintUsage();
    return 2;
  }
  const std::string crs(cfg.Extra("crs").value_or(tcw::io::kDefaultCrs));

  tcw::impact::ProbabilityPoints points;
  if (!tcw::apps::LoadProbabilityPoints(std::string(*points_path), &points, &err)) {
    TCW_LOG_ERROR("app", "Reading probability points failed:", err);
    return 3;
  }
  TCW_LOG_INFO("app", "probability points:", points.size());

  const tcw::impact::ThresholdSmoother smoother;
  tcw::GeoMultiPolygon region;
  tcw::impact::WarningRegionReport report;
  tcw::PhaseRecorder phases;
  if (!tcw::impact::ComputeWarningRegion(points, smoother, cfg.impact, &region, &report, &phases, &err)) {
    TCW_LOG_ERROR("app", "Warning region extraction failed:", err);
    return 4;
  }
  TCW_LOG_INFO("app", "phases", phases.ToJsonMillis());
  TCW_LOG_INFO("app", "region", report.ToJsonLite());

  const fs::path out_dir(cfg.output.out_dir);
  if (!tcw::apps::EnsureDir(out_dir, &err)) {
    TCW_LOG_ERROR("app", err);
    return 5;
  }
  const std::string stem = cfg.output.event_tag + "warning_region";
  if (!tcw::io::WriteGeoJson((out_dir / (stem + ".geojson")).string(), region, crs, &err) ||
      !tcw::io::WriteWkt((out_dir / (stem + ".wkt")).string(), region, &err)) {
    TCW_LOG_ERROR("app", "Writing warning region failed:", err);
    return 5;
  }

  std::cout << report.ToJsonLite() << "\n";
  TCW_LOG_INFO("app", "done in", wall.ElapsedMillis(), "ms");
  return 0;
}
