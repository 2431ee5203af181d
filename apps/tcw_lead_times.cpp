// apps/tcw_lead_times.cpp
//
// Lead times per country for a forecast ensemble.
//
// What it does:
//   1) Read the ensemble CSV (member,run_time,time,lat,lon[,frequency])
//   2) Load the country gazetteer TSV and, if given, the affected countries
//   3) Run the tiered estimator (landfall, band-fall, closest point)
//   4) Write <out_dir>/<event_tag>lead_times.json and .tsv
//
// Example:
//   ./tcw_lead_times --tracks=eloise.csv --gazetteer=countries.tsv
//                    --affected=affected.tsv --landfall_radius_km=50 --out_dir=out

#include "tcw/core/config.h"
#include "tcw/core/logging.h"
#include "tcw/core/time.h"
#include "tcw/core/timer.h"
#include "tcw/core/types.h"

#include "tcw/geography/polygon_gazetteer.h"
#include "tcw/hazard/affected.h"
#include "tcw/hazard/lead_time_estimator.h"
#include "tcw/hazard/metadata.h"
#include "tcw/io/metadata_io.h"
#include "tcw/io/track_io.h"
#include "tcw/tracks/ensemble.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

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
      << "tcw_lead_times: lead times per country for a cyclone track ensemble\n\n"
      << "Inputs:\n"
      << "  --tracks=<csv>               ensemble: member,run_time,time,lat,lon[,frequency]\n"
      << "  --gazetteer=<tsv>            countries: numeric,alpha2,alpha3,name,wkt\n"
      << "  --affected=<tsv>             optional: country_code,track_index\n"
      << "Estimation:\n"
      << "  --grid_resolution_deg=<f>    (default 1/24)  densification spacing\n"
      << "  --landfall_radius_km=<f>     (default 50)    band-fall radius\n"
      << "  --init_time_fallback=<bool>  (default false) use the init time for unresolved countries\n"
      << "Output:\n"
      << "  --out_dir=<dir>              (default out)\n"
      << "  --event_tag=<prefix>         prefix for output file names\n"
      << "  --log_level=<lvl>            trace|debug|info|warn|error|off\n";
}

inline bool RequiredPath(const Config& cfg, std::string_view key, std::string* out, std::string* err) {
  const auto v = cfg.Extra(key);
  if (!v || v->empty() || *v == "true") {
    SetErr(err, "Missing required --" + std::string(key));
    return false;
  }
  *out = std::string(*v);
  return true;
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

  const tcw::hazard::EstimatorOptions options = tcw::hazard::EstimatorOptions::FromConfig(cfg);

  std::string tracks_path, gazetteer_path;
  if (!tcw::apps::RequiredPath(cfg, "tracks", &tracks_path, &err) ||
      !tcw::apps::RequiredPath(cfg, "gazetteer", &gazetteer_path, &err)) {
    TCW_LOG_ERROR("app", err);
    tcw::apps::PrintUsage();
    return 2;
  }

  // Inputs.
  tcw::TrackEnsemble ensemble;
  if (!tcw::io::ReadEnsembleCsv(tracks_path, &ensemble, &err)) {
    TCW_LOG_ERROR("app", "Reading tracks failed:", err);
    return 3;
  }
  tcw::geography::PolygonGazetteer gazetteer;
  if (!tcw::geography::PolygonGazetteer::LoadTsv(gazetteer_path, &gazetteer, &err)) {
    TCW_LOG_ERROR("app", "Loading gazetteer failed:", err);
    return 3;
  }
  std::unique_ptr<tcw::hazard::StaticAffectedCountries> affected;
  if (auto v = cfg.Extra("affected")) {
    affected = std::make_unique<tcw::hazard::StaticAffectedCountries>();
    if (!tcw::hazard::StaticAffectedCountries::LoadTsv(std::string(*v), affected.get(), &err)) {
      TCW_LOG_ERROR("app", "Loading affected countries failed:", err);
      return 3;
    }
  }
  TCW_LOG_INFO("app", "ensemble members:", ensemble.size(), "countries:", gazetteer.size());

  // Estimation.
  tcw::hazard::HazardMetadata metadata;
  tcw::hazard::EstimateReport report;
  tcw::PhaseRecorder phases;
  if (!tcw::hazard::EstimateLeadTimes(ensemble, gazetteer, affected.get(), options, &metadata, &report, &phases,
                                      &err)) {
    TCW_LOG_ERROR("app", "Lead time estimation failed:", err);
    return 4;
  }
  TCW_LOG_INFO("app", "phases", phases.ToJsonMillis());
  TCW_LOG_INFO("app", "tiers", report.ToJsonLite());
  for (const auto code : metadata.CountryCodes()) {
    tcw::hazard::LeadTimes lt;
    if (metadata.GetLeadTimes(code, &lt, &err)) {
      TCW_LOG_INFO("app", "country", code, "median lead time", tcw::FormatTimestamp(lt.Median()));
    }
  }

  // Output.
  const fs::path out_dir(cfg.output.out_dir);
  if (!tcw::apps::EnsureDir(out_dir, &err)) {
    TCW_LOG_ERROR("app", err);
    return 5;
  }
  const std::string stem = cfg.output.event_tag + "lead_times";
  if (!tcw::io::WriteMetadataJson((out_dir / (stem + ".json")).string(), metadata, &gazetteer, &err) ||
      !tcw::io::WriteMetadataTsv((out_dir / (stem + ".tsv")).string(), metadata, &err)) {
    TCW_LOG_ERROR("app", "Writing metadata failed:", err);
    return 5;
  }

  std::cout << metadata.ToString() << "\n";
  TCW_LOG_INFO("app", "done in", wall.ElapsedMillis(), "ms");
  return 0;
}
