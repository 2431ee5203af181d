// src/impact/smoothing.cpp

#include "tcw/impact/smoothing.h"

#include "tcw/core/logging.h"

#include <cmath>
#include <sstream>

namespace tcw {
namespace impact {

std::string_view ToString(SmoothingOperation op) noexcept {
  switch (op) {
    case SmoothingOperation::Erosion: return "erosion";
    case SmoothingOperation::Dilation: return "dilation";
    case SmoothingOperation::MedianFiltering: return "median_filtering";
  }
  return "unknown";
}

SmoothingParameters SmoothingParameters::FromSettings(const ImpactSettings& settings) {
  SmoothingParameters p;
  p.levels = {0.0, settings.probability_threshold};
  p.operations = {
      {SmoothingOperation::Erosion, settings.warn.erosion},
      {SmoothingOperation::Dilation, settings.warn.dilation},
      {SmoothingOperation::MedianFiltering, settings.warn.median_filtering},
  };
  p.gradual_decrease = settings.warn.gradually_decreased;
  p.small_region_threshold = settings.warn.small_regions_threshold;
  return p;
}

bool SmoothingParameters::Validate(std::string* err) const {
  if (levels.size() < 2) {
    SetErr(err, "SmoothingParameters: at least two levels are required");
    return false;
  }
  for (usize i = 1; i < levels.size(); ++i) {
    if (!(levels[i] > levels[i - 1])) {
      SetErr(err, "SmoothingParameters: levels must be strictly increasing");
      return false;
    }
  }
  for (const auto& op : operations) {
    if (op.second < 0) {
      SetErr(err, "SmoothingParameters: size of " + std::string(ToString(op.first)) + " must be >= 0");
      return false;
    }
  }
  if (small_region_threshold < 0) {
    SetErr(err, "SmoothingParameters: small_region_threshold must be >= 0");
    return false;
  }
  return true;
}

std::string SmoothingParameters::ToJsonLite() const {
  std::ostringstream oss;
  oss << "{\"levels\":[";
  for (usize i = 0; i < levels.size(); ++i) {
    if (i) oss << ",";
    oss << levels[i];
  }
  oss << "],\"operations\":[";
  for (usize i = 0; i < operations.size(); ++i) {
    if (i) oss << ",";
    oss << "[\"" << ToString(operations[i].first) << "\"," << operations[i].second << "]";
  }
  oss << "],\"gradual_decrease\":" << (gradual_decrease ? "true" : "false")
      << ",\"small_region_threshold\":" << small_region_threshold << "}";
  return oss.str();
}

bool ThresholdSmoother::Smooth(const Grid& grid,
                               const SmoothingParameters& params,
                               Grid* out,
                               std::string* err) const {
  if (!out) {
    SetErr(err, "ThresholdSmoother::Smooth: out is null");
    return false;
  }
  if (!params.Validate(err)) return false;

  bool morphology = params.small_region_threshold > 0;
  for (const auto& op : params.operations) morphology = morphology || op.second > 0;
  if (morphology) {
    TCW_LOG_WARN("smoothing", "threshold smoother ignores morphological operations", params.ToJsonLite());
  }

  const double level = params.levels.back();
  std::vector<double> binary(grid.size());
  for (usize i = 0; i < grid.size(); ++i) binary[i] = (grid.Values()[i] >= level) ? 1.0 : 0.0;
  return grid.WithNewValues(std::move(binary), out, err);
}

bool CheckBinaryGrid(const Grid& input, const Grid& smoothed, std::string* err) {
  if (smoothed.Rows() != input.Rows() || smoothed.Cols() != input.Cols() || smoothed.Start() != input.Start() ||
      smoothed.Resolution() != input.Resolution()) {
    std::ostringstream oss;
    oss << "Smoothed grid " << smoothed.Rows() << "x" << smoothed.Cols() << " does not match input grid "
        << input.Rows() << "x" << input.Cols();
    SetErr(err, oss.str());
    return false;
  }
  for (usize i = 0; i < smoothed.size(); ++i) {
    const double v = smoothed.Values()[i];
    if (v != 0.0 && v != 1.0) {
      SetErr(err, "Smoothed grid is not binary: value " + std::to_string(v) + " at cell " + std::to_string(i));
      return false;
    }
  }
  return true;
}

}  // namespace impact
}  // namespace tcw
