// src/impact/probability_points.cpp

#include "tcw/impact/probability_points.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace tcw {
namespace impact {

namespace {

// Lists at most this many offending points in an error message.
constexpr usize kMaxListedPoints = 10;

bool ReportOutOfRange(const std::vector<double>& latitudes,
                      const std::vector<double>& longitudes,
                      const std::vector<double>& probabilities,
                      bool below,
                      std::string* err) {
  usize count = 0;
  std::ostringstream listed;
  for (usize i = 0; i < probabilities.size(); ++i) {
    const double p = probabilities[i];
    if (below ? !(p < 0.0) : !(p > 1.0)) continue;
    if (count < kMaxListedPoints) {
      if (count) listed << ", ";
      listed << "(" << latitudes[i] << "," << longitudes[i] << ")=" << p;
    }
    ++count;
  }
  if (count == 0) return true;
  std::ostringstream oss;
  oss << count << " / " << probabilities.size() << " points are associated with probability "
      << (below ? "< 0" : "> 1") << ": " << listed.str();
  if (count > kMaxListedPoints) oss << ", ...";
  SetErr(err, oss.str());
  return false;
}

}  // namespace

bool ProbabilityPoints::FromDegrees(const std::vector<double>& latitudes,
                                    const std::vector<double>& longitudes,
                                    std::vector<double> probabilities,
                                    ProbabilityPoints* out,
                                    std::string* err) {
  if (!out) {
    SetErr(err, "ProbabilityPoints::FromDegrees: out is null");
    return false;
  }
  if (latitudes.size() != longitudes.size()) {
    SetErr(err, "Number of latitude values does not match number of longitude values: " +
                    std::to_string(latitudes.size()) + " != " + std::to_string(longitudes.size()));
    return false;
  }
  if (latitudes.size() != probabilities.size()) {
    SetErr(err, "Number of points does not match number of probability values: " +
                    std::to_string(latitudes.size()) + " != " + std::to_string(probabilities.size()));
    return false;
  }
  for (usize i = 0; i < latitudes.size(); ++i) {
    if (!std::isfinite(latitudes[i]) || !std::isfinite(longitudes[i]) || std::isnan(probabilities[i])) {
      std::ostringstream oss;
      oss << "Invalid point (" << latitudes[i] << "," << longitudes[i] << ")=" << probabilities[i] << " at index "
          << i;
      SetErr(err, oss.str());
      return false;
    }
  }
  if (!ReportOutOfRange(latitudes, longitudes, probabilities, /*below=*/true, err)) return false;
  if (!ReportOutOfRange(latitudes, longitudes, probabilities, /*below=*/false, err)) return false;

  ProbabilityPoints pts;
  pts.latitudes_.reserve(latitudes.size());
  pts.longitudes_.reserve(longitudes.size());
  for (usize i = 0; i < latitudes.size(); ++i) {
    pts.latitudes_.push_back(ToArcUnits(latitudes[i]));
    pts.longitudes_.push_back(ToArcUnits(longitudes[i]));
  }
  pts.probabilities_ = std::move(probabilities);
  *out = std::move(pts);
  return true;
}

}  // namespace impact
}  // namespace tcw
