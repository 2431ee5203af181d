// src/tracks/track.cpp

#include "tcw/tracks/track.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace tcw {

bool Track::Create(std::vector<double> latitudes,
                   std::vector<double> longitudes,
                   std::vector<Timestamp> times,
                   double frequency,
                   Track* out,
                   std::string* err) {
  if (!out) {
    SetErr(err, "Track::Create: out is null");
    return false;
  }
  if (latitudes.size() != longitudes.size() || latitudes.size() != times.size()) {
    std::ostringstream oss;
    oss << "Numbers of latitudes, longitudes and times do not match: " << latitudes.size() << " <> "
        << longitudes.size() << " <> " << times.size();
    SetErr(err, oss.str());
    return false;
  }
  if (times.empty()) {
    SetErr(err, "Track::Create: track has no points");
    return false;
  }
  for (usize i = 0; i < latitudes.size(); ++i) {
    if (!std::isfinite(latitudes[i]) || !std::isfinite(longitudes[i])) {
      std::ostringstream oss;
      oss << "Track::Create: non-finite coordinate (" << latitudes[i] << "," << longitudes[i]
          << ") at index " << i;
      SetErr(err, oss.str());
      return false;
    }
  }
  if (!std::isfinite(frequency) || frequency < 0.0) {
    SetErr(err, "Track::Create: frequency must be finite and >= 0, got " + std::to_string(frequency));
    return false;
  }

  Track t;
  t.latitudes_ = std::move(latitudes);
  t.longitudes_ = std::move(longitudes);
  t.times_ = std::move(times);
  t.frequency_ = frequency;
  *out = std::move(t);
  return true;
}

}  // namespace tcw
