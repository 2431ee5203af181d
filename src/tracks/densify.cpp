// src/tracks/densify.cpp

#include "tcw/tracks/densify.h"

#include "tcw/core/assert.h"
#include "tcw/core/logging.h"

#include <cmath>
#include <utility>

namespace tcw {

usize RequiredInsertions(double distance, double max_distance) {
  const double required = std::ceil(distance / max_distance - 1.0);
  return (required > 0.0) ? static_cast<usize>(required) : usize{0};
}

bool DensifyTrack(const Track& track, double max_distance, Track* out, std::string* err) {
  if (!out) {
    SetErr(err, "DensifyTrack: out is null");
    return false;
  }
  if (!(max_distance > 0.0) || !std::isfinite(max_distance)) {
    SetErr(err, "DensifyTrack: max_distance must be finite and > 0, got " + std::to_string(max_distance));
    return false;
  }
  if (track.empty()) {
    SetErr(err, "DensifyTrack: track has no points");
    return false;
  }

  const usize n = track.size();
  std::vector<double> lats;
  std::vector<double> lons;
  std::vector<Timestamp> times;
  lats.reserve(n);
  lons.reserve(n);
  times.reserve(n);

  for (usize i = 0; i + 1 < n; ++i) {
    const LatLon a = track.PointAt(i);
    const LatLon b = track.PointAt(i + 1);
    const usize required = RequiredInsertions(PlanarDistance(a, b), max_distance);
    const double slots = static_cast<double>(required + 1);

    // Segment start plus `required` inserted points; the end is the next start.
    for (usize r = 0; r <= required; ++r) {
      const LatLon p = Lerp(a, b, static_cast<double>(r) / slots);
      lats.push_back(p.lat);
      lons.push_back(p.lon);
      times.push_back(r <= required / 2 ? track.Time(i) : track.Time(i + 1));
    }
  }
  lats.push_back(track.Latitude(n - 1));
  lons.push_back(track.Longitude(n - 1));
  times.push_back(track.Time(n - 1));

  return Track::Create(std::move(lats), std::move(lons), std::move(times), track.Frequency(), out, err);
}

bool DensifyTracks(const std::vector<Track>& tracks,
                   double max_distance,
                   std::vector<Track>* out,
                   std::string* err) {
  if (!out) {
    SetErr(err, "DensifyTracks: out is null");
    return false;
  }
  std::vector<Track> dense;
  dense.reserve(tracks.size());
  usize before = 0, after = 0;
  for (usize i = 0; i < tracks.size(); ++i) {
    Track t;
    std::string local_err;
    if (!DensifyTrack(tracks[i], max_distance, &t, &local_err)) {
      SetErr(err, "Track " + std::to_string(i) + ": " + local_err);
      return false;
    }
    TCW_CHECK_LE(tracks[i].size(), t.size());
    before += tracks[i].size();
    after += t.size();
    dense.push_back(std::move(t));
  }
  TCW_LOG_DEBUG("densify", "densified", tracks.size(), "tracks from", before, "to", after,
                "points at max distance", max_distance);
  *out = std::move(dense);
  return true;
}

}  // namespace tcw
