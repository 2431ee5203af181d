#pragma once
// tcw/tracks/densify.h
//
// Track densification: insert evenly spaced points so that consecutive points
// are never farther apart than a maximum planar distance (degrees).
//
// For a segment of length d, ceil(d / max_distance) - 1 points are inserted
// (none when d <= max_distance). The inserted points of a segment take the
// segment's start time for the first half of the slots (r <= required / 2)
// and its end time for the rest. The last point of the track is always kept.

#include "tcw/core/types.h"
#include "tcw/tracks/track.h"

#include <string>
#include <vector>

namespace tcw {

// Number of points to insert between two points `distance` apart.
usize RequiredInsertions(double distance, double max_distance);

bool DensifyTrack(const Track& track, double max_distance, Track* out, std::string* err = nullptr);

bool DensifyTracks(const std::vector<Track>& tracks,
                   double max_distance,
                   std::vector<Track>* out,
                   std::string* err = nullptr);

}  // namespace tcw
