#pragma once
// tcw/io/track_io.h
//
// Forecast ensemble CSV.
//
// Columns (header required, any order): member, run_time, time, lat, lon and
// optionally frequency. One row per track point; the rows of a member are its
// points in track order, members are ordered by first appearance. run_time and
// frequency must be constant within a member; frequency defaults to 1.

#include "tcw/core/types.h"
#include "tcw/tracks/ensemble.h"

#include <string>

namespace tcw {
namespace io {

bool ReadEnsembleCsv(const std::string& path, TrackEnsemble* out, std::string* err = nullptr);

bool WriteEnsembleCsv(const std::string& path, const TrackEnsemble& ensemble, std::string* err = nullptr);

}  // namespace io
}  // namespace tcw
