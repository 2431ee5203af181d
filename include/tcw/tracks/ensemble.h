#pragma once
// tcw/tracks/ensemble.h
//
// A forecast ensemble: the tracks of all members of one storm forecast,
// each with its member name and model run (initialisation) time.
// Member order defines track indices used by the affected-country source.

#include "tcw/core/types.h"
#include "tcw/tracks/track.h"

#include <string>
#include <utility>
#include <vector>

namespace tcw {

struct EnsembleMember {
  std::string name;      // e.g. "ELOISE_12"
  Timestamp run_time = 0;
  Track track;
};

class TrackEnsemble {
 public:
  TrackEnsemble() = default;
  explicit TrackEnsemble(std::vector<EnsembleMember> members) : members_(std::move(members)) {}

  void Add(EnsembleMember m) { members_.push_back(std::move(m)); }

  usize size() const noexcept { return members_.size(); }
  bool empty() const noexcept { return members_.empty(); }

  const std::vector<EnsembleMember>& Members() const noexcept { return members_; }
  const EnsembleMember& Member(usize i) const { return members_[i]; }

  std::vector<Track> Tracks() const {
    std::vector<Track> out;
    out.reserve(members_.size());
    for (const auto& m : members_) out.push_back(m.track);
    return out;
  }

  std::vector<std::string> Names() const {
    std::vector<std::string> out;
    out.reserve(members_.size());
    for (const auto& m : members_) out.push_back(m.name);
    return out;
  }

  // Initialisation time of the forecast: the earliest member run time.
  bool InitTime(Timestamp* out, std::string* err = nullptr) const {
    if (!out) {
      SetErr(err, "TrackEnsemble::InitTime: out is null");
      return false;
    }
    if (members_.empty()) {
      SetErr(err, "Tracks are empty.");
      return false;
    }
    Timestamp t = members_.front().run_time;
    for (const auto& m : members_) {
      if (m.run_time < t) t = m.run_time;
    }
    *out = t;
    return true;
  }

 private:
  std::vector<EnsembleMember> members_;
};

}  // namespace tcw
