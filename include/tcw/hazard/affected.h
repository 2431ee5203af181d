#pragma once
// tcw/hazard/affected.h
//
// Countries judged "affected" by the hazard-intensity field, each with the
// indices (into the ensemble) of the tracks that produced positive intensity
// there. Supplied by an external hazard simulation; StaticAffectedCountries
// holds a fixed set (from a TSV file or built in code).

#include "tcw/core/types.h"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace tcw {
namespace hazard {

using TracksPerCountry = std::map<CountryCode, std::set<usize>>;

class IAffectedCountrySource {
 public:
  virtual ~IAffectedCountrySource() = default;

  // Never contains code 0.
  virtual bool AffectedCountries(TracksPerCountry* out, std::string* err) const = 0;
};

class StaticAffectedCountries final : public IAffectedCountrySource {
 public:
  StaticAffectedCountries() = default;
  explicit StaticAffectedCountries(TracksPerCountry tracks) : tracks_(std::move(tracks)) {
    tracks_.erase(kNoCountry);
  }

  // TSV with header "country_code<TAB>track_index"; rows with code 0 are skipped.
  static bool LoadTsv(const std::string& path, StaticAffectedCountries* out, std::string* err = nullptr);

  void Add(CountryCode code, usize track_index) {
    if (code != kNoCountry) tracks_[code].insert(track_index);
  }

  bool AffectedCountries(TracksPerCountry* out, std::string* err) const override {
    if (!out) {
      SetErr(err, "AffectedCountries: out is null");
      return false;
    }
    *out = tracks_;
    return true;
  }

 private:
  TracksPerCountry tracks_;
};

}  // namespace hazard
}  // namespace tcw
