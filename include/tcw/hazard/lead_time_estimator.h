#pragma once
// tcw/hazard/lead_time_estimator.h
//
// Lead times per country for a forecast ensemble, resolved in tiers:
//
//   1. Landfall   densify all tracks to the grid resolution, resolve every
//                 point to a country, take per track the earliest time inside
//                 each country; median weighted by track frequency.
//   2. BandFall   affected countries without landfall: per track the first
//                 point within `landfall_radius_km` of the country geometry.
//   3. Closest    affected countries still unresolved: time of the single
//                 closest point over the tracks known to affect the country.
//   4. InitTime   optional: the forecast initialisation time for affected
//                 countries that no other tier resolved.
//
// Every tier emits CountryOutcome values; ReduceOutcomes merges them in tier
// order and keeps the first outcome per country, so a country resolved by an
// earlier tier is never overwritten.

#include "tcw/core/config.h"
#include "tcw/core/timer.h"
#include "tcw/core/types.h"
#include "tcw/geography/country.h"
#include "tcw/hazard/affected.h"
#include "tcw/hazard/lead_times.h"
#include "tcw/hazard/metadata.h"
#include "tcw/tracks/ensemble.h"
#include "tcw/tracks/track.h"

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tcw {
namespace hazard {

struct EstimatorOptions {
  double grid_resolution_deg = 1.0 / 24.0;
  double landfall_radius_km = 50.0;
  bool init_time_fallback = false;

  static EstimatorOptions FromConfig(const Config& cfg) {
    EstimatorOptions o;
    o.grid_resolution_deg = cfg.tracks.grid_resolution_deg;
    o.landfall_radius_km = cfg.tracks.landfall_radius_km;
    o.init_time_fallback = cfg.tracks.init_time_fallback;
    return o;
  }
};

// --------------------------
// Tier outcomes
// --------------------------
struct Landfall {
  LeadTimes lead_times;
};

struct BandFall {
  LeadTimes lead_times;
};

struct Closest {
  Timestamp time = 0;
  usize track_index = 0;
  double distance_km = 0.0;
};

struct InitTime {
  Timestamp time = 0;
};

using TierOutcome = std::variant<Landfall, BandFall, Closest, InitTime>;

struct CountryOutcome {
  CountryCode country = kNoCountry;
  TierOutcome outcome;
};

// 1 (landfall) .. 4 (initialisation time).
inline int TierOf(const TierOutcome& o) noexcept { return static_cast<int>(o.index()) + 1; }

std::string_view TierName(const TierOutcome& o) noexcept;

LeadTimes ToLeadTimes(const TierOutcome& o);

using ResolvedCountries = std::map<CountryCode, TierOutcome>;

// Deterministic first-writer-wins merge: outcomes are considered by tier, then
// in input order.
ResolvedCountries ReduceOutcomes(std::vector<CountryOutcome> outcomes);

// --------------------------
// Tiers
// --------------------------
// `tracks` are used as given (callers densify them for tier 1). Outcomes are
// appended in ascending country order.
bool CalculateLandfalls(const std::vector<Track>& tracks,
                        const geography::ICountryLookup& lookup,
                        std::vector<CountryOutcome>* out,
                        std::string* err = nullptr);

bool CalculateBandFalls(const std::vector<Track>& tracks,
                        const geography::ICountryLookup& lookup,
                        const std::vector<CountryCode>& countries,
                        double radius_km,
                        std::vector<CountryOutcome>* out,
                        std::string* err = nullptr);

// Track indices out of range are an error; a country with no track indices
// yields no outcome.
bool CalculateClosestTimes(const std::vector<Track>& tracks,
                           const geography::ICountryLookup& lookup,
                           const TracksPerCountry& countries,
                           std::vector<CountryOutcome>* out,
                           std::string* err = nullptr);

std::vector<CountryOutcome> InitTimeOutcomes(Timestamp init_time, const std::vector<CountryCode>& countries);

// --------------------------
// Full estimation
// --------------------------
struct EstimateReport {
  std::map<CountryCode, int> tier_per_country;
  usize landfall_countries = 0;
  usize band_fall_countries = 0;
  usize closest_countries = 0;
  usize init_time_countries = 0;
  std::vector<CountryCode> unresolved;  // affected but without any outcome

  std::string ToJsonLite() const;
};

// `affected` may be null: only tier 1 runs then. `report` and `phases` may be
// null.
bool EstimateLeadTimes(const TrackEnsemble& ensemble,
                       const geography::ICountryLookup& lookup,
                       const IAffectedCountrySource* affected,
                       const EstimatorOptions& options,
                       HazardMetadata* out,
                       EstimateReport* report = nullptr,
                       PhaseRecorder* phases = nullptr,
                       std::string* err = nullptr);

}  // namespace hazard
}  // namespace tcw
