// src/hazard/lead_time_estimator.cpp

#include "tcw/hazard/lead_time_estimator.h"

#include "tcw/core/logging.h"
#include "tcw/hazard/names.h"
#include "tcw/tracks/densify.h"
#include "tcw/tracks/proximity.h"

#include <algorithm>
#include <limits>
#include <set>
#include <sstream>
#include <type_traits>
#include <utility>

namespace tcw {
namespace hazard {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string JoinCodes(const std::vector<CountryCode>& codes) {
  std::ostringstream oss;
  oss << "[";
  for (usize i = 0; i < codes.size(); ++i) {
    if (i) oss << ", ";
    oss << codes[i];
  }
  oss << "]";
  return oss.str();
}

template <class Map>
std::vector<CountryCode> KeysOf(const Map& m) {
  std::vector<CountryCode> out;
  out.reserve(m.size());
  for (const auto& kv : m) out.push_back(kv.first);
  return out;
}

// Countries whose geometry is unknown to the gazetteer are skipped.
bool LoadGeometry(const geography::ICountryLookup& lookup, CountryCode code, GeoMultiPolygon* out) {
  std::string err;
  if (lookup.LookupGeometry(code, out, &err)) return true;
  TCW_LOG_WARN("lead_times", "no geometry for country", code, "-", err);
  return false;
}

}  // namespace

std::string_view TierName(const TierOutcome& o) noexcept {
  switch (o.index()) {
    case 0: return "landfall";
    case 1: return "band_fall";
    case 2: return "closest";
    case 3: return "init_time";
  }
  return "unknown";
}

LeadTimes ToLeadTimes(const TierOutcome& o) {
  return std::visit(Overloaded{
                        [](const Landfall& v) { return v.lead_times; },
                        [](const BandFall& v) { return v.lead_times; },
                        [](const Closest& v) { return LeadTimes::FromMedian(v.time); },
                        [](const InitTime& v) { return LeadTimes::FromMedian(v.time); },
                    },
                    o);
}

ResolvedCountries ReduceOutcomes(std::vector<CountryOutcome> outcomes) {
  std::stable_sort(outcomes.begin(), outcomes.end(), [](const CountryOutcome& a, const CountryOutcome& b) {
    return TierOf(a.outcome) < TierOf(b.outcome);
  });
  ResolvedCountries resolved;
  for (auto& o : outcomes) {
    if (o.country == kNoCountry) continue;
    resolved.emplace(o.country, std::move(o.outcome));
  }
  return resolved;
}

// --------------------------
// Tier 1
// --------------------------
bool CalculateLandfalls(const std::vector<Track>& tracks,
                        const geography::ICountryLookup& lookup,
                        std::vector<CountryOutcome>* out,
                        std::string* err) {
  if (!out) {
    SetErr(err, "CalculateLandfalls: out is null");
    return false;
  }
  if (tracks.empty()) return true;

  std::vector<double> lats;
  std::vector<double> lons;
  for (const auto& t : tracks) {
    lats.insert(lats.end(), t.Latitudes().begin(), t.Latitudes().end());
    lons.insert(lons.end(), t.Longitudes().begin(), t.Longitudes().end());
  }

  std::vector<CountryCode> codes;
  std::string local_err;
  if (!lookup.ResolveCountryCodes(Span<const double>(lats), Span<const double>(lons), &codes, &local_err)) {
    SetErr(err, "Resolving country codes failed: " + local_err);
    return false;
  }
  if (codes.size() != lats.size()) {
    SetErr(err, "Country lookup returned " + std::to_string(codes.size()) + " codes for " +
                    std::to_string(lats.size()) + " points");
    return false;
  }

  // country -> (earliest time per contributing track, track frequency), in track order
  struct Contributions {
    std::vector<Timestamp> times;
    std::vector<double> weights;
  };
  std::map<CountryCode, Contributions> per_country;

  usize offset = 0;
  for (const auto& t : tracks) {
    std::map<CountryCode, Timestamp> earliest;
    for (usize i = 0; i < t.size(); ++i) {
      const CountryCode c = codes[offset + i];
      if (c == kNoCountry) continue;
      auto it = earliest.find(c);
      if (it == earliest.end()) {
        earliest.emplace(c, t.Time(i));
      } else if (t.Time(i) < it->second) {
        it->second = t.Time(i);
      }
    }
    for (const auto& kv : earliest) {
      auto& contrib = per_country[kv.first];
      contrib.times.push_back(kv.second);
      contrib.weights.push_back(t.Frequency());
    }
    offset += t.size();
  }

  for (auto& kv : per_country) {
    Landfall landfall;
    if (!LeadTimes::FromTimes(std::move(kv.second.times), kv.second.weights, &landfall.lead_times, &local_err)) {
      SetErr(err, "Landfall lead times for country " + std::to_string(kv.first) + ": " + local_err);
      return false;
    }
    out->push_back(CountryOutcome{kv.first, std::move(landfall)});
  }

  TCW_LOG_DEBUG("lead_times", "landfall in countries:", JoinCodes(KeysOf(per_country)));
  return true;
}

// --------------------------
// Tier 2
// --------------------------
bool CalculateBandFalls(const std::vector<Track>& tracks,
                        const geography::ICountryLookup& lookup,
                        const std::vector<CountryCode>& countries,
                        double radius_km,
                        std::vector<CountryOutcome>* out,
                        std::string* err) {
  if (!out) {
    SetErr(err, "CalculateBandFalls: out is null");
    return false;
  }
  const std::set<CountryCode> ordered(countries.begin(), countries.end());
  std::vector<CountryCode> found;
  std::string local_err;

  for (const CountryCode code : ordered) {
    if (code == kNoCountry) continue;
    GeoMultiPolygon geometry;
    if (!LoadGeometry(lookup, code, &geometry)) continue;

    std::vector<Timestamp> first_times;
    std::vector<double> weights;
    for (const auto& t : tracks) {
      std::optional<Timestamp> first;
      if (!FindFirstTimeCloserThan(t, geometry, radius_km, &first, &local_err)) {
        SetErr(err, "Band-fall for country " + std::to_string(code) + ": " + local_err);
        return false;
      }
      if (first) {
        first_times.push_back(*first);
        weights.push_back(t.Frequency());
      }
    }
    if (first_times.empty()) continue;

    BandFall band_fall;
    if (!LeadTimes::FromTimes(std::move(first_times), weights, &band_fall.lead_times, &local_err)) {
      SetErr(err, "Band-fall lead times for country " + std::to_string(code) + ": " + local_err);
      return false;
    }
    out->push_back(CountryOutcome{code, std::move(band_fall)});
    found.push_back(code);
  }

  TCW_LOG_DEBUG("lead_times", "band-fall within", radius_km, "km in countries:", JoinCodes(found));
  return true;
}

// --------------------------
// Tier 3
// --------------------------
bool CalculateClosestTimes(const std::vector<Track>& tracks,
                           const geography::ICountryLookup& lookup,
                           const TracksPerCountry& countries,
                           std::vector<CountryOutcome>* out,
                           std::string* err) {
  if (!out) {
    SetErr(err, "CalculateClosestTimes: out is null");
    return false;
  }
  std::vector<CountryCode> found;
  std::string local_err;

  for (const auto& kv : countries) {
    const CountryCode code = kv.first;
    if (code == kNoCountry || kv.second.empty()) continue;
    for (const usize idx : kv.second) {
      if (idx >= tracks.size()) {
        SetErr(err, "Track index " + std::to_string(idx) + " for country " + std::to_string(code) +
                        " is out of range (" + std::to_string(tracks.size()) + " tracks)");
        return false;
      }
    }
    GeoMultiPolygon geometry;
    if (!LoadGeometry(lookup, code, &geometry)) continue;

    Closest best;
    best.distance_km = std::numeric_limits<double>::infinity();
    bool any = false;
    for (const usize idx : kv.second) {
      ClosestPoint p;
      if (!FindClosestPoint(tracks[idx], geometry, &p, &local_err)) {
        SetErr(err, "Closest point of track " + std::to_string(idx) + " to country " + std::to_string(code) +
                        ": " + local_err);
        return false;
      }
      if (p.distance_km < best.distance_km) {
        best.time = p.time;
        best.track_index = idx;
        best.distance_km = p.distance_km;
        any = true;
      }
    }
    if (!any) continue;
    out->push_back(CountryOutcome{code, best});
    found.push_back(code);
  }

  TCW_LOG_DEBUG("lead_times", "closest-point fallback for countries:", JoinCodes(found));
  return true;
}

std::vector<CountryOutcome> InitTimeOutcomes(Timestamp init_time, const std::vector<CountryCode>& countries) {
  const std::set<CountryCode> ordered(countries.begin(), countries.end());
  std::vector<CountryOutcome> out;
  for (const CountryCode code : ordered) {
    if (code == kNoCountry) continue;
    out.push_back(CountryOutcome{code, InitTime{init_time}});
  }
  return out;
}

// --------------------------
// Full estimation
// --------------------------
std::string EstimateReport::ToJsonLite() const {
  std::ostringstream oss;
  oss << "{\"landfall\":" << landfall_countries << ",\"band_fall\":" << band_fall_countries
      << ",\"closest\":" << closest_countries << ",\"init_time\":" << init_time_countries
      << ",\"unresolved\":" << JoinCodes(unresolved) << "}";
  return oss.str();
}

bool EstimateLeadTimes(const TrackEnsemble& ensemble,
                       const geography::ICountryLookup& lookup,
                       const IAffectedCountrySource* affected,
                       const EstimatorOptions& options,
                       HazardMetadata* out,
                       EstimateReport* report,
                       PhaseRecorder* phases,
                       std::string* err) {
  if (!out) {
    SetErr(err, "EstimateLeadTimes: out is null");
    return false;
  }
  if (ensemble.empty()) {
    SetErr(err, "Missing forecast data.");
    return false;
  }

  std::string event_name;
  Timestamp init_time = 0;
  if (!UniqueBaseEventName(ensemble.Names(), &event_name, err)) return false;
  if (!ensemble.InitTime(&init_time, err)) return false;

  TCW_LOG_DEBUG("lead_times", "estimating lead times for", event_name, "with", ensemble.size(), "tracks");

  const std::vector<Track> tracks = ensemble.Tracks();
  std::vector<CountryOutcome> outcomes;

  // Tier 1
  {
    auto phase = PhaseRecorder::Scoped(phases, "landfall");
    std::vector<Track> dense;
    if (!DensifyTracks(tracks, options.grid_resolution_deg, &dense, err)) return false;
    if (!CalculateLandfalls(dense, lookup, &outcomes, err)) return false;
  }
  std::set<CountryCode> resolved;
  for (const auto& o : outcomes) resolved.insert(o.country);

  TracksPerCountry without_landfall;
  if (affected) {
    TracksPerCountry all_affected;
    std::string local_err;
    if (!affected->AffectedCountries(&all_affected, &local_err)) {
      SetErr(err, "Affected countries unavailable: " + local_err);
      return false;
    }
    for (auto& kv : all_affected) {
      if (kv.first != kNoCountry && resolved.count(kv.first) == 0) without_landfall.insert(std::move(kv));
    }
  }

  // Tier 2
  if (!without_landfall.empty()) {
    auto phase = PhaseRecorder::Scoped(phases, "band_fall");
    TCW_LOG_DEBUG("lead_times", "affected countries without landfall:", JoinCodes(KeysOf(without_landfall)));
    if (!CalculateBandFalls(tracks, lookup, KeysOf(without_landfall), options.landfall_radius_km, &outcomes, err)) {
      return false;
    }
    for (const auto& o : outcomes) resolved.insert(o.country);
  }

  // Tier 3
  TracksPerCountry remaining;
  for (const auto& kv : without_landfall) {
    if (resolved.count(kv.first) == 0) remaining.insert(kv);
  }
  if (!remaining.empty()) {
    auto phase = PhaseRecorder::Scoped(phases, "closest");
    if (!CalculateClosestTimes(tracks, lookup, remaining, &outcomes, err)) return false;
    for (const auto& o : outcomes) resolved.insert(o.country);
  }

  // Tier 4
  std::vector<CountryCode> unresolved;
  for (const auto& kv : remaining) {
    if (resolved.count(kv.first) == 0) unresolved.push_back(kv.first);
  }
  if (options.init_time_fallback && !unresolved.empty()) {
    TCW_LOG_DEBUG("lead_times", "initialisation time as lead time for countries:", JoinCodes(unresolved));
    const auto fallback = InitTimeOutcomes(init_time, unresolved);
    outcomes.insert(outcomes.end(), fallback.begin(), fallback.end());
    unresolved.clear();
  }
  if (!unresolved.empty()) {
    TCW_LOG_INFO("lead_times", "no lead time for affected countries:", JoinCodes(unresolved));
  }

  const ResolvedCountries merged = ReduceOutcomes(std::move(outcomes));

  HazardMetadataBuilder builder(event_name, init_time);
  EstimateReport rep;
  for (const auto& kv : merged) {
    builder.AddIfMissing(kv.first, ToLeadTimes(kv.second));
    const int tier = TierOf(kv.second);
    rep.tier_per_country[kv.first] = tier;
    switch (tier) {
      case 1: ++rep.landfall_countries; break;
      case 2: ++rep.band_fall_countries; break;
      case 3: ++rep.closest_countries; break;
      default: ++rep.init_time_countries; break;
    }
  }
  rep.unresolved = std::move(unresolved);

  if (!builder.Build(out, err)) return false;
  if (report) *report = std::move(rep);
  return true;
}

}  // namespace hazard
}  // namespace tcw
