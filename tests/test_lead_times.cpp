// tests/test_lead_times.cpp
//
// Lead-time estimation tests with an in-memory country lookup:
//  - LeadTimes / HazardMetadata construction rules
//  - Tier functions (landfall, band-fall, closest point, init time)
//  - ReduceOutcomes: tier order, first writer wins
//  - EstimateLeadTimes end to end

#include "tcw/core/time.h"
#include "tcw/core/timer.h"
#include "tcw/core/types.h"
#include "tcw/geography/country.h"
#include "tcw/geometry/geo.h"
#include "tcw/hazard/affected.h"
#include "tcw/hazard/lead_time_estimator.h"
#include "tcw/hazard/lead_times.h"
#include "tcw/hazard/metadata.h"
#include "tcw/io/polygon_io.h"
#include "tcw/tracks/ensemble.h"
#include "tcw/tracks/track.h"

#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb, const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)

using tcw::CountryCode;
using tcw::GeoMultiPolygon;
using tcw::kNanosPerHour;
using tcw::Span;
using tcw::Timestamp;
using tcw::Track;
using tcw::usize;
using tcw::hazard::CountryOutcome;
using tcw::hazard::HazardMetadata;
using tcw::hazard::LeadTimes;

const Timestamp kT0 = tcw::MakeTimestamp(2021, 1, 22, 0);
constexpr Timestamp kHour = kNanosPerHour;

// Rectangular countries, resolved in insertion order.
class StubLookup final : public tcw::geography::ICountryLookup {
 public:
  void Add(CountryCode code, double lon0, double lat0, double lon1, double lat1) {
    GeoMultiPolygon mp;
    tcw::GeoPolygon p;
    tcw::bg::append(p.outer(), tcw::MakeGeoXY(lat0, lon0));
    tcw::bg::append(p.outer(), tcw::MakeGeoXY(lat0, lon1));
    tcw::bg::append(p.outer(), tcw::MakeGeoXY(lat1, lon1));
    tcw::bg::append(p.outer(), tcw::MakeGeoXY(lat1, lon0));
    tcw::bg::append(p.outer(), tcw::MakeGeoXY(lat0, lon0));
    tcw::bg::correct(p);
    mp.push_back(p);
    countries_.emplace_back(code, std::move(mp));
  }

  bool ResolveCountryCodes(Span<const double> latitudes,
                           Span<const double> longitudes,
                           std::vector<CountryCode>* out,
                           std::string* err) const override {
    ++resolve_calls;
    if (fail_resolve) {
      tcw::SetErr(err, "raster unavailable");
      return false;
    }
    out->assign(latitudes.size(), tcw::kNoCountry);
    for (usize i = 0; i < latitudes.size(); ++i) {
      for (const auto& c : countries_) {
        if (tcw::bg::covered_by(tcw::MakeGeoXY(latitudes[i], longitudes[i]), c.second)) {
          (*out)[i] = c.first;
          break;
        }
      }
    }
    if (short_result && !out->empty()) out->pop_back();
    return true;
  }

  bool LookupGeometry(CountryCode code, GeoMultiPolygon* out, std::string* err) const override {
    for (const auto& c : countries_) {
      if (c.first == code) {
        *out = c.second;
        return true;
      }
    }
    tcw::SetErr(err, "no geometry for " + std::to_string(code));
    return false;
  }

  bool CountryForIdentifier(std::string_view identifier,
                            tcw::geography::Country* out,
                            std::string* err) const override {
    tcw::SetErr(err, "not supported: " + std::string(identifier));
    (void)out;
    return false;
  }

  mutable int resolve_calls = 0;
  bool fail_resolve = false;
  bool short_result = false;

 private:
  std::vector<std::pair<CountryCode, GeoMultiPolygon>> countries_;
};

// Countries 10, 20 and 30 along the band lat [0, 10]; 40 has no geometry.
StubLookup MakeLookup() {
  StubLookup lookup;
  lookup.Add(10, 10.0, 0.0, 20.0, 10.0);
  lookup.Add(20, 30.0, 0.0, 40.0, 10.0);
  lookup.Add(30, 50.0, 0.0, 60.0, 10.0);
  return lookup;
}

Track MakeTrack(TestContext& t,
                const std::vector<double>& lons,
                const std::vector<Timestamp>& times,
                double frequency) {
  Track track;
  std::string err;
  CHECK(t, Track::Create(std::vector<double>(lons.size(), 5.0), lons, times, frequency, &track, &err));
  return track;
}

// Track A crosses country 10 and stops 5 degrees west of 20.
// Track B crosses country 10 and stops 2.4 degrees west of 20.
tcw::TrackEnsemble MakeEnsemble(TestContext& t) {
  tcw::TrackEnsemble ensemble;
  ensemble.Add(tcw::EnsembleMember{
      "ELOISE_1", kT0 - 6 * kHour, MakeTrack(t, {0.0, 15.0, 25.0}, {kT0, kT0 + kHour, kT0 + 2 * kHour}, 1.0)});
  ensemble.Add(tcw::EnsembleMember{
      "ELOISE_2", kT0, MakeTrack(t, {0.0, 12.0, 27.6}, {kT0, kT0 + 3 * kHour, kT0 + 4 * kHour}, 3.0)});
  return ensemble;
}

void TestLeadTimesRules(TestContext& t) {
  LeadTimes lt;
  std::string err;
  CHECK(t, LeadTimes::Create({kT0, kT0 + kHour}, kT0 + 5 * kHour, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0 + 5 * kHour);
  CHECK_EQ(t, lt.All().size(), usize{2});
  CHECK(t, !LeadTimes::Create({}, kT0, &lt, &err));
  CHECK_EQ(t, err, std::string("Missing lead times."));

  CHECK(t, LeadTimes::FromTimes({kT0 + 2 * kHour, kT0, kT0 + kHour}, {}, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0 + kHour);
  CHECK_EQ(t, lt.All().front(), kT0 + 2 * kHour);  // order kept
  CHECK(t, LeadTimes::FromTimes({kT0, kT0 + 2 * kHour}, {3.0, 1.0}, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0);
  CHECK(t, !LeadTimes::FromTimes({}, {}, &lt, &err));
  CHECK_EQ(t, err, std::string("Neither all lead times nor median lead time specified."));
  CHECK(t, !LeadTimes::FromTimes({kT0}, {1.0, 2.0}, &lt, &err));

  const LeadTimes single = LeadTimes::FromMedian(kT0);
  CHECK_EQ(t, single.All().size(), usize{1});
  CHECK_EQ(t, single.All().front(), kT0);
  CHECK_EQ(t, single.Median(), kT0);
  CHECK(t, single.Check());
  CHECK(t, !LeadTimes{}.Check(5, &err));
  CHECK_EQ(t, err, std::string("Missing lead times for country code 5."));
  CHECK_EQ(t, single.ToString(), std::string("2021-01-22T00:00:00 [2021-01-22T00:00:00]"));
}

void TestMetadata(TestContext& t) {
  tcw::hazard::LeadTimesPerCountry per_country;
  per_country.emplace(716, LeadTimes::FromMedian(kT0 + kHour));
  per_country.emplace(508, LeadTimes::FromMedian(kT0));

  HazardMetadata md;
  std::string err;
  CHECK(t, HazardMetadata::FromLeadTimes("ELOISE", kT0 - kHour, per_country, &md, &err));
  CHECK_EQ(t, md.EventName(), std::string("ELOISE"));
  CHECK_EQ(t, md.InitialisationTime(), kT0 - kHour);
  const std::vector<CountryCode> codes = md.CountryCodes();
  CHECK_EQ(t, codes.size(), usize{2});
  if (codes.size() == 2) {
    CHECK_EQ(t, codes[0], 508);
    CHECK_EQ(t, codes[1], 716);
  }
  CHECK(t, md.HasLandfall());
  CHECK(t, md.HasLandfall(716));
  CHECK(t, !md.HasLandfall(894));

  LeadTimes lt;
  CHECK(t, md.GetLeadTimes(716, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0 + kHour);
  CHECK(t, !md.GetLeadTimes(894, &lt, &err));
  CHECK_EQ(t, err, std::string("No lead times found for country 894."));

  per_country.emplace(0, LeadTimes::FromMedian(kT0));
  CHECK(t, !HazardMetadata::FromLeadTimes("ELOISE", kT0, per_country, &md, &err));
  per_country.erase(0);
  per_country.emplace(894, LeadTimes{});
  CHECK(t, !HazardMetadata::FromLeadTimes("ELOISE", kT0, per_country, &md, &err));
  CHECK(t, err.find("894") != std::string::npos);

  HazardMetadata empty;
  CHECK(t, HazardMetadata::FromLeadTimes("IDAI", kT0, {}, &empty, &err));
  CHECK(t, !empty.HasLandfall());

  tcw::hazard::HazardMetadataBuilder builder("ELOISE", kT0);
  CHECK(t, builder.AddIfMissing(508, LeadTimes::FromMedian(kT0)));
  CHECK(t, !builder.AddIfMissing(508, LeadTimes::FromMedian(kT0 + kHour)));
  CHECK(t, builder.Contains(508));
  CHECK(t, builder.Build(&md, &err));
  CHECK(t, md.GetLeadTimes(508, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0);
}

void TestReduceOutcomes(TestContext& t) {
  using namespace tcw::hazard;
  const LeadTimes first = LeadTimes::FromMedian(kT0 + kHour);
  const LeadTimes second = LeadTimes::FromMedian(kT0 + 2 * kHour);

  std::vector<CountryOutcome> outcomes;
  outcomes.push_back(CountryOutcome{10, Closest{kT0 + 9 * kHour, 0, 12.0}});
  outcomes.push_back(CountryOutcome{10, Landfall{first}});
  outcomes.push_back(CountryOutcome{20, BandFall{first}});
  outcomes.push_back(CountryOutcome{20, BandFall{second}});
  outcomes.push_back(CountryOutcome{30, InitTime{kT0}});
  outcomes.push_back(CountryOutcome{30, Closest{kT0 + kHour, 1, 3.0}});
  outcomes.push_back(CountryOutcome{tcw::kNoCountry, Landfall{first}});

  const ResolvedCountries resolved = ReduceOutcomes(outcomes);
  CHECK_EQ(t, resolved.size(), usize{3});
  CHECK(t, resolved.count(tcw::kNoCountry) == 0);

  auto it = resolved.find(10);
  CHECK(t, it != resolved.end() && std::holds_alternative<Landfall>(it->second));
  it = resolved.find(20);
  CHECK(t, it != resolved.end() && ToLeadTimes(it->second) == first);
  it = resolved.find(30);
  CHECK(t, it != resolved.end() && TierOf(it->second) == 3);
  if (it != resolved.end()) {
    CHECK_EQ(t, TierName(it->second), std::string_view("closest"));
    CHECK_EQ(t, ToLeadTimes(it->second).Median(), kT0 + kHour);
  }

  CHECK_EQ(t, TierOf(TierOutcome{InitTime{kT0}}), 4);
  CHECK_EQ(t, TierName(TierOutcome{BandFall{first}}), std::string_view("band_fall"));
}

void TestLandfalls(TestContext& t) {
  StubLookup lookup = MakeLookup();
  // Second track: ocean, then 20, then back over 10 later.
  const std::vector<Track> tracks = {
      MakeTrack(t, {5.0, 12.0, 15.0, 25.0}, {kT0, kT0 + kHour, kT0 + 2 * kHour, kT0 + 3 * kHour}, 1.0),
      MakeTrack(t, {28.0, 35.0, 15.0}, {kT0, kT0 + kHour, kT0 + 5 * kHour}, 1.0),
      MakeTrack(t, {-5.0, 0.0}, {kT0, kT0 + kHour}, 1.0),
  };

  std::vector<CountryOutcome> out;
  std::string err;
  CHECK(t, tcw::hazard::CalculateLandfalls(tracks, lookup, &out, &err));
  CHECK_EQ(t, out.size(), usize{2});
  if (out.size() == 2) {
    CHECK_EQ(t, out[0].country, 10);
    const LeadTimes lt10 = tcw::hazard::ToLeadTimes(out[0].outcome);
    CHECK(t, lt10.All() == (std::vector<Timestamp>{kT0 + kHour, kT0 + 5 * kHour}));
    CHECK_EQ(t, lt10.Median(), kT0 + 3 * kHour);

    CHECK_EQ(t, out[1].country, 20);
    const LeadTimes lt20 = tcw::hazard::ToLeadTimes(out[1].outcome);
    CHECK(t, lt20.All() == std::vector<Timestamp>{kT0 + kHour});
  }

  lookup.short_result = true;
  CHECK(t, !tcw::hazard::CalculateLandfalls(tracks, lookup, &out, &err));
  CHECK(t, err.find("codes for") != std::string::npos);
  lookup.short_result = false;
  lookup.fail_resolve = true;
  CHECK(t, !tcw::hazard::CalculateLandfalls(tracks, lookup, &out, &err));
  CHECK(t, err.find("raster unavailable") != std::string::npos);
}

void TestBandFallsAndClosest(TestContext& t) {
  const StubLookup lookup = MakeLookup();
  const tcw::TrackEnsemble ensemble = MakeEnsemble(t);
  const std::vector<Track> tracks = ensemble.Tracks();
  std::string err;

  std::vector<CountryOutcome> band;
  CHECK(t, tcw::hazard::CalculateBandFalls(tracks, lookup, {20, 30, 40}, 300.0, &band, &err));
  CHECK_EQ(t, band.size(), usize{1});
  if (band.size() == 1) {
    CHECK_EQ(t, band[0].country, 20);
    CHECK_EQ(t, tcw::hazard::TierOf(band[0].outcome), 2);
    CHECK_EQ(t, tcw::hazard::ToLeadTimes(band[0].outcome).Median(), kT0 + 4 * kHour);
  }

  std::vector<CountryOutcome> closest;
  tcw::hazard::TracksPerCountry per_country = {{30, {0}}, {40, {1}}, {20, {}}};
  CHECK(t, tcw::hazard::CalculateClosestTimes(tracks, lookup, per_country, &closest, &err));
  CHECK_EQ(t, closest.size(), usize{1});
  if (closest.size() == 1) {
    CHECK_EQ(t, closest[0].country, 30);
    const auto& c = std::get<tcw::hazard::Closest>(closest[0].outcome);
    CHECK_EQ(t, c.time, kT0 + 2 * kHour);
    CHECK_EQ(t, c.track_index, usize{0});
  }

  // Equally close tracks: the first one keeps the result.
  const std::vector<Track> twins = {tracks[0], tracks[0]};
  closest.clear();
  CHECK(t, tcw::hazard::CalculateClosestTimes(twins, lookup, {{30, {0, 1}}}, &closest, &err));
  CHECK_EQ(t, closest.size(), usize{1});
  if (closest.size() == 1) CHECK_EQ(t, std::get<tcw::hazard::Closest>(closest[0].outcome).track_index, usize{0});

  CHECK(t, !tcw::hazard::CalculateClosestTimes(tracks, lookup, {{30, {5}}}, &closest, &err));
  CHECK(t, err.find("out of range") != std::string::npos);

  const auto init = tcw::hazard::InitTimeOutcomes(kT0, {40, 0, 30, 40});
  CHECK_EQ(t, init.size(), usize{2});
  if (init.size() == 2) {
    CHECK_EQ(t, init[0].country, 30);
    CHECK_EQ(t, init[1].country, 40);
  }
}

void TestEstimateLeadTimes(TestContext& t) {
  const StubLookup lookup = MakeLookup();
  const tcw::TrackEnsemble ensemble = MakeEnsemble(t);
  tcw::hazard::StaticAffectedCountries affected;
  affected.Add(10, 0);
  affected.Add(20, 0);
  affected.Add(20, 1);
  affected.Add(30, 0);
  affected.Add(40, 1);
  affected.Add(tcw::kNoCountry, 1);

  tcw::hazard::EstimatorOptions options;
  options.landfall_radius_km = 300.0;

  HazardMetadata md;
  tcw::hazard::EstimateReport report;
  tcw::PhaseRecorder phases;
  std::string err;
  CHECK(t, tcw::hazard::EstimateLeadTimes(ensemble, lookup, &affected, options, &md, &report, &phases, &err));
  CHECK_EQ(t, lookup.resolve_calls, 1);
  CHECK_EQ(t, md.EventName(), std::string("ELOISE"));
  CHECK_EQ(t, md.InitialisationTime(), kT0 - 6 * kHour);
  CHECK(t, md.CountryCodes() == (std::vector<CountryCode>{10, 20, 30}));

  LeadTimes lt;
  CHECK(t, md.GetLeadTimes(10, &lt, &err));
  CHECK(t, lt.All() == (std::vector<Timestamp>{kT0 + kHour, kT0 + 3 * kHour}));
  CHECK_EQ(t, lt.Median(), kT0 + 3 * kHour);
  CHECK(t, md.GetLeadTimes(20, &lt, &err));
  CHECK(t, lt.All() == std::vector<Timestamp>{kT0 + 4 * kHour});
  CHECK(t, md.GetLeadTimes(30, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0 + 2 * kHour);

  CHECK_EQ(t, report.landfall_countries, usize{1});
  CHECK_EQ(t, report.band_fall_countries, usize{1});
  CHECK_EQ(t, report.closest_countries, usize{1});
  CHECK_EQ(t, report.init_time_countries, usize{0});
  CHECK(t, report.unresolved == std::vector<CountryCode>{40});
  CHECK(t, phases.Has("landfall"));
  CHECK(t, phases.Has("band_fall"));
  CHECK(t, phases.Has("closest"));

  options.init_time_fallback = true;
  CHECK(t, tcw::hazard::EstimateLeadTimes(ensemble, lookup, &affected, options, &md, &report, nullptr, &err));
  CHECK(t, md.GetLeadTimes(40, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0 - 6 * kHour);
  CHECK_EQ(t, report.init_time_countries, usize{1});
  CHECK(t, report.unresolved.empty());
  // Tier 1 result untouched by the later tiers.
  CHECK(t, md.GetLeadTimes(10, &lt, &err));
  CHECK_EQ(t, lt.Median(), kT0 + 3 * kHour);

  // Without an affected-country source only landfalls are reported.
  CHECK(t, tcw::hazard::EstimateLeadTimes(ensemble, lookup, nullptr, options, &md, nullptr, nullptr, &err));
  CHECK(t, md.CountryCodes() == std::vector<CountryCode>{10});

  CHECK(t, !tcw::hazard::EstimateLeadTimes(tcw::TrackEnsemble{}, lookup, nullptr, options, &md, nullptr, nullptr,
                                           &err));
  CHECK_EQ(t, err, std::string("Missing forecast data."));

  tcw::TrackEnsemble mixed = MakeEnsemble(t);
  mixed.Add(tcw::EnsembleMember{"IDAI_1", kT0, MakeTrack(t, {0.0}, {kT0}, 1.0)});
  CHECK(t, !tcw::hazard::EstimateLeadTimes(mixed, lookup, nullptr, options, &md, nullptr, nullptr, &err));
  CHECK(t, err.find("not unique") != std::string::npos);
}

}  // namespace

int main() {
  TestContext t;

  TestLeadTimesRules(t);
  TestMetadata(t);
  TestReduceOutcomes(t);
  TestLandfalls(t);
  TestBandFallsAndClosest(t);
  TestEstimateLeadTimes(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_lead_times\n";
    return 0;
  }
  std::cerr << "[FAILED] test_lead_times: " << t.fails << " failure(s)\n";
  return 1;
}
