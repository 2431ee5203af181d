// tests/test_impact.cpp
//
// Impact pipeline tests:
//  - ProbabilityPoints validation
//  - Grid construction, coordinates, borders
//  - Lattice inference from scattered points, minimum grid size
//  - Smoothing collaborator contract
//  - Contour tracing and polygon extraction (saddles, holes)
//  - ComputeWarningRegion end to end

#include "tcw/core/config.h"
#include "tcw/core/timer.h"
#include "tcw/core/types.h"
#include "tcw/geometry/arc.h"
#include "tcw/geometry/geo.h"
#include "tcw/impact/contour.h"
#include "tcw/impact/grid.h"
#include "tcw/impact/grid_builder.h"
#include "tcw/impact/probability_points.h"
#include "tcw/impact/smoothing.h"
#include "tcw/impact/warning_region.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
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

  void CheckNear(double a, double b, double rel_eps, const char* ea, const char* eb,
                 const char* file, int line) {
    const double diff = std::fabs(a - b);
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    if (diff <= rel_eps * scale) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line
              << "  CHECK_NEAR(" << ea << ", " << eb << ")  got " << a << " vs " << b
              << "  diff=" << diff << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NEAR(ctx, a, b, eps) (ctx).CheckNear((a), (b), (eps), #a, #b, __FILE__, __LINE__)

using tcw::ArcPoint;
using tcw::GeoMultiPolygon;
using tcw::i64;
using tcw::ImpactSettings;
using tcw::kArcUnitsPerDegree;
using tcw::MakeGeoXY;
using tcw::usize;
using tcw::impact::Grid;
using tcw::impact::ProbabilityPoints;

namespace bg = boost::geometry;

constexpr i64 kDegree = kArcUnitsPerDegree;

// Points on a 1-degree lattice starting at (0, 0); values row-major.
bool MakePoints(usize rows, usize cols, const std::vector<double>& values, ProbabilityPoints* out,
                std::string* err) {
  std::vector<double> lats, lons;
  for (usize r = 0; r < rows; ++r) {
    for (usize c = 0; c < cols; ++c) {
      lats.push_back(static_cast<double>(r));
      lons.push_back(static_cast<double>(c));
    }
  }
  return ProbabilityPoints::FromDegrees(lats, lons, values, out, err);
}

ImpactSettings TestSettings(double threshold, i64 minimum_grid_size) {
  ImpactSettings s;
  s.probability_threshold = threshold;
  s.minimum_grid_size = minimum_grid_size;
  s.warn.erosion = 0;
  s.warn.dilation = 0;
  s.warn.median_filtering = 0;
  s.warn.small_regions_threshold = 0;
  return s;
}

bool Covered(const GeoMultiPolygon& mp, double latitude, double longitude) {
  return bg::covered_by(MakeGeoXY(latitude, longitude), mp);
}

void TestProbabilityPoints(TestContext& t) {
  ProbabilityPoints pts;
  std::string err;
  CHECK(t, ProbabilityPoints::FromDegrees({0.0, 0.5}, {10.0, 10.25}, {0.0, 1.0}, &pts, &err));
  CHECK_EQ(t, pts.size(), usize{2});
  CHECK_EQ(t, pts.Latitudes()[1], i64{1800000});
  CHECK_EQ(t, pts.Longitudes()[1], i64{36900000});
  CHECK(t, pts.AnyPositive());

  CHECK(t, !ProbabilityPoints::FromDegrees({0.0, 1.0}, {0.0}, {0.1, 0.2}, &pts, &err));
  CHECK(t, err.find("latitude values") != std::string::npos);

  CHECK(t, !ProbabilityPoints::FromDegrees({0.0, 1.0}, {0.0, 1.0}, {0.1}, &pts, &err));
  CHECK(t, err.find("probability values") != std::string::npos);

  CHECK(t, !ProbabilityPoints::FromDegrees({0.0, 1.0, 2.0}, {3.0, 4.0, 5.0}, {0.1, 1.5, 0.2}, &pts, &err));
  CHECK(t, err.find("1 / 3 points") != std::string::npos);
  CHECK(t, err.find("> 1") != std::string::npos);
  CHECK(t, err.find("(1,4)=1.5") != std::string::npos);

  CHECK(t, !ProbabilityPoints::FromDegrees({0.0, 1.0}, {0.0, 1.0}, {-0.5, -0.25}, &pts, &err));
  CHECK(t, err.find("2 / 2 points") != std::string::npos);
  CHECK(t, err.find("< 0") != std::string::npos);

  const double nan = std::numeric_limits<double>::quiet_NaN();
  CHECK(t, !ProbabilityPoints::FromDegrees({0.0}, {nan}, {0.5}, &pts, &err));
  CHECK(t, err.find("Invalid point") != std::string::npos);

  CHECK(t, ProbabilityPoints::FromDegrees({0.0}, {0.0}, {0.0}, &pts, &err));
  CHECK(t, !pts.AnyPositive());
}

void TestGrid(TestContext& t) {
  Grid g;
  std::string err;
  CHECK(t, !Grid::Create(0, 2, {}, ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  CHECK(t, !Grid::Create(2, 2, {1.0, 2.0, 3.0}, ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  CHECK(t, err.find("Size of values") != std::string::npos);
  CHECK(t, !Grid::Create(1, 1, {1.0}, ArcPoint{}, ArcPoint{0, kDegree}, &g, &err));

  // 2 x 3 starting at (10, 20), 1 degree between rows and half a degree between columns.
  const ArcPoint start{10 * kDegree, 20 * kDegree};
  const ArcPoint res{kDegree, kDegree / 2};
  CHECK(t, Grid::Create(2, 3, {0.0, 0.1, 0.2, 0.3, 0.4, 0.5}, start, res, &g, &err));
  CHECK_EQ(t, g.At(1, 2), 0.5);
  CHECK(t, g.CoordinateAt(1, 2) == (ArcPoint{11 * kDegree, 21 * kDegree}));

  const std::vector<double> lats = g.Latitudes();
  const std::vector<double> lons = g.Longitudes();
  CHECK_EQ(t, lats.size(), usize{2});
  CHECK_EQ(t, lons.size(), usize{3});
  CHECK_EQ(t, lats[1], 11.0);
  CHECK_EQ(t, lons[1], 20.5);

  Grid back;
  CHECK(t, Grid::FromCoordinates(2, 3, g.Values(), g.Coordinates(), 150000, &back, &err));
  CHECK(t, back.Start() == start);
  CHECK(t, back.Resolution() == res);

  std::vector<ArcPoint> coords = g.Coordinates();
  coords.pop_back();
  CHECK(t, !Grid::FromCoordinates(2, 3, g.Values(), coords, 150000, &back, &err));
  CHECK(t, err.find("Size of values and number of points do not match") != std::string::npos);

  coords = g.Coordinates();
  coords[1].longitude += kDegree / 4;
  CHECK(t, !Grid::FromCoordinates(2, 3, g.Values(), coords, 150000, &back, &err));
  CHECK(t, err.find("not on the grid lattice") != std::string::npos);

  // Single row: the latitude spacing falls back to the default resolution.
  CHECK(t, Grid::FromCoordinates(1, 2, {0.0, 1.0}, {ArcPoint{0, 0}, ArcPoint{0, kDegree}}, 150000, &back, &err));
  CHECK_EQ(t, back.Resolution().latitude, i64{150000});
  CHECK_EQ(t, back.Resolution().longitude, kDegree);

  Grid other;
  CHECK(t, !g.WithNewValues({1.0}, &other, &err));
  CHECK(t, err.find("does not match") != std::string::npos);
  CHECK(t, g.WithNewValues({1, 1, 1, 1, 1, 1}, &other, &err));
  CHECK(t, other.Start() == start);
  CHECK_EQ(t, other.CountNonZero(), usize{6});

  CHECK(t, !g.HasBorder());
  const Grid padded = g.AddBorder(2);
  CHECK_EQ(t, padded.Rows(), usize{6});
  CHECK_EQ(t, padded.Cols(), usize{7});
  CHECK(t, padded.HasBorder());
  CHECK_EQ(t, padded.At(3, 4), 0.5);
  CHECK(t, padded.Start() == (ArcPoint{8 * kDegree, 19 * kDegree}));
  CHECK_EQ(t, padded.CountNonZero(), g.CountNonZero());
}

void TestBuildGrid(TestContext& t) {
  std::string err;
  ProbabilityPoints pts;
  Grid g;

  // Missing cells are filled with zero; the resolution is the smallest gap.
  CHECK(t, ProbabilityPoints::FromDegrees({0.0, 3.0, 1.0}, {0.0, 0.5, 0.5}, {0.2, 0.3, 0.4}, &pts, &err));
  CHECK(t, tcw::impact::BuildGrid(pts, 150000, &g, &err));
  CHECK_EQ(t, g.Rows(), usize{4});
  CHECK_EQ(t, g.Cols(), usize{2});
  CHECK(t, g.Resolution() == (ArcPoint{kDegree, kDegree / 2}));
  CHECK(t, g.Start() == (ArcPoint{0, 0}));
  CHECK_EQ(t, g.At(0, 0), 0.2);
  CHECK_EQ(t, g.At(3, 1), 0.3);
  CHECK_EQ(t, g.At(1, 1), 0.4);
  CHECK_EQ(t, g.At(2, 0), 0.0);
  CHECK_EQ(t, g.CountNonZero(), usize{3});

  // One distinct latitude: default resolution on that axis.
  CHECK(t, ProbabilityPoints::FromDegrees({5.0, 5.0}, {10.0, 10.5}, {0.2, 0.3}, &pts, &err));
  CHECK(t, tcw::impact::BuildGrid(pts, 150000, &g, &err));
  CHECK_EQ(t, g.Rows(), usize{1});
  CHECK_EQ(t, g.Cols(), usize{2});
  CHECK_EQ(t, g.Resolution().latitude, i64{150000});
  CHECK_EQ(t, g.Resolution().longitude, kDegree / 2);

  CHECK(t, ProbabilityPoints::FromDegrees({0.0, 1.0, 1.5, 2.2}, {0.0, 0.0, 0.0, 0.0}, {0.1, 0.1, 0.1, 0.1}, &pts,
                                          &err));
  CHECK(t, !tcw::impact::BuildGrid(pts, 150000, &g, &err));
  CHECK(t, err.find("latitude 2.2 is not on the lattice") != std::string::npos);

  CHECK(t, ProbabilityPoints::FromDegrees({0.0, 0.0, 1.0}, {0.0, 0.0, 1.0}, {0.1, 0.2, 0.3}, &pts, &err));
  CHECK(t, !tcw::impact::BuildGrid(pts, 150000, &g, &err));
  CHECK(t, err.find("Duplicate grid cell") != std::string::npos);

  // A point one arc unit from another makes the lattice 36000001 cells wide.
  const double one_unit = 1.0 / 3600000.0;
  CHECK(t, ProbabilityPoints::FromDegrees({0.0, one_unit, 10.0}, {0.0, one_unit, 10.0}, {0.1, 0.2, 0.3}, &pts,
                                          &err));
  CHECK_EQ(t, pts.Latitudes()[1], i64{1});
  CHECK(t, !tcw::impact::BuildGrid(pts, 150000, &g, &err));
  CHECK(t, err.find("Grid of 36000001 x 36000001 cells exceeds the limit") != std::string::npos);

  tcw::impact::AxisLattice lat;
  CHECK(t, !tcw::impact::InferLattice({}, 150000, "latitude", &lat, &err));
  CHECK(t, tcw::impact::InferLattice({7, 7, 7}, 150000, "latitude", &lat, &err));
  CHECK_EQ(t, lat.count, usize{1});
  CHECK_EQ(t, lat.resolution, i64{150000});
}

void TestEnsureMinimumGrid(TestContext& t) {
  Grid g;
  std::string err;
  CHECK(t, Grid::Create(2, 3, {1, 1, 1, 1, 1, 1}, ArcPoint{0, 0}, ArcPoint{kDegree, kDegree}, &g, &err));

  const Grid same = tcw::impact::EnsureMinimumGrid(g, 2);
  CHECK_EQ(t, same.Rows(), usize{2});
  CHECK_EQ(t, same.Cols(), usize{3});

  // Deficit 3 -> border of 2 on every side.
  const Grid padded = tcw::impact::EnsureMinimumGrid(g, 5);
  CHECK_EQ(t, padded.Rows(), usize{6});
  CHECK_EQ(t, padded.Cols(), usize{7});
  CHECK(t, std::min(padded.Rows(), padded.Cols()) >= usize{5});
  CHECK(t, padded.HasBorder());
  CHECK(t, padded.Start() == (ArcPoint{-2 * kDegree, -2 * kDegree}));
  CHECK_EQ(t, padded.CountNonZero(), usize{6});
}

class BrokenSmoother final : public tcw::impact::IRasterSmoother {
 public:
  explicit BrokenSmoother(bool fail) : fail_(fail) {}

  std::string_view Name() const noexcept override { return "broken"; }

  bool Smooth(const Grid& grid, const tcw::impact::SmoothingParameters&, Grid* out,
              std::string* err) const override {
    if (fail_) {
      tcw::SetErr(err, "no smoothing today");
      return false;
    }
    return grid.WithNewValues(std::vector<double>(grid.size(), 0.5), out, err);
  }

 private:
  bool fail_;
};

void TestSmoothing(TestContext& t) {
  std::string err;
  const ImpactSettings settings;
  const auto params = tcw::impact::SmoothingParameters::FromSettings(settings);
  CHECK_EQ(t, params.levels.size(), usize{2});
  CHECK_EQ(t, params.levels[0], 0.0);
  CHECK_EQ(t, params.levels[1], 0.05);
  CHECK_EQ(t, params.operations.size(), usize{3});
  CHECK(t, params.operations[0].first == tcw::impact::SmoothingOperation::Erosion);
  CHECK(t, params.operations[2].first == tcw::impact::SmoothingOperation::MedianFiltering);
  CHECK_EQ(t, params.operations[1].second, i64{4});
  CHECK(t, params.Validate(&err));
  CHECK(t, params.ToJsonLite().find("\"dilation\",4") != std::string::npos);

  auto bad = params;
  bad.levels = {0.5, 0.5};
  CHECK(t, !bad.Validate(&err));

  Grid g;
  CHECK(t, Grid::Create(1, 4, {0.0, 0.01, 0.05, 0.9}, ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  const tcw::impact::ThresholdSmoother smoother;
  Grid binary;
  CHECK(t, smoother.Smooth(g, params, &binary, &err));
  CHECK_EQ(t, binary.At(0, 1), 0.0);
  CHECK_EQ(t, binary.At(0, 2), 1.0);
  CHECK_EQ(t, binary.At(0, 3), 1.0);
  CHECK(t, tcw::impact::CheckBinaryGrid(g, binary, &err));

  // Non-binary values and a different shape both break the contract.
  CHECK(t, !tcw::impact::CheckBinaryGrid(g, g, &err));
  CHECK(t, err.find("not binary") != std::string::npos);
  CHECK(t, !tcw::impact::CheckBinaryGrid(g, g.AddBorder(1), &err));
  CHECK(t, err.find("does not match") != std::string::npos);
}

void TestContours(TestContext& t) {
  std::string err;
  Grid g;

  // A region reaching the grid edge cannot be closed.
  CHECK(t, Grid::Create(2, 2, {1, 0, 0, 0}, ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  std::vector<tcw::impact::ContourRing> rings;
  CHECK(t, !tcw::impact::TraceContours(g, 0.5, &rings, &err));
  CHECK(t, err.find("touches the grid edge") != std::string::npos);

  // 3 x 3 block in a 5 x 5 grid: one counter-clockwise ring with chamfered corners.
  std::vector<double> v(25, 0.0);
  for (usize r = 1; r <= 3; ++r) {
    for (usize c = 1; c <= 3; ++c) v[r * 5 + c] = 1.0;
  }
  CHECK(t, Grid::Create(5, 5, v, ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  CHECK(t, tcw::impact::TraceContours(g, 0.5, &rings, &err));
  CHECK_EQ(t, rings.size(), usize{1});
  if (!rings.empty()) {
    CHECK(t, rings[0].IsOuter());
    CHECK_NEAR(t, rings[0].signed_area, 8.5, 1e-9);
  }
  GeoMultiPolygon mp;
  CHECK(t, tcw::impact::ExtractPolygons(g, 0.5, &mp, &err));
  CHECK_EQ(t, mp.size(), usize{1});
  CHECK_NEAR(t, bg::area(mp), 8.5, 1e-9);

  // Ring with a hole: 5 x 5 block with an empty centre in a 7 x 7 grid.
  std::vector<double> w(49, 0.0);
  for (usize r = 1; r <= 5; ++r) {
    for (usize c = 1; c <= 5; ++c) w[r * 7 + c] = 1.0;
  }
  w[3 * 7 + 3] = 0.0;
  CHECK(t, Grid::Create(7, 7, w, ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  CHECK(t, tcw::impact::TraceContours(g, 0.5, &rings, &err));
  CHECK_EQ(t, rings.size(), usize{2});
  std::vector<tcw::impact::ContourPath> paths;
  CHECK(t, tcw::impact::GroupRings(rings, &paths, &err));
  CHECK_EQ(t, paths.size(), usize{1});
  if (!paths.empty()) CHECK_EQ(t, paths[0].holes.size(), usize{1});

  CHECK(t, tcw::impact::ExtractPolygons(g, 0.5, &mp, &err));
  CHECK_EQ(t, mp.size(), usize{1});
  if (!mp.empty()) CHECK_EQ(t, mp[0].inners().size(), usize{1});
  CHECK_NEAR(t, bg::area(mp), 24.0, 1e-9);
  CHECK(t, !Covered(mp, 3.0, 3.0));
  CHECK(t, Covered(mp, 1.5, 1.5));

  // Nothing inside: no rings.
  CHECK(t, Grid::Create(3, 3, std::vector<double>(9, 0.0), ArcPoint{}, ArcPoint{kDegree, kDegree}, &g, &err));
  CHECK(t, tcw::impact::ExtractPolygons(g, 0.5, &mp, &err));
  CHECK(t, mp.empty());
}

void TestWarningRegion(TestContext& t) {
  std::string err;
  const tcw::impact::ThresholdSmoother smoother;
  ProbabilityPoints pts;
  GeoMultiPolygon mp;
  tcw::impact::WarningRegionReport rep;

  // Block of certain impact, threshold 0.05.
  std::vector<double> v(25, 0.0);
  for (usize r = 1; r <= 3; ++r) {
    for (usize c = 1; c <= 3; ++c) v[r * 5 + c] = 1.0;
  }
  CHECK(t, MakePoints(5, 5, v, &pts, &err));
  tcw::PhaseRecorder phases;
  CHECK(t, tcw::impact::ComputeWarningRegion(pts, smoother, TestSettings(0.05, 2), &mp, &rep, &phases, &err));
  CHECK_EQ(t, mp.size(), usize{1});
  if (!mp.empty()) CHECK(t, mp[0].inners().empty());
  CHECK_NEAR(t, bg::area(mp), 13.405, 1e-9);
  CHECK(t, Covered(mp, 2.0, 2.0));
  CHECK(t, !Covered(mp, 0.0, 0.0));
  CHECK_EQ(t, rep.points, usize{25});
  CHECK_EQ(t, rep.grid_rows, usize{5});
  CHECK_EQ(t, rep.warned_cells, usize{9});
  CHECK_EQ(t, rep.polygons, usize{1});
  CHECK(t, phases.Has("grid"));
  CHECK(t, phases.Has("polygons"));

  // Diagonal pair: the saddle is joined, so one polygon covers both cells.
  CHECK(t, MakePoints(2, 2, {0.0, 0.8, 0.8, 0.0}, &pts, &err));
  CHECK(t, tcw::impact::ComputeWarningRegion(pts, smoother, TestSettings(0.5, 2), &mp, &rep, nullptr, &err));
  CHECK_EQ(t, mp.size(), usize{1});
  CHECK_NEAR(t, bg::area(mp), 1.5, 1e-9);
  CHECK(t, Covered(mp, 0.0, 1.0));
  CHECK(t, Covered(mp, 1.0, 0.0));
  CHECK(t, !Covered(mp, 0.0, 0.0));
  CHECK(t, !Covered(mp, 1.0, 1.0));
  CHECK_EQ(t, rep.grid_rows, usize{2});
  CHECK_EQ(t, rep.grid_cols, usize{2});
  CHECK_EQ(t, rep.warned_cells, usize{2});

  // Single point with default settings: padded to the minimum grid size at
  // the default resolution of 1/24 degree.
  CHECK(t, ProbabilityPoints::FromDegrees({-20.0}, {35.0}, {1.0}, &pts, &err));
  CHECK(t, tcw::impact::ComputeWarningRegion(pts, smoother, ImpactSettings{}, &mp, &rep, nullptr, &err));
  CHECK_EQ(t, rep.grid_rows, usize{11});
  CHECK_EQ(t, rep.grid_cols, usize{11});
  CHECK_EQ(t, mp.size(), usize{1});
  const double cell = 1.0 / 24.0;
  CHECK_NEAR(t, bg::area(mp), 2.0 * 0.95 * 0.95 * cell * cell, 1e-9);
  CHECK(t, Covered(mp, -20.0, 35.0));
  CHECK(t, !Covered(mp, -20.0, 35.0 + cell));

  // No positive probability: empty region, no grid.
  CHECK(t, MakePoints(2, 2, {0.0, 0.0, 0.0, 0.0}, &pts, &err));
  CHECK(t, tcw::impact::ComputeWarningRegion(pts, smoother, TestSettings(0.05, 2), &mp, &rep, nullptr, &err));
  CHECK(t, mp.empty());
  CHECK_EQ(t, rep.grid_rows, usize{0});
  CHECK_EQ(t, rep.polygons, usize{0});

  // Positive but below the threshold everywhere: empty after smoothing.
  CHECK(t, MakePoints(2, 2, {0.01, 0.02, 0.0, 0.01}, &pts, &err));
  CHECK(t, tcw::impact::ComputeWarningRegion(pts, smoother, TestSettings(0.05, 2), &mp, &rep, nullptr, &err));
  CHECK(t, mp.empty());
  CHECK_EQ(t, rep.grid_rows, usize{2});
  CHECK_EQ(t, rep.warned_cells, usize{0});

  // Smoother contract violations.
  CHECK(t, MakePoints(2, 2, {0.0, 0.8, 0.8, 0.0}, &pts, &err));
  const BrokenSmoother failing(true);
  CHECK(t, !tcw::impact::ComputeWarningRegion(pts, failing, TestSettings(0.5, 2), &mp, nullptr, nullptr, &err));
  CHECK(t, err.find("Smoothing (broken) failed: no smoothing today") != std::string::npos);
  const BrokenSmoother fuzzy(false);
  CHECK(t, !tcw::impact::ComputeWarningRegion(pts, fuzzy, TestSettings(0.5, 2), &mp, nullptr, nullptr, &err));
  CHECK(t, err.find("not binary") != std::string::npos);

  CHECK(t, !tcw::impact::ComputeWarningRegion(pts, smoother, TestSettings(0.5, 2), nullptr, nullptr, nullptr,
                                              &err));
}

}  // namespace

int main() {
  TestContext t;

  TestProbabilityPoints(t);
  TestGrid(t);
  TestBuildGrid(t);
  TestEnsureMinimumGrid(t);
  TestSmoothing(t);
  TestContours(t);
  TestWarningRegion(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_impact\n";
    return 0;
  }
  std::cerr << "[FAILED] test_impact: " << t.fails << " failure(s)\n";
  return 1;
}
