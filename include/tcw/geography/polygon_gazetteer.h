#pragma once
// tcw/geography/polygon_gazetteer.h
//
// ICountryLookup over an in-memory set of country polygons.
//
// TSV format (header row required):
//   numeric  alpha2  alpha3  name  wkt
// where wkt is a POLYGON or MULTIPOLYGON in (longitude latitude) order.
// Points are resolved by point-in-polygon (boundary counts as inside) after a
// bounding-box pre-filter; the first matching country in file order wins.

#include "tcw/core/types.h"
#include "tcw/geography/country.h"
#include "tcw/geometry/geo.h"

#include <string>
#include <string_view>
#include <vector>

namespace tcw {
namespace geography {

class PolygonGazetteer final : public ICountryLookup {
 public:
  PolygonGazetteer() = default;

  static bool LoadTsv(const std::string& path, PolygonGazetteer* out, std::string* err = nullptr);

  // Geometry orientation is corrected on insertion. Duplicate codes and code 0
  // are rejected.
  bool AddCountry(const Country& country, GeoMultiPolygon geometry, std::string* err = nullptr);

  usize size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

  bool ResolveCountryCodes(Span<const double> latitudes,
                           Span<const double> longitudes,
                           std::vector<CountryCode>* out,
                           std::string* err) const override;

  bool LookupGeometry(CountryCode code, GeoMultiPolygon* out, std::string* err) const override;

  bool CountryForIdentifier(std::string_view identifier, Country* out, std::string* err) const override;

 private:
  struct Entry {
    Country country;
    GeoMultiPolygon geometry;
    GeoBox envelope;
  };

  const Entry* Find(CountryCode code) const;

  std::vector<Entry> entries_;
};

}  // namespace geography
}  // namespace tcw
