#pragma once
// tcw/geography/country.h
//
// Country identification and the lookup capability the estimator depends on.
//
// ICountryLookup abstracts the gazetteer/raster collaborator:
//   - ResolveCountryCodes: batch (lat, lon) -> ISO numeric code, 0 = no country
//   - LookupGeometry:      numeric code -> country polygon(s)
//   - CountryForIdentifier: numeric / alpha-2 / alpha-3 / name -> Country
//
// Implementations report failures via `false` + err. Tests supply stubs.

#include "tcw/core/types.h"
#include "tcw/geometry/geo.h"

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tcw {
namespace geography {

struct Country {
  CountryCode numeric = kNoCountry;
  std::string alpha2;
  std::string alpha3;
  std::string name;

  std::string ToString() const {
    std::ostringstream oss;
    oss << name << " (" << numeric << "/" << alpha2 << "/" << alpha3 << ")";
    return oss.str();
  }
};

class ICountryLookup {
 public:
  virtual ~ICountryLookup() = default;

  // `out` gets one code per input point, in input order.
  virtual bool ResolveCountryCodes(Span<const double> latitudes,
                                   Span<const double> longitudes,
                                   std::vector<CountryCode>* out,
                                   std::string* err) const = 0;

  virtual bool LookupGeometry(CountryCode code, GeoMultiPolygon* out, std::string* err) const = 0;

  virtual bool CountryForIdentifier(std::string_view identifier, Country* out, std::string* err) const = 0;
};

}  // namespace geography
}  // namespace tcw
