// src/geography/polygon_gazetteer.cpp

#include "tcw/geography/polygon_gazetteer.h"

#include "tcw/core/logging.h"
#include "tcw/io/csv_io.h"
#include "tcw/io/polygon_io.h"

#include <utility>

namespace tcw {
namespace geography {

namespace {

constexpr const char* kColumns[] = {"numeric", "alpha2", "alpha3", "name", "wkt"};

}  // namespace

bool PolygonGazetteer::LoadTsv(const std::string& path, PolygonGazetteer* out, std::string* err) {
  if (!out) {
    SetErr(err, "PolygonGazetteer::LoadTsv: out is null");
    return false;
  }
  csv::Table table;
  if (!csv::ReadTable(path, csv::kTsv, /*has_header=*/true, &table, err)) return false;

  usize idx[5];
  for (usize k = 0; k < 5; ++k) {
    const auto col = table.ColumnIndex(kColumns[k]);
    if (!col) {
      SetErr(err, path + ": missing column '" + kColumns[k] + "'");
      return false;
    }
    idx[k] = *col;
  }

  PolygonGazetteer gazetteer;
  for (usize r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    if (row.size() != table.header.size()) {
      SetErr(err, path + ": " + table.Where(r) + ": expected " + std::to_string(table.header.size()) +
                      " columns, got " + std::to_string(row.size()));
      return false;
    }
    i64 numeric = 0;
    if (!csv::ParseI64(row[idx[0]], &numeric)) {
      SetErr(err, path + ": " + table.Where(r) + ": invalid numeric code '" + row[idx[0]] + "'");
      return false;
    }
    Country c;
    c.numeric = static_cast<CountryCode>(numeric);
    c.alpha2 = row[idx[1]];
    c.alpha3 = row[idx[2]];
    c.name = row[idx[3]];

    GeoMultiPolygon geometry;
    std::string local_err;
    if (!io::ParseWkt(row[idx[4]], &geometry, &local_err) ||
        !gazetteer.AddCountry(c, std::move(geometry), &local_err)) {
      SetErr(err, path + ": " + table.Where(r) + ": " + local_err);
      return false;
    }
  }

  TCW_LOG_DEBUG("gazetteer", "loaded", gazetteer.size(), "countries from", path);
  *out = std::move(gazetteer);
  return true;
}

bool PolygonGazetteer::AddCountry(const Country& country, GeoMultiPolygon geometry, std::string* err) {
  if (country.numeric == kNoCountry || country.numeric < 0) {
    SetErr(err, "Country code must be positive, got " + std::to_string(country.numeric));
    return false;
  }
  if (Find(country.numeric)) {
    SetErr(err, "Duplicate country code " + std::to_string(country.numeric));
    return false;
  }
  if (bg::is_empty(geometry)) {
    SetErr(err, "Country " + std::to_string(country.numeric) + " has an empty geometry");
    return false;
  }
  bg::correct(geometry);

  Entry e;
  e.country = country;
  e.envelope = bg::return_envelope<GeoBox>(geometry);
  e.geometry = std::move(geometry);
  entries_.push_back(std::move(e));
  return true;
}

const PolygonGazetteer::Entry* PolygonGazetteer::Find(CountryCode code) const {
  for (const auto& e : entries_) {
    if (e.country.numeric == code) return &e;
  }
  return nullptr;
}

bool PolygonGazetteer::ResolveCountryCodes(Span<const double> latitudes,
                                           Span<const double> longitudes,
                                           std::vector<CountryCode>* out,
                                           std::string* err) const {
  if (!out) {
    SetErr(err, "ResolveCountryCodes: out is null");
    return false;
  }
  if (latitudes.size() != longitudes.size()) {
    SetErr(err, "ResolveCountryCodes: numbers of latitudes and longitudes do not match: " +
                    std::to_string(latitudes.size()) + " <> " + std::to_string(longitudes.size()));
    return false;
  }

  out->assign(latitudes.size(), kNoCountry);
  for (usize i = 0; i < latitudes.size(); ++i) {
    const GeoXY p = MakeGeoXY(latitudes[i], longitudes[i]);
    for (const auto& e : entries_) {
      if (!bg::covered_by(p, e.envelope)) continue;
      if (bg::covered_by(p, e.geometry)) {
        (*out)[i] = e.country.numeric;
        break;
      }
    }
  }
  return true;
}

bool PolygonGazetteer::LookupGeometry(CountryCode code, GeoMultiPolygon* out, std::string* err) const {
  if (!out) {
    SetErr(err, "LookupGeometry: out is null");
    return false;
  }
  const Entry* e = Find(code);
  if (!e) {
    SetErr(err, "Unknown country code " + std::to_string(code));
    return false;
  }
  *out = e->geometry;
  return true;
}

bool PolygonGazetteer::CountryForIdentifier(std::string_view identifier, Country* out, std::string* err) const {
  if (!out) {
    SetErr(err, "CountryForIdentifier: out is null");
    return false;
  }
  const std::string_view id = csv::Trim(identifier);
  i64 numeric = 0;
  if (csv::ParseI64(id, &numeric)) {
    if (const Entry* e = Find(static_cast<CountryCode>(numeric))) {
      *out = e->country;
      return true;
    }
  } else {
    for (const auto& e : entries_) {
      if (detail::EqualsIgnoreCase(id, e.country.alpha2) || detail::EqualsIgnoreCase(id, e.country.alpha3) ||
          detail::EqualsIgnoreCase(id, e.country.name)) {
        *out = e.country;
        return true;
      }
    }
  }
  SetErr(err, "Unknown country identifier '" + std::string(id) + "'");
  return false;
}

}  // namespace geography
}  // namespace tcw
