// src/io/polygon_io.cpp

#include "tcw/io/polygon_io.h"

#include "tcw/io/csv_io.h"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace tcw {
namespace io {

namespace {

bool StartsWithIgnoreCase(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && detail::EqualsIgnoreCase(s.substr(0, prefix.size()), prefix);
}

void AppendRing(std::ostringstream& oss, const GeoRing& ring) {
  oss << "[";
  for (usize i = 0; i < ring.size(); ++i) {
    if (i) oss << ",";
    oss << "[" << ring[i].x() << "," << ring[i].y() << "]";
  }
  oss << "]";
}

bool WriteText(const std::string& path, const std::string& text, std::string* err) {
  std::ofstream out(path);
  if (!out) {
    SetErr(err, "Cannot open file for writing: " + path);
    return false;
  }
  out << text << "\n";
  out.close();
  if (out.fail()) {
    SetErr(err, "Write failed: " + path);
    return false;
  }
  return true;
}

}  // namespace

bool ParseWkt(std::string_view wkt, GeoMultiPolygon* out, std::string* err) {
  if (!out) {
    SetErr(err, "ParseWkt: out is null");
    return false;
  }
  const std::string text(csv::Trim(wkt));
  GeoMultiPolygon result;
  try {
    if (StartsWithIgnoreCase(text, "MULTIPOLYGON")) {
      bg::read_wkt(text, result);
    } else if (StartsWithIgnoreCase(text, "POLYGON")) {
      GeoPolygon polygon;
      bg::read_wkt(text, polygon);
      if (!bg::is_empty(polygon)) result.push_back(std::move(polygon));
    } else {
      SetErr(err, "ParseWkt: expected POLYGON or MULTIPOLYGON, got '" + text.substr(0, 32) + "'");
      return false;
    }
  } catch (const bg::read_wkt_exception& e) {
    SetErr(err, std::string("ParseWkt: ") + e.what());
    return false;
  }
  bg::correct(result);
  *out = std::move(result);
  return true;
}

std::string ToWkt(const GeoMultiPolygon& geometry) {
  if (geometry.empty()) return "MULTIPOLYGON EMPTY";
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << bg::wkt(geometry);
  return oss.str();
}

std::string ToGeoJson(const GeoMultiPolygon& geometry, std::string_view crs) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10);
  oss << "{\"type\":\"FeatureCollection\","
      << "\"crs\":{\"type\":\"name\",\"properties\":{\"name\":\"" << crs << "\"}},"
      << "\"features\":[";
  for (usize i = 0; i < geometry.size(); ++i) {
    const GeoPolygon& polygon = geometry[i];
    if (i) oss << ",";
    oss << "{\"type\":\"Feature\",\"properties\":{\"index\":" << i << "},"
        << "\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[";
    AppendRing(oss, polygon.outer());
    for (const auto& hole : polygon.inners()) {
      oss << ",";
      AppendRing(oss, hole);
    }
    oss << "]}}";
  }
  oss << "]}";
  return oss.str();
}

bool WriteWkt(const std::string& path, const GeoMultiPolygon& geometry, std::string* err) {
  return WriteText(path, ToWkt(geometry), err);
}

bool ReadWkt(const std::string& path, GeoMultiPolygon* out, std::string* err) {
  std::ifstream in(path);
  if (!in) {
    SetErr(err, "Cannot open file for reading: " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return ParseWkt(buf.str(), out, err);
}

bool WriteGeoJson(const std::string& path,
                  const GeoMultiPolygon& geometry,
                  std::string_view crs,
                  std::string* err) {
  return WriteText(path, ToGeoJson(geometry, crs), err);
}

}  // namespace io
}  // namespace tcw
