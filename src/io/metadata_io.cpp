// src/io/metadata_io.cpp

#include "tcw/io/metadata_io.h"

#include "tcw/core/logging.h"
#include "tcw/core/time.h"
#include "tcw/io/csv_io.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace tcw {
namespace io {

namespace {

constexpr char kListSep = ';';

std::string JsonString(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
  return out;
}

std::string JoinTimes(const std::vector<Timestamp>& times) {
  std::string out;
  for (usize i = 0; i < times.size(); ++i) {
    if (i) out.push_back(kListSep);
    out += FormatTimestamp(times[i]);
  }
  return out;
}

}  // namespace

std::string MetadataToJson(const hazard::HazardMetadata& metadata, const geography::ICountryLookup* lookup) {
  std::ostringstream oss;
  oss << "{\"event_name\":" << JsonString(metadata.EventName())
      << ",\"initialisation_time\":" << JsonString(FormatTimestamp(metadata.InitialisationTime()))
      << ",\"leadtimes_per_country\":{";
  bool first = true;
  for (const auto& kv : metadata.LeadTimesByCountry()) {
    geography::Country country;
    if (lookup) {
      std::string lookup_err;
      if (!lookup->CountryForIdentifier(std::to_string(kv.first), &country, &lookup_err)) {
        TCW_LOG_WARN("metadata", "no country annotations for", kv.first, "-", lookup_err);
        country = geography::Country{};
      }
    }
    if (!first) oss << ",";
    first = false;
    oss << "\"" << kv.first << "\":{"
        << "\"country_name\":" << JsonString(country.name) << ","
        << "\"country_alpha3\":" << JsonString(country.alpha3) << ","
        << "\"country_alpha2\":" << JsonString(country.alpha2) << ","
        << "\"median_leadtime\":" << JsonString(FormatTimestamp(kv.second.Median())) << ","
        << "\"all_leadtimes\":[";
    const auto& all = kv.second.All();
    for (usize i = 0; i < all.size(); ++i) {
      if (i) oss << ",";
      oss << JsonString(FormatTimestamp(all[i]));
    }
    oss << "]}";
  }
  oss << "}}";
  return oss.str();
}

bool WriteMetadataJson(const std::string& path,
                       const hazard::HazardMetadata& metadata,
                       const geography::ICountryLookup* lookup,
                       std::string* err) {
  std::ofstream out(path);
  if (!out) {
    SetErr(err, "Cannot open file for writing: " + path);
    return false;
  }
  out << MetadataToJson(metadata, lookup) << "\n";
  out.close();
  if (out.fail()) {
    SetErr(err, "Write failed: " + path);
    return false;
  }
  TCW_LOG_INFO("metadata", "wrote metadata to", path);
  return true;
}

bool WriteMetadataTsv(const std::string& path, const hazard::HazardMetadata& metadata, std::string* err) {
  csv::Writer w(path, csv::kTsv, err);
  if (!w.Ok()) return false;
  if (!w.WriteRow({"event_name", "initialisation_time", "country_code", "median_leadtime", "all_leadtimes"}, err)) {
    return false;
  }
  const std::string init = FormatTimestamp(metadata.InitialisationTime());
  if (!metadata.HasLandfall()) {
    if (!w.WriteRow({metadata.EventName(), init, "", "", ""}, err)) return false;
    return w.Close(err);
  }
  for (const auto& kv : metadata.LeadTimesByCountry()) {
    if (!w.WriteRow({metadata.EventName(), init, std::to_string(kv.first), FormatTimestamp(kv.second.Median()),
                     JoinTimes(kv.second.All())},
                    err)) {
      return false;
    }
  }
  return w.Close(err);
}

bool ReadMetadataTsv(const std::string& path, hazard::HazardMetadata* out, std::string* err) {
  if (!out) {
    SetErr(err, "ReadMetadataTsv: out is null");
    return false;
  }
  csv::Table table;
  if (!csv::ReadTable(path, csv::kTsv, /*has_header=*/true, &table, err)) return false;

  const char* names[] = {"event_name", "initialisation_time", "country_code", "median_leadtime", "all_leadtimes"};
  usize idx[5];
  for (usize k = 0; k < 5; ++k) {
    const auto col = table.ColumnIndex(names[k]);
    if (!col) {
      SetErr(err, path + ": missing column '" + names[k] + "'");
      return false;
    }
    idx[k] = *col;
  }
  if (table.rows.empty()) {
    SetErr(err, path + ": no metadata rows");
    return false;
  }

  std::string event_name;
  Timestamp init_time = 0;
  hazard::LeadTimesPerCountry per_country;
  for (usize r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    auto fail = [&](const std::string& msg) {
      SetErr(err, path + ": " + table.Where(r) + ": " + msg);
      return false;
    };
    if (row.size() != table.header.size()) {
      return fail("expected " + std::to_string(table.header.size()) + " columns, got " + std::to_string(row.size()));
    }
    Timestamp row_init = 0;
    std::string local_err;
    if (!ParseTimestamp(row[idx[1]], &row_init, &local_err)) return fail(local_err);
    if (r == 0) {
      event_name = row[idx[0]];
      init_time = row_init;
    } else if (row[idx[0]] != event_name || row_init != init_time) {
      return fail("event name or initialisation time differs from the first row");
    }

    if (row[idx[2]].empty()) {
      if (table.rows.size() != 1) return fail("row without country code in metadata with countries");
      continue;
    }
    i64 code = 0;
    if (!csv::ParseI64(row[idx[2]], &code) || code <= 0) return fail("invalid country code '" + row[idx[2]] + "'");
    if (per_country.count(static_cast<CountryCode>(code)) != 0) {
      return fail("duplicate country code " + std::to_string(code));
    }

    std::vector<Timestamp> all;
    std::string_view list(row[idx[4]]);
    while (!list.empty()) {
      const usize pos = list.find(kListSep);
      const std::string_view item = list.substr(0, pos);
      Timestamp t = 0;
      if (!ParseTimestamp(csv::Trim(item), &t, &local_err)) return fail(local_err);
      all.push_back(t);
      if (pos == std::string_view::npos) break;
      list.remove_prefix(pos + 1);
    }

    hazard::LeadTimes lt;
    if (row[idx[3]].empty()) {
      if (!hazard::LeadTimes::FromTimes(std::move(all), {}, &lt, &local_err)) return fail(local_err);
    } else {
      Timestamp median = 0;
      if (!ParseTimestamp(row[idx[3]], &median, &local_err)) return fail(local_err);
      if (all.empty()) {
        lt = hazard::LeadTimes::FromMedian(median);
      } else if (!hazard::LeadTimes::Create(std::move(all), median, &lt, &local_err)) {
        return fail(local_err);
      }
    }
    per_country.emplace(static_cast<CountryCode>(code), std::move(lt));
  }

  return hazard::HazardMetadata::FromLeadTimes(std::move(event_name), init_time, std::move(per_country), out, err);
}

}  // namespace io
}  // namespace tcw
