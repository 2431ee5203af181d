// src/hazard/affected.cpp

#include "tcw/hazard/affected.h"

#include "tcw/core/logging.h"
#include "tcw/io/csv_io.h"

namespace tcw {
namespace hazard {

bool StaticAffectedCountries::LoadTsv(const std::string& path, StaticAffectedCountries* out, std::string* err) {
  if (!out) {
    SetErr(err, "StaticAffectedCountries::LoadTsv: out is null");
    return false;
  }
  csv::Table table;
  if (!csv::ReadTable(path, csv::kTsv, /*has_header=*/true, &table, err)) return false;

  const auto code_col = table.ColumnIndex("country_code");
  const auto track_col = table.ColumnIndex("track_index");
  if (!code_col || !track_col) {
    SetErr(err, path + ": expected columns 'country_code' and 'track_index'");
    return false;
  }

  StaticAffectedCountries result;
  usize skipped = 0;
  for (usize r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    i64 code = 0, track = 0;
    if (row.size() <= *code_col || row.size() <= *track_col || !csv::ParseI64(row[*code_col], &code) ||
        !csv::ParseI64(row[*track_col], &track) || code < 0 || track < 0) {
      SetErr(err, path + ": " + table.Where(r) + ": expected a country code and a track index >= 0");
      return false;
    }
    if (code == kNoCountry) {
      ++skipped;
      continue;
    }
    result.Add(static_cast<CountryCode>(code), static_cast<usize>(track));
  }

  TCW_LOG_DEBUG("affected", "loaded", result.tracks_.size(), "affected countries from", path, "(skipped",
                skipped, "ocean rows)");
  *out = std::move(result);
  return true;
}

}  // namespace hazard
}  // namespace tcw
