// src/io/track_io.cpp

#include "tcw/io/track_io.h"

#include "tcw/core/logging.h"
#include "tcw/core/time.h"
#include "tcw/io/csv_io.h"

#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <utility>
#include <vector>

namespace tcw {
namespace io {

namespace {

struct MemberRows {
  std::string name;
  Timestamp run_time = 0;
  double frequency = 1.0;
  std::vector<double> lats;
  std::vector<double> lons;
  std::vector<Timestamp> times;
};

std::string FormatDouble(double v) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return oss.str();
}

}  // namespace

bool ReadEnsembleCsv(const std::string& path, TrackEnsemble* out, std::string* err) {
  if (!out) {
    SetErr(err, "ReadEnsembleCsv: out is null");
    return false;
  }
  csv::Table table;
  if (!csv::ReadTable(path, csv::kCsv, /*has_header=*/true, &table, err)) return false;

  const char* required[] = {"member", "run_time", "time", "lat", "lon"};
  usize idx[5];
  for (usize k = 0; k < 5; ++k) {
    const auto col = table.ColumnIndex(required[k]);
    if (!col) {
      SetErr(err, path + ": missing column '" + required[k] + "'");
      return false;
    }
    idx[k] = *col;
  }
  const auto freq_col = table.ColumnIndex("frequency");

  std::vector<MemberRows> members;
  std::map<std::string, usize> member_index;
  for (usize r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    auto fail = [&](const std::string& msg) {
      SetErr(err, path + ": " + table.Where(r) + ": " + msg);
      return false;
    };
    if (row.size() != table.header.size()) {
      return fail("expected " + std::to_string(table.header.size()) + " columns, got " + std::to_string(row.size()));
    }

    Timestamp run_time = 0, time = 0;
    double lat = 0.0, lon = 0.0, frequency = 1.0;
    std::string local_err;
    if (!ParseTimestamp(row[idx[1]], &run_time, &local_err)) return fail(local_err);
    if (!ParseTimestamp(row[idx[2]], &time, &local_err)) return fail(local_err);
    if (!csv::ParseDouble(row[idx[3]], &lat)) return fail("invalid lat '" + row[idx[3]] + "'");
    if (!csv::ParseDouble(row[idx[4]], &lon)) return fail("invalid lon '" + row[idx[4]] + "'");
    if (freq_col && !csv::Trim(row[*freq_col]).empty() && !csv::ParseDouble(row[*freq_col], &frequency)) {
      return fail("invalid frequency '" + row[*freq_col] + "'");
    }

    const std::string& name = row[idx[0]];
    auto it = member_index.find(name);
    if (it == member_index.end()) {
      it = member_index.emplace(name, members.size()).first;
      MemberRows m;
      m.name = name;
      m.run_time = run_time;
      m.frequency = frequency;
      members.push_back(std::move(m));
    }
    MemberRows& m = members[it->second];
    if (m.run_time != run_time) return fail("run_time differs within member '" + name + "'");
    if (m.frequency != frequency) return fail("frequency differs within member '" + name + "'");
    m.lats.push_back(lat);
    m.lons.push_back(lon);
    m.times.push_back(time);
  }

  TrackEnsemble ensemble;
  for (auto& m : members) {
    EnsembleMember member;
    member.name = m.name;
    member.run_time = m.run_time;
    std::string local_err;
    if (!Track::Create(std::move(m.lats), std::move(m.lons), std::move(m.times), m.frequency, &member.track,
                       &local_err)) {
      SetErr(err, path + ": member '" + m.name + "': " + local_err);
      return false;
    }
    ensemble.Add(std::move(member));
  }

  TCW_LOG_DEBUG("tracks", "read", ensemble.size(), "members from", path);
  *out = std::move(ensemble);
  return true;
}

bool WriteEnsembleCsv(const std::string& path, const TrackEnsemble& ensemble, std::string* err) {
  csv::Writer w(path, csv::kCsv, err);
  if (!w.Ok()) return false;
  if (!w.WriteRow({"member", "run_time", "time", "lat", "lon", "frequency"}, err)) return false;
  for (const auto& m : ensemble.Members()) {
    for (usize i = 0; i < m.track.size(); ++i) {
      if (!w.WriteRow({m.name, FormatTimestamp(m.run_time), FormatTimestamp(m.track.Time(i)),
                       FormatDouble(m.track.Latitude(i)), FormatDouble(m.track.Longitude(i)),
                       FormatDouble(m.track.Frequency())},
                      err)) {
        return false;
      }
    }
  }
  return w.Close(err);
}

}  // namespace io
}  // namespace tcw
