// src/hazard/lead_times.cpp

#include "tcw/hazard/lead_times.h"

#include "tcw/core/stats.h"
#include "tcw/core/time.h"

#include <sstream>
#include <utility>

namespace tcw {
namespace hazard {

bool LeadTimes::Create(std::vector<Timestamp> all, Timestamp median, LeadTimes* out, std::string* err) {
  if (!out) {
    SetErr(err, "LeadTimes::Create: out is null");
    return false;
  }
  if (all.empty()) {
    SetErr(err, "Missing lead times.");
    return false;
  }
  LeadTimes lt;
  lt.all_ = std::move(all);
  lt.median_ = median;
  *out = std::move(lt);
  return true;
}

bool LeadTimes::FromTimes(std::vector<Timestamp> all,
                          const std::vector<double>& weights,
                          LeadTimes* out,
                          std::string* err) {
  if (!out) {
    SetErr(err, "LeadTimes::FromTimes: out is null");
    return false;
  }
  if (all.empty()) {
    SetErr(err, "Neither all lead times nor median lead time specified.");
    return false;
  }
  Timestamp median = 0;
  const bool ok = weights.empty() ? tcw::Median(Span<const i64>(all), &median, err)
                                  : tcw::WeightedMedian(Span<const i64>(all), Span<const double>(weights), &median, err);
  if (!ok) return false;
  return Create(std::move(all), median, out, err);
}

LeadTimes LeadTimes::FromMedian(Timestamp median) {
  LeadTimes lt;
  lt.all_.push_back(median);
  lt.median_ = median;
  return lt;
}

bool LeadTimes::Check(CountryCode country_code, std::string* err) const {
  if (!all_.empty()) return true;
  if (country_code != kNoCountry) {
    SetErr(err, "Missing lead times for country code " + std::to_string(country_code) + ".");
  } else {
    SetErr(err, "Missing lead times.");
  }
  return false;
}

std::string LeadTimes::ToString() const {
  std::ostringstream oss;
  oss << FormatTimestamp(median_) << " [";
  for (usize i = 0; i < all_.size(); ++i) {
    if (i) oss << ", ";
    oss << FormatTimestamp(all_[i]);
  }
  oss << "]";
  return oss.str();
}

}  // namespace hazard
}  // namespace tcw
