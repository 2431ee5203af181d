// src/hazard/metadata.cpp

#include "tcw/hazard/metadata.h"

#include "tcw/core/time.h"

#include <sstream>

namespace tcw {
namespace hazard {

bool HazardMetadata::FromLeadTimes(std::string event_name,
                                   Timestamp initialisation_time,
                                   LeadTimesPerCountry lead_times,
                                   HazardMetadata* out,
                                   std::string* err) {
  if (!out) {
    SetErr(err, "HazardMetadata::FromLeadTimes: out is null");
    return false;
  }
  HazardMetadata md;
  md.event_name_ = std::move(event_name);
  md.init_time_ = initialisation_time;
  md.lead_times_ = std::move(lead_times);
  if (!md.Check(err)) return false;
  *out = std::move(md);
  return true;
}

std::vector<CountryCode> HazardMetadata::CountryCodes() const {
  std::vector<CountryCode> codes;
  codes.reserve(lead_times_.size());
  for (const auto& kv : lead_times_) codes.push_back(kv.first);
  return codes;
}

bool HazardMetadata::GetLeadTimes(CountryCode code, LeadTimes* out, std::string* err) const {
  if (!out) {
    SetErr(err, "HazardMetadata::GetLeadTimes: out is null");
    return false;
  }
  auto it = lead_times_.find(code);
  if (it == lead_times_.end()) {
    SetErr(err, "No lead times found for country " + std::to_string(code) + ".");
    return false;
  }
  *out = it->second;
  return true;
}

bool HazardMetadata::Check(std::string* err) const {
  for (const auto& kv : lead_times_) {
    if (kv.first <= kNoCountry) {
      SetErr(err, "Country code must be positive, got " + std::to_string(kv.first));
      return false;
    }
    if (!kv.second.Check(kv.first, err)) return false;
  }
  return true;
}

std::string HazardMetadata::ToString() const {
  std::ostringstream oss;
  oss << "HazardMetadata[event=" << event_name_ << ", init=" << FormatTimestamp(init_time_)
      << ", lead_times={";
  bool first = true;
  for (const auto& kv : lead_times_) {
    if (!first) oss << ", ";
    first = false;
    oss << kv.first << ": " << kv.second.ToString();
  }
  oss << "}]";
  return oss.str();
}

}  // namespace hazard
}  // namespace tcw
