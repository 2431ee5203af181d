#pragma once
// tcw/hazard/metadata.h
//
// HazardMetadata: event name, initialisation time and lead times per country
// (ISO numeric code -> LeadTimes). A country has "landfall" iff it has an
// entry. Instances are immutable; HazardMetadataBuilder assembles one
// incrementally (first writer wins per country).

#include "tcw/core/types.h"
#include "tcw/hazard/lead_times.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tcw {
namespace hazard {

using LeadTimesPerCountry = std::map<CountryCode, LeadTimes>;

class HazardMetadata {
 public:
  HazardMetadata() = default;

  // Fails when a country code is not positive or its lead times are empty.
  static bool FromLeadTimes(std::string event_name,
                            Timestamp initialisation_time,
                            LeadTimesPerCountry lead_times,
                            HazardMetadata* out,
                            std::string* err = nullptr);

  const std::string& EventName() const noexcept { return event_name_; }
  Timestamp InitialisationTime() const noexcept { return init_time_; }
  const LeadTimesPerCountry& LeadTimesByCountry() const noexcept { return lead_times_; }

  // Ascending.
  std::vector<CountryCode> CountryCodes() const;

  bool GetLeadTimes(CountryCode code, LeadTimes* out, std::string* err = nullptr) const;

  bool HasLandfall() const noexcept { return !lead_times_.empty(); }
  bool HasLandfall(CountryCode code) const { return lead_times_.find(code) != lead_times_.end(); }

  bool Check(std::string* err = nullptr) const;

  std::string ToString() const;

  friend bool operator==(const HazardMetadata& a, const HazardMetadata& b) {
    return a.event_name_ == b.event_name_ && a.init_time_ == b.init_time_ && a.lead_times_ == b.lead_times_;
  }
  friend bool operator!=(const HazardMetadata& a, const HazardMetadata& b) { return !(a == b); }

 private:
  std::string event_name_;
  Timestamp init_time_ = 0;
  LeadTimesPerCountry lead_times_;
};

class HazardMetadataBuilder {
 public:
  HazardMetadataBuilder(std::string event_name, Timestamp initialisation_time)
      : event_name_(std::move(event_name)), init_time_(initialisation_time) {}

  // Returns false (and keeps the existing entry) if `code` is already present.
  bool AddIfMissing(CountryCode code, LeadTimes lead_times) {
    return lead_times_.emplace(code, std::move(lead_times)).second;
  }

  bool Contains(CountryCode code) const { return lead_times_.find(code) != lead_times_.end(); }
  usize size() const noexcept { return lead_times_.size(); }

  bool Build(HazardMetadata* out, std::string* err = nullptr) const {
    return HazardMetadata::FromLeadTimes(event_name_, init_time_, lead_times_, out, err);
  }

 private:
  std::string event_name_;
  Timestamp init_time_;
  LeadTimesPerCountry lead_times_;
};

}  // namespace hazard
}  // namespace tcw
