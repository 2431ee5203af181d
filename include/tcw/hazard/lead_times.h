#pragma once
// tcw/hazard/lead_times.h
//
// Lead times of one hazard event in one country.
//
//  - all:    one timestamp per contributing track (never empty)
//  - median: representative timestamp; the weighted median of `all` unless
//            given explicitly
//
// Creation rules:
//   Create(all, median)      keeps both as given
//   FromTimes(all, weights)  derives the weighted median (uniform weights when
//                            `weights` is empty)
//   FromMedian(t)            all = [t]

#include "tcw/core/types.h"

#include <string>
#include <vector>

namespace tcw {
namespace hazard {

class LeadTimes {
 public:
  LeadTimes() = default;

  static bool Create(std::vector<Timestamp> all, Timestamp median, LeadTimes* out, std::string* err = nullptr);

  static bool FromTimes(std::vector<Timestamp> all,
                        const std::vector<double>& weights,
                        LeadTimes* out,
                        std::string* err = nullptr);

  static LeadTimes FromMedian(Timestamp median);

  const std::vector<Timestamp>& All() const noexcept { return all_; }
  Timestamp Median() const noexcept { return median_; }

  // Consistency check; `country_code` (if non-zero) is named in the message.
  bool Check(CountryCode country_code = kNoCountry, std::string* err = nullptr) const;

  // "<median> [<t1>, <t2>, ...]" in ISO-8601.
  std::string ToString() const;

  friend bool operator==(const LeadTimes& a, const LeadTimes& b) {
    return a.median_ == b.median_ && a.all_ == b.all_;
  }
  friend bool operator!=(const LeadTimes& a, const LeadTimes& b) { return !(a == b); }

 private:
  std::vector<Timestamp> all_;
  Timestamp median_ = 0;
};

}  // namespace hazard
}  // namespace tcw
