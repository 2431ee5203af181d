#pragma once
// tcw/core/timer.h
//
// Wall-clock timing of pipeline stages ("landfall", "band_fall", "grid", ...).

#include <chrono>
#include <functional>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace tcw {

using SteadyClock = std::chrono::steady_clock;

class Stopwatch {
 public:
  double ElapsedMillis() const {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start_).count();
  }

 private:
  SteadyClock::time_point start_ = SteadyClock::now();
};

// Accumulated duration per stage name. Repeated stages add up.
class PhaseRecorder {
 public:
  // Records the time between construction and destruction into its recorder.
  class ScopedPhase {
   public:
    ScopedPhase(PhaseRecorder* rec, std::string name) : rec_(rec), name_(std::move(name)) {}
    ScopedPhase(ScopedPhase&& other) noexcept
        : rec_(std::exchange(other.rec_, nullptr)), name_(std::move(other.name_)), start_(other.start_) {}
    ScopedPhase(const ScopedPhase&) = delete;
    ScopedPhase& operator=(const ScopedPhase&) = delete;
    ScopedPhase& operator=(ScopedPhase&&) = delete;

    ~ScopedPhase() {
      if (rec_) rec_->Add(name_, SteadyClock::now() - start_);
    }

   private:
    PhaseRecorder* rec_;
    std::string name_;
    SteadyClock::time_point start_ = SteadyClock::now();
  };

  // rec may be null; the phase then records nothing.
  static ScopedPhase Scoped(PhaseRecorder* rec, std::string name) { return ScopedPhase(rec, std::move(name)); }

  void Add(std::string_view name, SteadyClock::duration d) {
    auto it = totals_.find(name);
    if (it == totals_.end()) it = totals_.emplace(std::string(name), SteadyClock::duration::zero()).first;
    it->second += d;
  }

  bool Has(std::string_view name) const { return totals_.count(name) > 0; }

  // {"band_fall_ms":0.031000,"landfall_ms":1.250000}
  std::string ToJsonMillis() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << '{';
    const char* sep = "";
    for (const auto& entry : totals_) {
      oss << sep << '"' << entry.first
          << "_ms\":" << std::chrono::duration<double, std::milli>(entry.second).count();
      sep = ",";
    }
    oss << '}';
    return oss.str();
  }

 private:
  std::map<std::string, SteadyClock::duration, std::less<>> totals_;
};

}  // namespace tcw
