#pragma once
// tcw/core/config.h
//
// Estimation settings and CLI parsing.
//
// Convention:
//  - CLI uses --key=value or --key value (e.g., --landfall_radius_km=50 --log_level debug).
//  - Unknown keys are kept in `extra` so apps can read their own flags.
//  - Defaults are the operational settings of the warning service.

#include "tcw/core/logging.h"
#include "tcw/core/types.h"

#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tcw {

// --------------------------
// Small key/value argument map
// --------------------------
class ArgMap {
 public:
  ArgMap() = default;

  static ArgMap FromArgv(int argc, char** argv) {
    ArgMap m;
    for (int i = 1; i < argc; ++i) {
      std::string_view token(argv[i]);
      if (token.rfind("-", 0) != 0) {
        m.positional_.emplace_back(token);
        continue;
      }
      token.remove_prefix(token.rfind("--", 0) == 0 ? 2 : 1);
      const auto eq_pos = token.find('=');
      if (eq_pos != std::string_view::npos) {
        m.kv_[std::string(token.substr(0, eq_pos))] = std::string(token.substr(eq_pos + 1));
        continue;
      }
      // "--key value" unless the next token is another flag; a bare flag means "true".
      if (i + 1 < argc && std::string_view(argv[i + 1]).rfind("-", 0) != 0) {
        m.kv_[std::string(token)] = argv[i + 1];
        ++i;
      } else {
        m.kv_[std::string(token)] = "true";
      }
    }
    return m;
  }

  bool Has(std::string_view key) const {
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string_view> Get(std::string_view key) const {
    auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return std::nullopt;
    return std::string_view(it->second);
  }

  const std::unordered_map<std::string, std::string>& KV() const { return kv_; }
  const std::vector<std::string>& Positional() const { return positional_; }

 private:
  std::unordered_map<std::string, std::string> kv_;
  std::vector<std::string> positional_;
};

namespace detail {

inline bool ParseBool(std::string_view s, bool* out) noexcept {
  if (!out) return false;
  if (EqualsIgnoreCase(s, "1") || EqualsIgnoreCase(s, "true") || EqualsIgnoreCase(s, "yes") ||
      EqualsIgnoreCase(s, "on")) {
    *out = true;
    return true;
  }
  if (EqualsIgnoreCase(s, "0") || EqualsIgnoreCase(s, "false") || EqualsIgnoreCase(s, "no") ||
      EqualsIgnoreCase(s, "off")) {
    *out = false;
    return true;
  }
  return false;
}

inline bool ParseI64(std::string_view s, i64* out) {
  if (!out || s.empty()) return false;
  try {
    std::size_t idx = 0;
    const long long v = std::stoll(std::string(s), &idx, 10);
    if (idx != s.size()) return false;
    *out = static_cast<i64>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

inline bool ParseDouble(std::string_view s, double* out) {
  if (!out || s.empty()) return false;
  try {
    std::size_t idx = 0;
    const double v = std::stod(std::string(s), &idx);
    if (idx != s.size()) return false;
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// "1/24" is accepted besides plain decimals, since resolutions are usually
// given as fractions of a degree.
inline bool ParseDoubleOrFraction(std::string_view s, double* out) {
  const auto slash = s.find('/');
  if (slash == std::string_view::npos) return ParseDouble(s, out);
  double num = 0.0, den = 0.0;
  if (!ParseDouble(s.substr(0, slash), &num) || !ParseDouble(s.substr(slash + 1), &den)) return false;
  if (den == 0.0) return false;
  *out = num / den;
  return true;
}

}  // namespace detail

// --------------------------
// Settings
// --------------------------
struct TrackSettings {
  // Assumed resolution of the centroid grid (degrees); tracks are densified to
  // this spacing so that no country cell is skipped.
  double grid_resolution_deg = 1.0 / 24.0;

  // Radius (km) around a track point that counts as a band-fall.
  double landfall_radius_km = 50.0;

  // Countries reached by no track get the forecast initialization time.
  bool init_time_fallback = false;
};

struct WarnSettings {
  i64 erosion = 0;
  i64 dilation = 4;
  i64 median_filtering = 4;
  bool gradually_decreased = true;
  i64 small_regions_threshold = 50;
};

struct ImpactSettings {
  // Minimum probability of impact for a location to be "potentially affected".
  double probability_threshold = 0.05;

  // Resolution (arc-milliseconds) of a grid axis that has a single sample.
  i64 default_grid_resolution = 150000;

  // Minimum number of rows and columns of a probability grid.
  i64 minimum_grid_size = 10;

  WarnSettings warn;
};

struct OutputConfig {
  std::string out_dir = "out";
  std::string event_tag;  // optional, prefixes output file names
};

struct Config {
  TrackSettings tracks;
  ImpactSettings impact;
  OutputConfig output;
  LoggingConfig logging;

  // Flags not known to Config (input paths etc.).
  std::unordered_map<std::string, std::string> extra;

  bool Validate(std::string* err = nullptr) const {
    auto fail = [&](const std::string& msg) {
      SetErr(err, msg);
      return false;
    };

    if (!(tracks.grid_resolution_deg > 0.0)) return fail("tracks.grid_resolution_deg must be > 0");
    if (!(tracks.landfall_radius_km >= 0.0)) return fail("tracks.landfall_radius_km must be >= 0");
    if (!(impact.probability_threshold > 0.0 && impact.probability_threshold < 1.0)) {
      return fail("impact.probability_threshold must be in (0,1)");
    }
    if (impact.default_grid_resolution <= 0) return fail("impact.default_grid_resolution must be > 0");
    if (impact.minimum_grid_size <= 0) return fail("impact.minimum_grid_size must be > 0");
    if (impact.warn.erosion < 0 || impact.warn.dilation < 0 || impact.warn.median_filtering < 0) {
      return fail("impact.warn operation sizes must be >= 0");
    }
    if (impact.warn.small_regions_threshold < 0) return fail("impact.warn.small_regions_threshold must be >= 0");
    return true;
  }

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss << "{"
        << "\"tracks\":{\"grid_resolution_deg\":" << tracks.grid_resolution_deg << ","
        << "\"landfall_radius_km\":" << tracks.landfall_radius_km << ","
        << "\"init_time_fallback\":" << (tracks.init_time_fallback ? "true" : "false") << "},"
        << "\"impact\":{\"probability_threshold\":" << impact.probability_threshold << ","
        << "\"default_grid_resolution\":" << impact.default_grid_resolution << ","
        << "\"minimum_grid_size\":" << impact.minimum_grid_size << ","
        << "\"warn\":{\"erosion\":" << impact.warn.erosion << ","
        << "\"dilation\":" << impact.warn.dilation << ","
        << "\"median_filtering\":" << impact.warn.median_filtering << ","
        << "\"gradually_decreased\":" << (impact.warn.gradually_decreased ? "true" : "false") << ","
        << "\"small_regions_threshold\":" << impact.warn.small_regions_threshold << "}},"
        << "\"output\":{\"out_dir\":\"" << output.out_dir << "\","
        << "\"event_tag\":\"" << output.event_tag << "\"},"
        << "\"logging\":{\"level\":\"" << ToString(logging.level) << "\","
        << "\"with_timestamp\":" << (logging.with_timestamp ? "true" : "false") << ","
        << "\"with_thread_id\":" << (logging.with_thread_id ? "true" : "false") << "}"
        << "}";
    return oss.str();
  }

  // Parse from CLI arguments. A malformed value for a known key is an error.
  static bool FromArgs(int argc, char** argv, Config* out, std::string* err = nullptr) {
    if (!out) {
      SetErr(err, "Config::FromArgs: out is null");
      return false;
    }
    const ArgMap args = ArgMap::FromArgv(argc, argv);
    Config cfg;

    bool ok = true;
    std::string bad;
    auto check = [&](std::string_view key, bool parsed) {
      if (!parsed && ok) {
        ok = false;
        bad = std::string(key);
      }
    };

    if (auto v = args.Get("grid_resolution_deg")) {
      check("grid_resolution_deg", detail::ParseDoubleOrFraction(*v, &cfg.tracks.grid_resolution_deg));
    }
    if (auto v = args.Get("landfall_radius_km")) {
      check("landfall_radius_km", detail::ParseDouble(*v, &cfg.tracks.landfall_radius_km));
    }
    if (auto v = args.Get("init_time_fallback")) {
      check("init_time_fallback", detail::ParseBool(*v, &cfg.tracks.init_time_fallback));
    }
    if (auto v = args.Get("probability_threshold")) {
      check("probability_threshold", detail::ParseDouble(*v, &cfg.impact.probability_threshold));
    }
    if (auto v = args.Get("default_grid_resolution")) {
      check("default_grid_resolution", detail::ParseI64(*v, &cfg.impact.default_grid_resolution));
    }
    if (auto v = args.Get("minimum_grid_size")) {
      check("minimum_grid_size", detail::ParseI64(*v, &cfg.impact.minimum_grid_size));
    }
    if (auto v = args.Get("erosion")) check("erosion", detail::ParseI64(*v, &cfg.impact.warn.erosion));
    if (auto v = args.Get("dilation")) check("dilation", detail::ParseI64(*v, &cfg.impact.warn.dilation));
    if (auto v = args.Get("median_filtering")) {
      check("median_filtering", detail::ParseI64(*v, &cfg.impact.warn.median_filtering));
    }
    if (auto v = args.Get("gradually_decreased")) {
      check("gradually_decreased", detail::ParseBool(*v, &cfg.impact.warn.gradually_decreased));
    }
    if (auto v = args.Get("small_regions_threshold")) {
      check("small_regions_threshold", detail::ParseI64(*v, &cfg.impact.warn.small_regions_threshold));
    }

    if (auto v = args.Get("out_dir")) cfg.output.out_dir = std::string(*v);
    if (auto v = args.Get("event_tag")) cfg.output.event_tag = std::string(*v);

    if (auto v = args.Get("log_level")) check("log_level", ParseLogLevel(*v, &cfg.logging.level));
    if (auto v = args.Get("log_timestamp")) check("log_timestamp", detail::ParseBool(*v, &cfg.logging.with_timestamp));
    if (auto v = args.Get("log_thread")) check("log_thread", detail::ParseBool(*v, &cfg.logging.with_thread_id));

    if (!ok) {
      SetErr(err, "Invalid value for --" + bad);
      return false;
    }

    static const std::vector<std::string> kKnown = {
        "grid_resolution_deg", "landfall_radius_km", "init_time_fallback",
        "probability_threshold", "default_grid_resolution", "minimum_grid_size",
        "erosion", "dilation", "median_filtering", "gradually_decreased", "small_regions_threshold",
        "out_dir", "event_tag",
        "log_level", "log_timestamp", "log_thread",
    };
    for (const auto& kv : args.KV()) {
      bool known = false;
      for (const auto& k : kKnown) {
        if (kv.first == k) {
          known = true;
          break;
        }
      }
      if (!known) cfg.extra[kv.first] = kv.second;
    }

    *out = std::move(cfg);
    return true;
  }

  std::optional<std::string_view> Extra(std::string_view key) const {
    auto it = extra.find(std::string(key));
    if (it == extra.end()) return std::nullopt;
    return std::string_view(it->second);
  }
};

}  // namespace tcw
