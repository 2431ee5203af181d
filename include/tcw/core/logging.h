#pragma once
// tcw/core/logging.h
//
// Process-wide logging with per-component tags.
// Usage:
//   TCW_LOG_INFO("grid", "padded grid to", rows, "x", cols);
//   tcw::Logger::Instance().SetLevel(tcw::LogLevel::Debug);
//
// Output line: "<timestamp> [LEVEL][component] message". Default sink is stderr.

#include "tcw/core/types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

namespace tcw {

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5,
};

inline constexpr std::string_view ToString(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "UNKNOWN";
}

inline bool ParseLogLevel(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  using detail::EqualsIgnoreCase;
  if (EqualsIgnoreCase(s, "trace")) { *out = LogLevel::Trace; return true; }
  if (EqualsIgnoreCase(s, "debug")) { *out = LogLevel::Debug; return true; }
  if (EqualsIgnoreCase(s, "info")) { *out = LogLevel::Info; return true; }
  if (EqualsIgnoreCase(s, "warn") || EqualsIgnoreCase(s, "warning")) { *out = LogLevel::Warn; return true; }
  if (EqualsIgnoreCase(s, "error")) { *out = LogLevel::Error; return true; }
  if (EqualsIgnoreCase(s, "off")) { *out = LogLevel::Off; return true; }
  return false;
}

struct LoggingConfig {
  LogLevel level = LogLevel::Info;
  bool with_timestamp = true;
  bool with_thread_id = false;
  bool with_component = true;
};

namespace detail {

// "2024-09-01T06:00:00.125Z"
inline void WriteUtcNow(std::ostream& os) {
  const auto now = std::chrono::system_clock::now();
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  std::tm parts{};
#if defined(_WIN32)
  gmtime_s(&parts, &secs);
#else
  gmtime_r(&secs, &parts);
#endif
  os << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis
     << 'Z';
}

}  // namespace detail

class Logger {
 public:
  static Logger& Instance() {
    static Logger logger;
    return logger;
  }

  void SetConfig(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lock(mu_);
    cfg_ = cfg;
    threshold_.store(cfg.level, std::memory_order_relaxed);
  }

  void SetLevel(LogLevel lvl) { threshold_.store(lvl, std::memory_order_relaxed); }
  LogLevel Level() const { return threshold_.load(std::memory_order_relaxed); }

  bool Enabled(LogLevel lvl) const {
    const LogLevel threshold = Level();
    return threshold != LogLevel::Off && lvl >= threshold;
  }

  // nullptr restores stderr. The stream must outlive its use here.
  void SetOutput(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mu_);
    sink_ = sink ? sink : &std::cerr;
  }

  template <class... Args>
  void Log(LogLevel lvl, std::string_view component, const Args&... parts) {
    if (!Enabled(lvl)) return;

    std::lock_guard<std::mutex> lock(mu_);
    std::ostringstream line;
    WritePrefix(line, lvl, component);
    // Message parts are joined by single spaces.
    int n = 0;
    ((line << (n++ ? " " : "") << parts), ...);
    line << '\n';
    (*sink_) << line.str() << std::flush;
  }

 private:
  Logger() = default;

  // "<timestamp> [LEVEL][component][tid=..] " with the optional pieces per cfg_.
  void WritePrefix(std::ostream& os, LogLevel lvl, std::string_view component) const {
    if (cfg_.with_timestamp) {
      detail::WriteUtcNow(os);
      os << ' ';
    }
    os << '[' << ToString(lvl) << ']';
    if (cfg_.with_component && !component.empty()) os << '[' << component << ']';
    if (cfg_.with_thread_id) os << "[tid=" << std::this_thread::get_id() << ']';
    os << ' ';
  }

  std::atomic<LogLevel> threshold_{LogLevel::Info};
  LoggingConfig cfg_;
  std::ostream* sink_ = &std::cerr;
  std::mutex mu_;
};

#define TCW_LOG_TRACE(component, ...) ::tcw::Logger::Instance().Log(::tcw::LogLevel::Trace, (component), __VA_ARGS__)
#define TCW_LOG_DEBUG(component, ...) ::tcw::Logger::Instance().Log(::tcw::LogLevel::Debug, (component), __VA_ARGS__)
#define TCW_LOG_INFO(component, ...)  ::tcw::Logger::Instance().Log(::tcw::LogLevel::Info,  (component), __VA_ARGS__)
#define TCW_LOG_WARN(component, ...)  ::tcw::Logger::Instance().Log(::tcw::LogLevel::Warn,  (component), __VA_ARGS__)
#define TCW_LOG_ERROR(component, ...) ::tcw::Logger::Instance().Log(::tcw::LogLevel::Error, (component), __VA_ARGS__)

}  // namespace tcw
