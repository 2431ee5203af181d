#pragma once
// tcw/core/time.h
//
// Timestamp helpers. A Timestamp is nanoseconds since 1970-01-01T00:00:00Z.
//
// Text form is ISO-8601 without offset: "YYYY-MM-DDTHH:MM:SS[.fffffffff]".
// ParseTimestamp also accepts a ' ' separator and a trailing 'Z'.
// Format -> Parse is lossless.

#include "tcw/core/types.h"

#include <string>
#include <string_view>

namespace tcw {

inline constexpr i64 kNanosPerSecond = 1000000000LL;
inline constexpr i64 kNanosPerMinute = 60LL * kNanosPerSecond;
inline constexpr i64 kNanosPerHour = 60LL * kNanosPerMinute;
inline constexpr i64 kNanosPerDay = 24LL * kNanosPerHour;

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm).
constexpr i64 DaysFromCivil(i64 y, unsigned m, unsigned d) noexcept {
  y -= m <= 2 ? 1 : 0;
  const i64 era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<i64>(doe) - 719468;
}

constexpr Timestamp MakeTimestamp(int year, int month, int day,
                                  int hour = 0, int minute = 0, int second = 0) noexcept {
  return DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * kNanosPerDay +
         static_cast<i64>(hour) * kNanosPerHour + static_cast<i64>(minute) * kNanosPerMinute +
         static_cast<i64>(second) * kNanosPerSecond;
}

std::string FormatTimestamp(Timestamp t);

bool ParseTimestamp(std::string_view text, Timestamp* out, std::string* err = nullptr);

}  // namespace tcw
