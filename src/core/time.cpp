// src/core/time.cpp
//
// ISO-8601 formatting and parsing for nanosecond timestamps.

#include "tcw/core/time.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace tcw {

namespace {

struct CivilDate {
  i64 year;
  unsigned month;
  unsigned day;
};

// Inverse of DaysFromCivil.
CivilDate CivilFromDays(i64 z) {
  z += 719468;
  const i64 era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const i64 y = static_cast<i64>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

i64 FloorDiv(i64 a, i64 b) {
  i64 q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

bool ReadDigits(std::string_view s, usize* pos, usize count, i64* out) {
  if (*pos + count > s.size()) return false;
  i64 v = 0;
  for (usize i = 0; i < count; ++i) {
    const char c = s[*pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  *pos += count;
  *out = v;
  return true;
}

bool Expect(std::string_view s, usize* pos, char c) {
  if (*pos >= s.size() || s[*pos] != c) return false;
  ++*pos;
  return true;
}

}  // namespace

std::string FormatTimestamp(Timestamp t) {
  const i64 days = FloorDiv(t, kNanosPerDay);
  i64 rem = t - days * kNanosPerDay;
  const CivilDate date = CivilFromDays(days);

  const i64 hour = rem / kNanosPerHour;
  rem -= hour * kNanosPerHour;
  const i64 minute = rem / kNanosPerMinute;
  rem -= minute * kNanosPerMinute;
  const i64 second = rem / kNanosPerSecond;
  const i64 nanos = rem - second * kNanosPerSecond;

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-'
      << std::setw(2) << date.day << 'T' << std::setw(2) << hour << ':' << std::setw(2) << minute
      << ':' << std::setw(2) << second;
  if (nanos != 0) oss << '.' << std::setw(9) << nanos;
  return oss.str();
}

bool ParseTimestamp(std::string_view text, Timestamp* out, std::string* err) {
  if (!out) {
    SetErr(err, "ParseTimestamp: out is null");
    return false;
  }
  const auto fail = [&]() {
    SetErr(err, "Invalid timestamp: '" + std::string(text) + "'");
    return false;
  };

  usize pos = 0;
  i64 year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!ReadDigits(text, &pos, 4, &year) || !Expect(text, &pos, '-') ||
      !ReadDigits(text, &pos, 2, &month) || !Expect(text, &pos, '-') ||
      !ReadDigits(text, &pos, 2, &day)) {
    return fail();
  }
  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != ' ') return fail();
    ++pos;
    if (!ReadDigits(text, &pos, 2, &hour) || !Expect(text, &pos, ':') ||
        !ReadDigits(text, &pos, 2, &minute)) {
      return fail();
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!ReadDigits(text, &pos, 2, &second)) return fail();
    }
  }

  i64 nanos = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    usize digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) return fail();
    for (; digits < 9; ++digits) nanos *= 10;
  }
  if (pos < text.size() && text[pos] == 'Z') ++pos;
  if (pos != text.size()) return fail();

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return fail();
  }

  *out = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * kNanosPerDay +
         hour * kNanosPerHour + minute * kNanosPerMinute + second * kNanosPerSecond + nanos;
  return true;
}

}  // namespace tcw
