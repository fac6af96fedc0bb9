#pragma once

#include <chrono>
#include <cstddef>

#include "tandem/timedef.hpp"

namespace tandem {

inline constexpr std::size_t kRFC7231DateStrLen = 29;

namespace internal {

constexpr auto write2(auto buf, auto value) {
  *buf = static_cast<char>('0' + (value / 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto write4(auto buf, auto value) {
  *buf = static_cast<char>('0' + (value / 1000));
  *++buf = static_cast<char>('0' + ((value / 100) % 10));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

// Copy exactly 3 chars from a source known to have size >= 3.
constexpr auto copy3(auto des, auto src) {
  *des = src[0];
  *++des = src[1];
  *++des = src[2];
  return ++des;
}

}  // namespace internal

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT"), as used by the Date
/// header. Buffer must have space for at least kRFC7231DateStrLen characters (no null terminator added).
/// Returns pointer past last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  static constexpr const char *const WEEKDAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char *const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const weekday wd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};
  out = internal::copy3(out, WEEKDAYS[wd.c_encoding()]);
  *out = ',';
  *++out = ' ';
  out = internal::write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = internal::copy3(++out, MONTHS[static_cast<unsigned>(ymd.month()) - 1]);
  *out = ' ';
  out = internal::write4(++out, static_cast<int>(ymd.year()));
  *out = ' ';
  out = internal::write2(++out, hms.hours().count());
  *out = ':';
  out = internal::write2(++out, hms.minutes().count());
  *out = ':';
  out = internal::write2(++out, hms.seconds().count());
  *out = ' ';
  return internal::copy3(++out, "GMT");
}

}  // namespace tandem
