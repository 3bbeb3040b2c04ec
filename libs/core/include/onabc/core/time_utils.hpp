/**
 * @file time_utils.hpp
 * @brief Civil date/time parsing and formatting on UTC epoch seconds.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>

#include "onabc/core/csv_utils.hpp"
#include "onabc/core/types.hpp"

namespace onabc::core::time {

constexpr double kSecondsPerDay = 86400.0;

inline int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

inline void civil_from_days(int z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  d = doy - (153U * mp + 2U) / 5U + 1U;
  m = mp < 10U ? mp + 3U : mp - 9U;
  y += static_cast<int>(m <= 2U);
}

inline bool is_leap_year(const int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline unsigned days_in_month(const int y, const unsigned m) {
  static constexpr unsigned kDays[12] = {31U, 28U, 31U, 30U, 31U, 30U, 31U, 31U, 30U, 31U, 30U, 31U};
  if (m == 2U && is_leap_year(y)) {
    return 29U;
  }
  return kDays[m - 1U];
}

/**
 * @brief Parse "YYYY-MM-DD" or "YYYY/MM/DD" into the UTC seconds of midnight.
 */
inline std::optional<double> parse_date(const std::string& text) {
  const std::string t = csv::trim(text);
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  char sep1 = 0;
  char sep2 = 0;
  int consumed = 0;
  if (std::sscanf(t.c_str(), "%4d%c%2u%c%2u%n", &year, &sep1, &month, &sep2, &day, &consumed) != 5) {
    return std::nullopt;
  }
  if (static_cast<std::size_t>(consumed) != t.size() || sep1 != sep2 || (sep1 != '-' && sep1 != '/')) {
    return std::nullopt;
  }
  if (month < 1U || month > 12U || day < 1U || day > days_in_month(year, month)) {
    return std::nullopt;
  }
  return static_cast<double>(days_from_civil(year, month, day)) * kSecondsPerDay;
}

/**
 * @brief Parse "HH:MM" or "HH:MM:SS[.fff]" into seconds after midnight.
 */
inline std::optional<double> parse_time_of_day(const std::string& text) {
  std::string t = csv::trim(text);
  if (!t.empty() && (t.back() == 'Z' || t.back() == 'z')) {
    t.pop_back();
  }
  unsigned hour = 0;
  unsigned minute = 0;
  int consumed = 0;
  if (std::sscanf(t.c_str(), "%2u:%2u%n", &hour, &minute, &consumed) != 2) {
    return std::nullopt;
  }
  double second = 0.0;
  const std::string rest = t.substr(static_cast<std::size_t>(consumed));
  if (!rest.empty()) {
    if (rest.front() != ':' || rest.size() < 2U) {
      return std::nullopt;
    }
    const auto s = csv::parse_number(rest.substr(1));
    if (!s.has_value() || rest[1] == '-' || rest[1] == '+') {
      return std::nullopt;
    }
    second = *s;
  }
  if (hour > 23U || minute > 59U || second < 0.0 || second >= 61.0) {
    return std::nullopt;
  }
  return static_cast<double>(hour) * 3600.0 + static_cast<double>(minute) * 60.0 + second;
}

/**
 * @brief Parse a combined date/time field.
 *
 * Accepts "YYYY-MM-DD HH:MM[:SS[.fff]]", the ISO 'T' separator with an
 * optional trailing 'Z', slash-separated dates and date-only values.
 */
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
  const std::string t = csv::trim(text);
  if (t.size() < 10U) {
    return std::nullopt;
  }
  const auto day_start = parse_date(t.substr(0, 10));
  if (!day_start.has_value()) {
    return std::nullopt;
  }
  if (t.size() == 10U) {
    return Timestamp{.utc_seconds = *day_start};
  }
  if (t[10] != ' ' && t[10] != 'T' && t[10] != 't') {
    return std::nullopt;
  }
  const auto tod = parse_time_of_day(t.substr(11));
  if (!tod.has_value()) {
    return std::nullopt;
  }
  return Timestamp{.utc_seconds = *day_start + *tod};
}

/**
 * @brief Combine separate date and time-of-day fields.
 */
inline std::optional<Timestamp> parse_date_and_time(const std::string& date_text, const std::string& time_text) {
  const auto day_start = parse_date(date_text);
  const auto tod = parse_time_of_day(time_text);
  if (!day_start.has_value() || !tod.has_value()) {
    return std::nullopt;
  }
  return Timestamp{.utc_seconds = *day_start + *tod};
}

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SS[.mmm]Z" (milliseconds only when non-zero).
 */
inline std::string format_iso8601(const Timestamp& ts) {
  const double total_ms = std::round(ts.utc_seconds * 1000.0);
  const long long ms_all = static_cast<long long>(total_ms);
  long long days = ms_all / 86400000LL;
  long long ms_of_day = ms_all % 86400000LL;
  if (ms_of_day < 0) {
    ms_of_day += 86400000LL;
    --days;
  }
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  civil_from_days(static_cast<int>(days), y, m, d);
  const long long hh = ms_of_day / 3600000LL;
  const long long mm = (ms_of_day / 60000LL) % 60LL;
  const long long ss = (ms_of_day / 1000LL) % 60LL;
  const long long mmm = ms_of_day % 1000LL;

  char buf[40];
  if (mmm != 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ", y, m, d, hh, mm, ss, mmm);
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lldZ", y, m, d, hh, mm, ss);
  }
  return std::string(buf);
}

}  // namespace onabc::core::time
