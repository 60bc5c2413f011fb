/**
 * @file time_scales.hpp
 * @brief Civil date/time parsing, Julian Day conversion and sidereal helpers.
 * @author Watosn
 */
#pragma once

#include <charconv>
#include <chrono>
#include <cmath>
#include <string_view>
#include <system_error>
#include <vector>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/leap_seconds.hpp"
#include "astrochart/core/types.hpp"

namespace astrochart::core {

namespace detail {

inline bool parse_int_field(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto res = std::from_chars(first, last, value);
  return res.ec == std::errc{} && res.ptr == last;
}

inline std::vector<std::string_view> split(std::string_view text, char sep) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

inline std::string_view trim_view(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace detail

inline bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline int days_in_month(int y, int m) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) {
    return 0;
  }
  return (m == 2 && is_leap_year(y)) ? 29 : kDays[m - 1];
}

/**
 * @brief Parse `YYYY-MM-DD` (month/day may be unpadded) into `out` date fields.
 * @return false for malformed text or an impossible calendar date.
 */
inline bool parse_civil_date(std::string_view text, CivilDateTime& out) {
  const auto parts = detail::split(detail::trim_view(text), '-');
  if (parts.size() != 3) {
    return false;
  }
  int y = 0;
  int m = 0;
  int d = 0;
  if (!detail::parse_int_field(parts[0], y) || !detail::parse_int_field(parts[1], m) ||
      !detail::parse_int_field(parts[2], d)) {
    return false;
  }
  if (y < 1 || y > 9999 || m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
    return false;
  }
  out.year = y;
  out.month = m;
  out.day = d;
  return true;
}

/**
 * @brief Parse `HH:MM` or `HH:MM:SS` into `out` time fields.
 */
inline bool parse_civil_time(std::string_view text, CivilDateTime& out) {
  const auto parts = detail::split(detail::trim_view(text), ':');
  if (parts.size() != 2 && parts.size() != 3) {
    return false;
  }
  int h = 0;
  int m = 0;
  int s = 0;
  if (!detail::parse_int_field(parts[0], h) || !detail::parse_int_field(parts[1], m)) {
    return false;
  }
  if (parts.size() == 3 && !detail::parse_int_field(parts[2], s)) {
    return false;
  }
  if (h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 59) {
    return false;
  }
  out.hour = h;
  out.minute = m;
  out.second = static_cast<double>(s);
  return true;
}

inline int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

/**
 * @brief Seconds since Unix epoch for a civil date-time shifted by `utc_offset_hours`.
 */
inline double civil_to_utc_seconds(const CivilDateTime& t, double utc_offset_hours = 0.0) {
  const double day_s = static_cast<double>(days_from_civil(t.year, static_cast<unsigned>(t.month), static_cast<unsigned>(t.day))) *
                       constants::kSecondsPerDay;
  const double tod_s = static_cast<double>(t.hour) * 3600.0 + static_cast<double>(t.minute) * 60.0 + t.second;
  return day_s + tod_s - utc_offset_hours * 3600.0;
}

inline double utc_seconds_to_julian_date_utc(double utc_seconds) {
  return utc_seconds / constants::kSecondsPerDay + constants::kUnixEpochJd;
}

/**
 * @brief Julian Day (UTC) of the system clock.
 */
inline double current_julian_date_utc() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return utc_seconds_to_julian_date_utc(std::chrono::duration<double>(since_epoch).count());
}

// SOFA-style compact periodic model for TDB-TT (seconds).
inline double dtdb_seconds_approx(const double jd_tt) {
  const double t = (jd_tt - constants::kJ2000Jd) / constants::kDaysPerJulianCentury;
  const double g = (357.5277233 + 35999.05034 * t) * constants::kDegToRad;  // Mean anomaly of the Sun.
  const double l = (280.4665 + 36000.7698 * t) * constants::kDegToRad;       // Mean longitude of the Sun.
  return 0.001657 * std::sin(g) + 0.000022 * std::sin(2.0 * g) + 0.000014 * std::sin(3.0 * g) + 0.000005 * std::sin(4.0 * g)
         + 0.000005 * std::sin(l) + 0.000002 * std::sin(2.0 * l);
}

/**
 * @brief Build the ephemeris instant for a civil birth time.
 *
 * The clock reading is taken as UT after removing `utc_offset_hours`; no time-zone lookup happens here.
 */
inline Instant make_instant(const CivilDateTime& t, double utc_offset_hours, const leap_seconds::Table& table) {
  const double utc_s = civil_to_utc_seconds(t, utc_offset_hours);
  const double jd_ut = utc_seconds_to_julian_date_utc(utc_s);
  const double tai_utc = leap_seconds::tai_minus_utc_seconds(jd_ut, table);
  const double jd_tt = jd_ut + (tai_utc + constants::kTtMinusTaiSeconds) / constants::kSecondsPerDay;
  const double jd_tdb = jd_tt + dtdb_seconds_approx(jd_tt) / constants::kSecondsPerDay;
  return Instant{.jd_ut = jd_ut, .jd_tt = jd_tt, .jd_tdb = jd_tdb};
}

inline double julian_centuries_since_j2000(double jd) { return (jd - constants::kJ2000Jd) / constants::kDaysPerJulianCentury; }

/**
 * @brief Greenwich mean sidereal time in degrees.
 */
inline double gmst_deg(double jd_ut) {
  const double t = julian_centuries_since_j2000(jd_ut);
  const double gmst = 280.46061837 + 360.98564736629 * (jd_ut - constants::kJ2000Jd) + 0.000387933 * t * t
                      - (t * t * t) / 38710000.0;
  return normalize_deg(gmst);
}

/**
 * @brief Right ascension of the meridian for an east-positive longitude, degrees.
 */
inline double local_sidereal_time_deg(double jd_ut, double east_longitude_deg) {
  return normalize_deg(gmst_deg(jd_ut) + east_longitude_deg);
}

/**
 * @brief Mean obliquity of the ecliptic of date (IAU 2006 polynomial, truncated), degrees.
 */
inline double mean_obliquity_deg(double jd_tt) {
  const double t = julian_centuries_since_j2000(jd_tt);
  return constants::kObliquityJ2000Deg - (46.836769 * t + 0.0001831 * t * t - 0.00200340 * t * t * t) / 3600.0;
}

/**
 * @brief General precession in longitude from J2000 to the equinox of date, degrees.
 */
inline double precession_in_longitude_deg(double jd_tt) {
  const double t = julian_centuries_since_j2000(jd_tt);
  return (5028.796195 * t + 1.1054348 * t * t) / 3600.0;
}

}  // namespace astrochart::core
