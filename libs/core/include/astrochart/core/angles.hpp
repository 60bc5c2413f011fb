/**
 * @file angles.hpp
 * @brief Ecliptic angle helpers shared by chart and index calculators.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include "astrochart/core/constants.hpp"

namespace astrochart::core {

/**
 * @brief Wrap an angle to [0, 360).
 */
inline double normalize_deg(double angle_deg) {
  double a = std::fmod(angle_deg, 360.0);
  if (a < 0.0) {
    a += 360.0;
  }
  // fmod of a tiny negative value can round back up to 360.
  if (a >= 360.0) {
    a = 0.0;
  }
  return a;
}

/**
 * @brief Wrap an angle to [0, 2pi).
 */
inline double normalize_rad(double angle_rad) {
  double a = std::fmod(angle_rad, constants::kTwoPi);
  if (a < 0.0) {
    a += constants::kTwoPi;
  }
  return a;
}

/**
 * @brief Smaller of the two arcs between longitudes, in [0, 180].
 */
inline double angular_separation_deg(double a_deg, double b_deg) {
  const double diff = std::abs(normalize_deg(a_deg) - normalize_deg(b_deg));
  return diff > 180.0 ? 360.0 - diff : diff;
}

/**
 * @brief Forward (counter-clockwise) arc from `from_deg` to `to_deg`, in [0, 360).
 */
inline double forward_arc_deg(double from_deg, double to_deg) { return normalize_deg(to_deg - from_deg); }

/**
 * @brief True when `lon_deg` lies on the half-open arc [start_deg, end_deg), wrapping through 0.
 */
inline bool arc_contains(double start_deg, double end_deg, double lon_deg) {
  const double start = normalize_deg(start_deg);
  const double end = normalize_deg(end_deg);
  const double lon = normalize_deg(lon_deg);
  if (start <= end) {
    return lon >= start && lon < end;
  }
  return lon >= start || lon < end;
}

inline double sin_deg(double a) { return std::sin(a * constants::kDegToRad); }
inline double cos_deg(double a) { return std::cos(a * constants::kDegToRad); }
inline double tan_deg(double a) { return std::tan(a * constants::kDegToRad); }
inline double atan2_deg(double y, double x) { return normalize_deg(std::atan2(y, x) * constants::kRadToDeg); }

}  // namespace astrochart::core
