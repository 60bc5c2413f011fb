/**
 * @file lunar_nodes.hpp
 * @brief Mean lunar ascending node (Rahu).
 * @author Watosn
 */
#pragma once

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/time_scales.hpp"
#include "astrochart/core/types.hpp"

namespace astrochart::ephemeris {

/**
 * @brief Longitude of the mean ascending node, mean equinox of date (Meeus, eq. 47.7).
 */
inline double mean_ascending_node_deg(double jd_tt) {
  const double t = astrochart::core::julian_centuries_since_j2000(jd_tt);
  const double t2 = t * t;
  const double t3 = t2 * t;
  const double t4 = t3 * t;
  return astrochart::core::normalize_deg(125.0445479 - 1934.1362891 * t + 0.0020754 * t2 + t3 / 467441.0 - t4 / 60707616.0);
}

/**
 * @brief Daily motion of the mean node (always negative).
 */
inline double mean_ascending_node_rate_deg_per_day(double jd_tt) {
  const double t = astrochart::core::julian_centuries_since_j2000(jd_tt);
  const double dt_dcentury = -1934.1362891 + 2.0 * 0.0020754 * t + 3.0 * t * t / 467441.0 - 4.0 * t * t * t / 60707616.0;
  return dt_dcentury / astrochart::core::constants::kDaysPerJulianCentury;
}

/**
 * @brief Rahu position for an instant; latitude is zero by definition.
 */
inline astrochart::core::CelestialPosition mean_node_position(const astrochart::core::Instant& instant) {
  const double speed = mean_ascending_node_rate_deg_per_day(instant.jd_tt);
  return astrochart::core::CelestialPosition{
      .planet = astrochart::core::Planet::Rahu,
      .longitude_deg = mean_ascending_node_deg(instant.jd_tt),
      .latitude_deg = 0.0,
      .distance_au = 0.0,
      .speed_deg_per_day = speed,
      .retrograde = speed < 0.0,
      .fallback = false,
  };
}

}  // namespace astrochart::ephemeris
