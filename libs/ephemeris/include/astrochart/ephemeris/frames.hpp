/**
 * @file frames.hpp
 * @brief Equatorial/ecliptic conversions shared by ephemeris providers.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include <Eigen/Dense>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/time_scales.hpp"

namespace astrochart::ephemeris {

/**
 * @brief Spherical ecliptic state of one body.
 */
struct EclipticState {
  double longitude_deg{};
  double latitude_deg{};
  double distance_au{};
  double longitude_rate_deg_per_day{};
};

/**
 * @brief Rotation taking ICRF/J2000 equatorial vectors into the J2000 ecliptic frame.
 */
inline Eigen::Matrix3d ecliptic_from_equatorial_j2000() {
  const double eps = astrochart::core::constants::kObliquityJ2000Deg * astrochart::core::constants::kDegToRad;
  return Eigen::AngleAxisd(-eps, Eigen::Vector3d::UnitX()).toRotationMatrix();
}

/**
 * @brief Spherical longitude/latitude/distance of an ecliptic vector expressed in AU.
 */
inline EclipticState spherical_from_ecliptic(const Eigen::Vector3d& r_au) {
  const double rho = std::hypot(r_au.x(), r_au.y());
  return EclipticState{
      .longitude_deg = astrochart::core::atan2_deg(r_au.y(), r_au.x()),
      .latitude_deg = std::atan2(r_au.z(), rho) * astrochart::core::constants::kRadToDeg,
      .distance_au = r_au.norm(),
      .longitude_rate_deg_per_day = 0.0,
  };
}

/**
 * @brief Ecliptic state from a J2000 ecliptic position/velocity pair (AU, AU/day).
 */
inline EclipticState ecliptic_state(const Eigen::Vector3d& r_au, const Eigen::Vector3d& v_au_day) {
  EclipticState out = spherical_from_ecliptic(r_au);
  const double rho2 = r_au.x() * r_au.x() + r_au.y() * r_au.y();
  if (rho2 > 0.0) {
    out.longitude_rate_deg_per_day =
        (r_au.x() * v_au_day.y() - r_au.y() * v_au_day.x()) / rho2 * astrochart::core::constants::kRadToDeg;
  }
  return out;
}

/**
 * @brief Shift a J2000 ecliptic longitude to the mean equinox of date.
 */
inline EclipticState precess_to_date(EclipticState s, double jd_tt) {
  s.longitude_deg = astrochart::core::normalize_deg(s.longitude_deg + astrochart::core::precession_in_longitude_deg(jd_tt));
  return s;
}

/**
 * @brief Signed longitude difference b-a wrapped to (-180, 180].
 */
inline double wrapped_delta_deg(double a_deg, double b_deg) {
  double d = std::fmod(b_deg - a_deg, 360.0);
  if (d > 180.0) {
    d -= 360.0;
  } else if (d <= -180.0) {
    d += 360.0;
  }
  return d;
}

}  // namespace astrochart::ephemeris
