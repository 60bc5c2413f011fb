/**
 * @file analytic_ephemeris.cpp
 * @brief Analytic ephemeris implementation.
 * @author Watosn
 */

#include "astrochart/ephemeris/analytic_ephemeris.hpp"

#include <array>
#include <cmath>
#include <optional>

#include <Eigen/Dense>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/time_scales.hpp"
#include "astrochart/ephemeris/frames.hpp"
#include "astrochart/ephemeris/lunar_nodes.hpp"

namespace astrochart::ephemeris {
namespace {

using astrochart::core::Planet;
using astrochart::core::Status;
namespace constants = astrochart::core::constants;

// Keplerian elements at J2000 and their rates per Julian century (Standish, 1800-2050 fit).
struct MeanElements {
  double a_au;
  double e;
  double i_deg;
  double l_deg;
  double perihelion_deg;
  double node_deg;
  double a_rate;
  double e_rate;
  double i_rate;
  double l_rate;
  double perihelion_rate;
  double node_rate;
};

constexpr MeanElements kMercury{0.38709927, 0.20563593, 7.00497902, 252.25032350, 77.45779628, 48.33076593,
                                0.00000037, 0.00001906, -0.00594749, 149472.67411175, 0.16047689, -0.12534081};
constexpr MeanElements kVenus{0.72333566, 0.00677672, 3.39467605, 181.97909950, 131.60246718, 76.67984255,
                              0.00000390, -0.00004107, -0.00078890, 58517.81538729, 0.00268329, -0.27769418};
constexpr MeanElements kEarthMoonBary{1.00000261, 0.01671123, -0.00001531, 100.46457166, 102.93768193, 0.0,
                                      0.00000562, -0.00004392, -0.01294668, 35999.37244981, 0.32327364, 0.0};
constexpr MeanElements kMars{1.52371034, 0.09339410, 1.84969142, -4.55343205, -23.94362959, 49.55953891,
                             0.00001847, 0.00007882, -0.00813131, 19140.30268499, 0.44441088, -0.29257343};
constexpr MeanElements kJupiter{5.20288700, 0.04838624, 1.30439695, 34.39644051, 14.72847983, 100.47390909,
                                -0.00011607, -0.00013253, -0.00183714, 3034.74612775, 0.21252668, 0.20469106};
constexpr MeanElements kSaturn{9.53667594, 0.05386179, 2.48599187, 49.95424423, 92.59887831, 113.66242448,
                               -0.00125060, -0.00050991, 0.00193609, 1222.49362201, -0.41897216, -0.28867794};

std::optional<MeanElements> elements_for(Planet body) {
  switch (body) {
    case Planet::Mercury:
      return kMercury;
    case Planet::Venus:
      return kVenus;
    case Planet::Mars:
      return kMars;
    case Planet::Jupiter:
      return kJupiter;
    case Planet::Saturn:
      return kSaturn;
    default:
      return std::nullopt;
  }
}

double solve_kepler(double mean_anomaly_rad, double e) {
  double ecc_anomaly = mean_anomaly_rad + e * std::sin(mean_anomaly_rad);
  for (int iter = 0; iter < 30; ++iter) {
    const double delta = (ecc_anomaly - e * std::sin(ecc_anomaly) - mean_anomaly_rad) / (1.0 - e * std::cos(ecc_anomaly));
    ecc_anomaly -= delta;
    if (std::abs(delta) < 1e-12) {
      break;
    }
  }
  return ecc_anomaly;
}

// Heliocentric position in the J2000 ecliptic frame [AU].
Eigen::Vector3d heliocentric_position(const MeanElements& el, double t_centuries) {
  const double a = el.a_au + el.a_rate * t_centuries;
  const double e = el.e + el.e_rate * t_centuries;
  const double inc = (el.i_deg + el.i_rate * t_centuries) * constants::kDegToRad;
  const double mean_lon = el.l_deg + el.l_rate * t_centuries;
  const double perihelion = el.perihelion_deg + el.perihelion_rate * t_centuries;
  const double node = (el.node_deg + el.node_rate * t_centuries) * constants::kDegToRad;
  const double arg_perihelion = perihelion * constants::kDegToRad - node;

  double mean_anomaly = astrochart::core::normalize_deg(mean_lon - perihelion);
  if (mean_anomaly > 180.0) {
    mean_anomaly -= 360.0;
  }
  const double ecc_anomaly = solve_kepler(mean_anomaly * constants::kDegToRad, e);
  const Eigen::Vector3d orbital(a * (std::cos(ecc_anomaly) - e), a * std::sqrt(1.0 - e * e) * std::sin(ecc_anomaly), 0.0);

  const Eigen::Matrix3d to_ecliptic = (Eigen::AngleAxisd(node, Eigen::Vector3d::UnitZ()) *
                                       Eigen::AngleAxisd(inc, Eigen::Vector3d::UnitX()) *
                                       Eigen::AngleAxisd(arg_perihelion, Eigen::Vector3d::UnitZ()))
                                          .toRotationMatrix();
  return to_ecliptic * orbital;
}

EclipticState planet_state(Planet body, double jd_tdb) {
  const double t = astrochart::core::julian_centuries_since_j2000(jd_tdb);
  const Eigen::Vector3d earth = heliocentric_position(kEarthMoonBary, t);
  if (body == Planet::Sun) {
    return spherical_from_ecliptic(-earth);
  }
  return spherical_from_ecliptic(heliocentric_position(*elements_for(body), t) - earth);
}

// Leading terms of Brown's lunar theory; returns ecliptic coordinates of date.
EclipticState moon_state(double jd_tt) {
  const double mjd = jd_tt - 2415020.0;
  const double t = mjd / constants::kDaysPerJulianCentury;
  const double t2 = t * t;
  const auto cycle = [mjd](double period_days) { return 360.0 * std::fmod(mjd / period_days, 1.0); };

  double ld = 270.434164 + cycle(27.32158213) - (0.001133 - 0.0000019 * t) * t2;
  double ms = 358.475833 + cycle(365.2596407) - (0.00015 + 0.0000033 * t) * t2;
  double md = 296.104608 + cycle(27.55455094) + (0.009192 + 0.0000144 * t) * t2;
  double de = 350.737486 + cycle(29.53058868) - (0.001436 - 0.0000019 * t) * t2;
  double f = 11.250889 + cycle(27.21222039) - (0.003211 + 0.0000003 * t) * t2;
  const double n = 259.183275 - cycle(6798.363307) + (0.002078 + 0.0000022 * t) * t2;

  const double sa = astrochart::core::sin_deg(51.2 + 20.2 * t);
  const double sn = astrochart::core::sin_deg(n);
  const double sb = 0.003964 * astrochart::core::sin_deg(346.56 + (132.87 - 0.0091731 * t) * t);
  const double c = n + 275.05 - 2.3 * t;
  const double sc = astrochart::core::sin_deg(c);
  ld += 0.000233 * sa + sb + 0.001964 * sn;
  ms -= 0.001778 * sa;
  md += 0.000817 * sa + sb + 0.002541 * sn;
  f += sb - 0.024691 * sn - 0.004328 * sc;
  de += 0.002011 * sa + sb + 0.001964 * sn;
  const double e = 1.0 - (0.002495 + 7.52e-06 * t) * t;

  ms *= constants::kDegToRad;
  md *= constants::kDegToRad;
  de *= constants::kDegToRad;
  f *= constants::kDegToRad;

  const double lon_terms = 6.28875 * std::sin(md) + 1.27402 * std::sin(2 * de - md) + 0.658309 * std::sin(2 * de) +
                           0.213616 * std::sin(2 * md) - e * 0.185596 * std::sin(ms) - 0.114336 * std::sin(2 * f) +
                           0.058793 * std::sin(2 * (de - md)) + 0.057212 * e * std::sin(2 * de - ms - md) +
                           0.05332 * std::sin(2 * de + md) + 0.045874 * e * std::sin(2 * de - ms) +
                           0.041024 * e * std::sin(md - ms) - 0.034718 * std::sin(de) -
                           e * 0.030465 * std::sin(ms + md) + 0.015326 * std::sin(2 * (de - f)) -
                           0.012528 * std::sin(2 * f + md) - 0.01098 * std::sin(2 * f - md) +
                           0.010674 * std::sin(4 * de - md) + 0.010034 * std::sin(3 * md) +
                           0.008548 * std::sin(4 * de - 2 * md) - e * 0.00791 * std::sin(ms - md + 2 * de) -
                           e * 0.006783 * std::sin(2 * de + ms) + 0.005162 * std::sin(md - de) +
                           e * 0.005 * std::sin(ms + de) + 0.003862 * std::sin(4 * de) +
                           e * 0.004049 * std::sin(md - ms + 2 * de) + 0.003996 * std::sin(2 * (md + de)) +
                           0.003665 * std::sin(2 * de - 3 * md);

  const double lat_terms = 5.12819 * std::sin(f) + 0.280606 * std::sin(md + f) + 0.277693 * std::sin(md - f) +
                           0.173238 * std::sin(2 * de - f) + 0.055413 * std::sin(2 * de + f - md) +
                           0.046272 * std::sin(2 * de - f - md) + 0.032573 * std::sin(2 * de + f) +
                           0.017198 * std::sin(2 * md + f) + 0.009267 * std::sin(2 * de + md - f) +
                           0.008823 * std::sin(2 * md - f) + e * 0.008247 * std::sin(2 * de - ms - f);
  const double w1 = 0.0004664 * astrochart::core::cos_deg(n);
  const double w2 = 0.0000754 * astrochart::core::cos_deg(c);

  const double parallax_deg = 0.950724 + 0.051818 * std::cos(md) + 0.009531 * std::cos(2 * de - md) +
                              0.007843 * std::cos(2 * de) + 0.002824 * std::cos(2 * md) +
                              0.000857 * std::cos(2 * de + md) + e * 0.000533 * std::cos(2 * de - ms);
  constexpr double kEarthRadiusAu = 6378.137e3 / constants::kAstronomicalUnitM;

  return EclipticState{
      .longitude_deg = astrochart::core::normalize_deg(ld + lon_terms),
      .latitude_deg = lat_terms * (1.0 - w1 - w2),
      .distance_au = kEarthRadiusAu / astrochart::core::sin_deg(parallax_deg),
      .longitude_rate_deg_per_day = 0.0,
  };
}

// Ecliptic state of date without rate.
EclipticState state_of_date(Planet body, const astrochart::core::Instant& instant) {
  if (body == Planet::Moon) {
    return moon_state(instant.jd_tt);
  }
  return precess_to_date(planet_state(body, instant.jd_tdb), instant.jd_tt);
}

astrochart::core::Instant shifted(const astrochart::core::Instant& instant, double days) {
  return astrochart::core::Instant{
      .jd_ut = instant.jd_ut + days, .jd_tt = instant.jd_tt + days, .jd_tdb = instant.jd_tdb + days};
}

}  // namespace

astrochart::core::EphemerisSample AnalyticEphemeris::position(Planet body, const astrochart::core::Instant& instant,
                                                              const astrochart::core::GeoCoordinate& /*observer*/) const {
  astrochart::core::EphemerisSample out{};
  out.position.planet = body;

  if (!std::isfinite(instant.jd_tt) || !std::isfinite(instant.jd_tdb)) {
    out.status = Status::InvalidInput;
    return out;
  }
  if (body == Planet::Ketu) {
    out.status = Status::InvalidInput;
    return out;
  }
  if (instant.jd_tdb < config_.valid_from_jd || instant.jd_tdb > config_.valid_to_jd) {
    out.status = Status::DataUnavailable;
    return out;
  }
  if (body == Planet::Rahu) {
    out.position = mean_node_position(instant);
    return out;
  }

  const EclipticState now = state_of_date(body, instant);
  const EclipticState before = state_of_date(body, shifted(instant, -0.5));
  const EclipticState after = state_of_date(body, shifted(instant, 0.5));
  const double speed = wrapped_delta_deg(before.longitude_deg, after.longitude_deg);
  if (!std::isfinite(now.longitude_deg) || !std::isfinite(speed)) {
    out.status = Status::NumericalError;
    return out;
  }

  out.position.longitude_deg = now.longitude_deg;
  out.position.latitude_deg = now.latitude_deg;
  out.position.distance_au = now.distance_au;
  out.position.speed_deg_per_day = speed;
  out.position.retrograde = speed < 0.0;
  out.status = Status::Ok;
  return out;
}

}  // namespace astrochart::ephemeris
