/**
 * @file test_analytic_ephemeris.cpp
 * @brief Built-in analytic ephemeris sanity checks.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/leap_seconds.hpp"
#include "astrochart/core/time_scales.hpp"
#include "astrochart/core/zodiac.hpp"
#include "astrochart/ephemeris/analytic_ephemeris.hpp"
#include "astrochart/ephemeris/lunar_nodes.hpp"

int main() {
  using namespace astrochart;
  using core::Planet;
  using core::Status;

  const core::Instant j2000 = core::make_instant(
      core::CivilDateTime{.year = 2000, .month = 1, .day = 1, .hour = 12, .minute = 0, .second = 0.0}, 0.0,
      core::leap_seconds::default_table());
  const core::GeoCoordinate observer{.latitude_deg = 19.0760, .longitude_deg = 72.8777};
  const ephemeris::AnalyticEphemeris eph;

  const auto sun = eph.position(Planet::Sun, j2000, observer);
  if (sun.status != Status::Ok) {
    spdlog::error("sun evaluation failed");
    return 1;
  }
  // Apparent solar longitude at J2000 is about 280.37 deg.
  if (core::angular_separation_deg(sun.position.longitude_deg, 280.37) > 0.5) {
    spdlog::error("sun longitude off: {}", sun.position.longitude_deg);
    return 2;
  }
  if (std::abs(sun.position.latitude_deg) > 0.01 || std::abs(sun.position.distance_au - 0.9833) > 0.002) {
    spdlog::error("sun latitude/distance off: lat={} r={}", sun.position.latitude_deg, sun.position.distance_au);
    return 3;
  }
  if (sun.position.speed_deg_per_day < 0.95 || sun.position.speed_deg_per_day > 1.05 || sun.position.retrograde) {
    spdlog::error("sun daily motion off: {}", sun.position.speed_deg_per_day);
    return 4;
  }

  const auto moon = eph.position(Planet::Moon, j2000, observer);
  // Geocentric lunar longitude at J2000 is about 223.3 deg.
  if (moon.status != Status::Ok || core::angular_separation_deg(moon.position.longitude_deg, 223.3) > 2.0) {
    spdlog::error("moon longitude off: {}", moon.position.longitude_deg);
    return 5;
  }
  if (moon.position.speed_deg_per_day < 11.0 || moon.position.speed_deg_per_day > 15.5) {
    spdlog::error("moon daily motion off: {}", moon.position.speed_deg_per_day);
    return 6;
  }

  // Inner planets stay within their maximum elongations from the Sun.
  const auto mercury = eph.position(Planet::Mercury, j2000, observer);
  const auto venus = eph.position(Planet::Venus, j2000, observer);
  if (mercury.status != Status::Ok || venus.status != Status::Ok ||
      core::angular_separation_deg(mercury.position.longitude_deg, sun.position.longitude_deg) > 28.5 ||
      core::angular_separation_deg(venus.position.longitude_deg, sun.position.longitude_deg) > 47.5) {
    spdlog::error("inner planet elongation out of range");
    return 7;
  }

  for (const Planet p : {Planet::Mars, Planet::Jupiter, Planet::Saturn}) {
    const auto s = eph.position(p, j2000, observer);
    if (s.status != Status::Ok || !(s.position.longitude_deg >= 0.0 && s.position.longitude_deg < 360.0) ||
        !(s.position.distance_au > 0.3)) {
      spdlog::error("{} evaluation invalid", core::planet_name(p));
      return 8;
    }
  }
  // Jupiter near 25 Aries, Saturn near 10 Taurus at J2000.
  if (core::angular_separation_deg(eph.position(Planet::Jupiter, j2000, observer).position.longitude_deg, 25.2) > 2.0 ||
      core::angular_separation_deg(eph.position(Planet::Saturn, j2000, observer).position.longitude_deg, 40.4) > 2.0) {
    spdlog::error("outer planet longitude off");
    return 9;
  }

  const auto rahu = eph.position(Planet::Rahu, j2000, observer);
  if (rahu.status != Status::Ok || std::abs(rahu.position.longitude_deg - 125.0445) > 1e-3 || !rahu.position.retrograde) {
    spdlog::error("mean node wrong: {}", rahu.position.longitude_deg);
    return 10;
  }
  if (!(ephemeris::mean_ascending_node_rate_deg_per_day(j2000.jd_tt) < 0.0)) {
    spdlog::error("mean node should regress");
    return 11;
  }

  if (eph.position(Planet::Ketu, j2000, observer).status != Status::InvalidInput) {
    spdlog::error("ketu should be rejected by the ephemeris");
    return 12;
  }

  core::Instant ancient = j2000;
  ancient.jd_ut = ancient.jd_tt = ancient.jd_tdb = 2000000.5;
  if (eph.position(Planet::Sun, ancient, observer).status != Status::DataUnavailable) {
    spdlog::error("out-of-window date should be unavailable");
    return 13;
  }

  core::Instant broken = j2000;
  broken.jd_tdb = broken.jd_tt = std::nan("");
  if (eph.position(Planet::Sun, broken, observer).status == Status::Ok) {
    spdlog::error("non-finite instant accepted");
    return 14;
  }

  return 0;
}
