/**
 * @file jpl_ephemeris_adapter.cpp
 * @brief JPL ephemeris adapter implementation.
 * @author Watosn
 */

#include "astrochart/adapters/jpl_ephemeris_adapter.hpp"

#include <array>
#include <cmath>
#include <optional>
#include <utility>

#include <Eigen/Dense>

#include "astrochart/core/constants.hpp"
#include "astrochart/ephemeris/frames.hpp"
#include "astrochart/ephemeris/lunar_nodes.hpp"
#include "jpl_eph/jpl_eph.hpp"

namespace astrochart::adapters {
namespace {

using astrochart::core::Planet;
using astrochart::core::Status;

astrochart::core::Status map_jpl_error(const jpl::eph::Status& s) {
  switch (s.code) {
    case jpl::eph::ErrorCode::kInvalidArgument:
      return Status::InvalidInput;
    case jpl::eph::ErrorCode::kIo:
    case jpl::eph::ErrorCode::kCorruptFile:
    case jpl::eph::ErrorCode::kOutOfRange:
    case jpl::eph::ErrorCode::kUnsupported:
      return Status::DataUnavailable;
    case jpl::eph::ErrorCode::kOk:
    default:
      return Status::NumericalError;
  }
}

std::optional<jpl::eph::Body> to_jpl_body(Planet body) {
  switch (body) {
    case Planet::Sun:
      return jpl::eph::Body::Sun;
    case Planet::Moon:
      return jpl::eph::Body::Moon;
    case Planet::Mercury:
      return jpl::eph::Body::Mercury;
    case Planet::Venus:
      return jpl::eph::Body::Venus;
    case Planet::Mars:
      return jpl::eph::Body::Mars;
    case Planet::Jupiter:
      return jpl::eph::Body::Jupiter;
    case Planet::Saturn:
      return jpl::eph::Body::Saturn;
    default:
      return std::nullopt;
  }
}

jpl::eph::Workspace& thread_local_workspace() {
  thread_local jpl::eph::Workspace workspace{};
  return workspace;
}

}  // namespace

JplEphemerisAdapter::JplEphemerisAdapter(Config config) : config_(std::move(config)) {}

std::unique_ptr<JplEphemerisAdapter> JplEphemerisAdapter::Create(const Config& config) {
  auto out = std::unique_ptr<JplEphemerisAdapter>(new JplEphemerisAdapter(config));
  auto opened = jpl::eph::Ephemeris::Open(config.ephemeris_file.string());
  if (!opened.has_value()) {
    return out;
  }
  out->ephemeris_ = opened.value();
  return out;
}

astrochart::core::EphemerisSample JplEphemerisAdapter::position(Planet body, const astrochart::core::Instant& instant,
                                                                const astrochart::core::GeoCoordinate& /*observer*/) const {
  astrochart::core::EphemerisSample out{};
  out.position.planet = body;

  if (body == Planet::Ketu) {
    out.status = Status::InvalidInput;
    return out;
  }
  if (!ephemeris_) {
    out.status = Status::DataUnavailable;
    return out;
  }
  if (body == Planet::Rahu) {
    out.position = astrochart::ephemeris::mean_node_position(instant);
    return out;
  }

  const auto target = to_jpl_body(body);
  if (!target.has_value()) {
    out.status = Status::InvalidInput;
    return out;
  }
  auto& workspace = thread_local_workspace();
  const auto pv = ephemeris_->PlephSi(instant.jd_tdb, *target, jpl::eph::Body::Earth, true, workspace);
  if (!pv.has_value()) {
    out.status = map_jpl_error(pv.error());
    return out;
  }

  // ICRF [m, m/s] -> J2000 ecliptic [AU, AU/day].
  const std::array<double, 6>& s = pv.value().pv;
  const double au = astrochart::core::constants::kAstronomicalUnitM;
  const double au_per_day = au / astrochart::core::constants::kSecondsPerDay;
  const Eigen::Matrix3d rot = astrochart::ephemeris::ecliptic_from_equatorial_j2000();
  const Eigen::Vector3d r_ecl = rot * Eigen::Vector3d(s[0], s[1], s[2]) / au;
  const Eigen::Vector3d v_ecl = rot * Eigen::Vector3d(s[3], s[4], s[5]) / au_per_day;

  const auto state = astrochart::ephemeris::precess_to_date(astrochart::ephemeris::ecliptic_state(r_ecl, v_ecl), instant.jd_tt);
  if (!std::isfinite(state.longitude_deg) || !std::isfinite(state.longitude_rate_deg_per_day)) {
    out.status = Status::NumericalError;
    return out;
  }

  out.position.longitude_deg = state.longitude_deg;
  out.position.latitude_deg = state.latitude_deg;
  out.position.distance_au = state.distance_au;
  out.position.speed_deg_per_day = state.longitude_rate_deg_per_day;
  out.position.retrograde = state.longitude_rate_deg_per_day < 0.0;
  out.status = Status::Ok;
  return out;
}

}  // namespace astrochart::adapters
