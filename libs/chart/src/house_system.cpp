/**
 * @file house_system.cpp
 * @brief House cusp computation implementation.
 * @author Watosn
 */

#include "astrochart/chart/house_system.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/zodiac.hpp"
#include "astrochart/ephemeris/frames.hpp"

namespace astrochart::chart {
namespace {

using astrochart::core::atan2_deg;
using astrochart::core::cos_deg;
using astrochart::core::forward_arc_deg;
using astrochart::core::normalize_deg;
using astrochart::core::sin_deg;
using astrochart::core::tan_deg;

constexpr int kMaxIterations = 50;
constexpr double kConvergenceDeg = 1e-9;

// Ecliptic longitude of the point with the given right ascension.
double ecliptic_longitude_from_ra(double ra_deg, double obliquity_deg) {
  return atan2_deg(sin_deg(ra_deg), cos_deg(ra_deg) * cos_deg(obliquity_deg));
}

// Placidus intermediate cusp by fixed-point iteration on the semi-arc.
// Above the horizon the cusp sits `fraction` of the diurnal semi-arc east of the meridian;
// below it, `fraction` of the nocturnal semi-arc west of the lower meridian.
std::optional<double> placidus_cusp(double ramc_deg, double obliquity_deg, double latitude_deg, double fraction,
                                    bool above_horizon) {
  const double tan_phi = tan_deg(latitude_deg);
  const auto right_ascension = [&](double ad_deg) {
    return above_horizon ? ramc_deg + fraction * (90.0 + ad_deg) : ramc_deg + 180.0 - fraction * (90.0 - ad_deg);
  };

  double lon = ecliptic_longitude_from_ra(right_ascension(0.0), obliquity_deg);
  for (int iter = 0; iter < kMaxIterations; ++iter) {
    const double decl_rad = std::asin(sin_deg(obliquity_deg) * sin_deg(lon));
    const double x = tan_phi * std::tan(decl_rad);
    if (!(std::abs(x) < 1.0)) {
      return std::nullopt;
    }
    const double ad_deg = std::asin(x) * astrochart::core::constants::kRadToDeg;
    const double next = ecliptic_longitude_from_ra(right_ascension(ad_deg), obliquity_deg);
    const double delta = astrochart::ephemeris::wrapped_delta_deg(lon, next);
    lon = next;
    if (std::abs(delta) < kConvergenceDeg) {
      break;
    }
  }
  return lon;
}

void fill_opposites(HouseCusps& out) {
  for (int i = 3; i < 9; ++i) {
    out.cusps_deg[static_cast<std::size_t>(i)] = normalize_deg(out.cusps_deg[static_cast<std::size_t>(i + 6) % 12] + 180.0);
  }
}

void porphyry(HouseCusps& out) {
  const double asc = out.ascendant_deg;
  const double mc = out.midheaven_deg;
  const double upper = forward_arc_deg(mc, asc);
  const double lower = forward_arc_deg(asc, normalize_deg(mc + 180.0));
  out.cusps_deg[9] = mc;
  out.cusps_deg[10] = normalize_deg(mc + upper / 3.0);
  out.cusps_deg[11] = normalize_deg(mc + 2.0 * upper / 3.0);
  out.cusps_deg[0] = asc;
  out.cusps_deg[1] = normalize_deg(asc + lower / 3.0);
  out.cusps_deg[2] = normalize_deg(asc + 2.0 * lower / 3.0);
  fill_opposites(out);
}

bool placidus(HouseCusps& out, double ramc_deg, double obliquity_deg, double latitude_deg) {
  const auto c11 = placidus_cusp(ramc_deg, obliquity_deg, latitude_deg, 1.0 / 3.0, true);
  const auto c12 = placidus_cusp(ramc_deg, obliquity_deg, latitude_deg, 2.0 / 3.0, true);
  const auto c2 = placidus_cusp(ramc_deg, obliquity_deg, latitude_deg, 2.0 / 3.0, false);
  const auto c3 = placidus_cusp(ramc_deg, obliquity_deg, latitude_deg, 1.0 / 3.0, false);
  if (!c11 || !c12 || !c2 || !c3) {
    return false;
  }
  out.cusps_deg[9] = out.midheaven_deg;
  out.cusps_deg[10] = *c11;
  out.cusps_deg[11] = *c12;
  out.cusps_deg[0] = out.ascendant_deg;
  out.cusps_deg[1] = *c2;
  out.cusps_deg[2] = *c3;
  fill_opposites(out);
  return true;
}

void equal_from(HouseCusps& out, double first_cusp_deg) {
  for (int i = 0; i < 12; ++i) {
    out.cusps_deg[static_cast<std::size_t>(i)] = normalize_deg(first_cusp_deg + 30.0 * static_cast<double>(i));
  }
}

}  // namespace

double midheaven_deg(double ramc_deg, double obliquity_deg) {
  return ecliptic_longitude_from_ra(ramc_deg, obliquity_deg);
}

double ascendant_deg(double ramc_deg, double obliquity_deg, double latitude_deg) {
  const double y = cos_deg(ramc_deg);
  const double x = -(sin_deg(ramc_deg) * cos_deg(obliquity_deg) + tan_deg(latitude_deg) * sin_deg(obliquity_deg));
  double asc = atan2_deg(y, x);
  if (forward_arc_deg(midheaven_deg(ramc_deg, obliquity_deg), asc) > 180.0) {
    asc = normalize_deg(asc + 180.0);
  }
  return asc;
}

HouseCusps compute_house_cusps(HouseSystem system, double ramc_deg, double obliquity_deg, double latitude_deg) {
  HouseCusps out{};
  out.system = system;
  if (!std::isfinite(ramc_deg) || !std::isfinite(obliquity_deg) || !std::isfinite(latitude_deg) ||
      latitude_deg < -90.0 || latitude_deg > 90.0) {
    out.status = astrochart::core::Status::InvalidInput;
    return out;
  }
  // The poles have no defined horizon; nudge onto the nearest computable latitude.
  const double lat = std::clamp(latitude_deg, -89.999, 89.999);
  out.midheaven_deg = midheaven_deg(ramc_deg, obliquity_deg);
  out.ascendant_deg = ascendant_deg(ramc_deg, obliquity_deg, lat);

  switch (system) {
    case HouseSystem::Placidus:
      // Inside the polar circles some ecliptic degrees never rise or set.
      if (std::abs(lat) >= 90.0 - obliquity_deg || !placidus(out, ramc_deg, obliquity_deg, lat)) {
        out.system = HouseSystem::Porphyry;
        out.fallback = true;
        porphyry(out);
      }
      break;
    case HouseSystem::Porphyry:
      porphyry(out);
      break;
    case HouseSystem::Equal:
      equal_from(out, out.ascendant_deg);
      break;
    case HouseSystem::WholeSign:
      equal_from(out, static_cast<double>(astrochart::core::sign_index(out.ascendant_deg)) * 30.0);
      break;
  }
  return out;
}

int house_of(const std::array<double, 12>& cusps_deg, double longitude_deg) {
  // The containing arc starts at the cusp with the smallest forward distance to the longitude.
  int best = 0;
  double best_arc = 360.0;
  for (int i = 0; i < 12; ++i) {
    const double arc = forward_arc_deg(cusps_deg[static_cast<std::size_t>(i)], longitude_deg);
    if (arc < best_arc) {
      best_arc = arc;
      best = i;
    }
  }
  return best + 1;
}

std::string_view to_string(HouseSystem system) {
  switch (system) {
    case HouseSystem::Placidus:
      return "placidus";
    case HouseSystem::Porphyry:
      return "porphyry";
    case HouseSystem::Equal:
      return "equal";
    case HouseSystem::WholeSign:
      return "whole_sign";
  }
  return "unknown";
}

std::optional<HouseSystem> house_system_from_name(std::string_view name) {
  for (const auto s : {HouseSystem::Placidus, HouseSystem::Porphyry, HouseSystem::Equal, HouseSystem::WholeSign}) {
    if (astrochart::core::detail::iequals(to_string(s), name)) {
      return s;
    }
  }
  return std::nullopt;
}

}  // namespace astrochart::chart
