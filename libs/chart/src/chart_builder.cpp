/**
 * @file chart_builder.cpp
 * @brief Chart builder implementation.
 * @author Watosn
 */

#include "astrochart/chart/chart_builder.hpp"

#include <string>

#include <fmt/format.h>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/time_scales.hpp"

namespace astrochart::chart {
namespace {

using astrochart::core::Planet;
using astrochart::core::Status;

constexpr std::array<Planet, 8> kEphemerisBodies{Planet::Sun,   Planet::Moon,    Planet::Mercury, Planet::Venus,
                                                 Planet::Mars,  Planet::Jupiter, Planet::Saturn,  Planet::Rahu};

}  // namespace

std::vector<astrochart::core::CelestialPosition> BirthChart::positions() const {
  std::vector<astrochart::core::CelestialPosition> out;
  out.reserve(planets.size());
  for (const auto& p : planets) {
    out.push_back(p.position);
  }
  return out;
}

astrochart::core::CelestialPosition fallback_position(Planet body) {
  return astrochart::core::CelestialPosition{
      .planet = body,
      .longitude_deg = 0.0,
      .latitude_deg = 0.0,
      .distance_au = 0.0,
      .speed_deg_per_day = 0.0,
      .retrograde = false,
      .fallback = true,
  };
}

astrochart::core::CelestialPosition ketu_from_rahu(const astrochart::core::CelestialPosition& rahu) {
  astrochart::core::CelestialPosition ketu = rahu;
  ketu.planet = Planet::Ketu;
  ketu.longitude_deg = astrochart::core::normalize_deg(rahu.longitude_deg + 180.0);
  ketu.latitude_deg = -rahu.latitude_deg;
  return ketu;
}

ChartBuilder::ChartBuilder(const astrochart::core::IEphemeris& ephemeris) : ChartBuilder(ephemeris, Config{}) {}

ChartBuilder::ChartBuilder(const astrochart::core::IEphemeris& ephemeris, Config config)
    : ephemeris_(ephemeris), config_(config) {}

ChartResult ChartBuilder::build(const astrochart::core::Instant& instant,
                                const astrochart::core::GeoCoordinate& coordinate) const {
  ChartResult out{};
  if (!astrochart::core::is_valid(coordinate)) {
    out.status = Status::InvalidInput;
    return out;
  }
  BirthChart& chart = out.chart;
  chart.instant = instant;
  chart.coordinate = coordinate;

  for (const Planet body : kEphemerisBodies) {
    const auto sample = ephemeris_.position(body, instant, coordinate);
    auto& slot = chart.planets[static_cast<std::size_t>(body)];
    if (sample.status == Status::Ok) {
      slot.position = sample.position;
      slot.position.longitude_deg = astrochart::core::normalize_deg(slot.position.longitude_deg);
      continue;
    }
    slot.position = fallback_position(body);
    out.warnings.push_back(astrochart::core::Warning{
        .code = astrochart::core::WarningCode::EphemerisUnavailable,
        .planet = body,
        .message = fmt::format("{} position unavailable ({}); placed at 0 Aries", astrochart::core::planet_name(body),
                               astrochart::core::to_string(sample.status)),
    });
  }
  auto& ketu = chart.planets[static_cast<std::size_t>(Planet::Ketu)].position;
  ketu = ketu_from_rahu(chart.planets[static_cast<std::size_t>(Planet::Rahu)].position);
  if (ketu.fallback) {
    out.warnings.push_back(astrochart::core::Warning{
        .code = astrochart::core::WarningCode::EphemerisUnavailable,
        .planet = Planet::Ketu,
        .message = "Ketu derived from an unavailable Rahu; placed at 0 Libra",
    });
  }

  chart.sidereal_time_deg = astrochart::core::local_sidereal_time_deg(instant.jd_ut, coordinate.longitude_deg);
  chart.obliquity_deg = astrochart::core::mean_obliquity_deg(instant.jd_tt);
  const HouseCusps cusps =
      compute_house_cusps(config_.house_system, chart.sidereal_time_deg, chart.obliquity_deg, coordinate.latitude_deg);
  if (cusps.status != Status::Ok) {
    out.status = cusps.status;
    return out;
  }
  if (cusps.fallback) {
    out.warnings.push_back(astrochart::core::Warning{
        .code = astrochart::core::WarningCode::HouseSystemFallback,
        .planet = std::nullopt,
        .message = fmt::format("{} houses undefined at latitude {:.4f}; {} used", to_string(config_.house_system),
                               coordinate.latitude_deg, to_string(cusps.system)),
    });
  }
  chart.house_system = cusps.system;
  chart.ascendant_deg = cusps.ascendant_deg;
  chart.midheaven_deg = cusps.midheaven_deg;

  for (int i = 0; i < 12; ++i) {
    auto& house = chart.houses[static_cast<std::size_t>(i)];
    house.number = i + 1;
    house.cusp_deg = cusps.cusps_deg[static_cast<std::size_t>(i)];
    house.zodiac = astrochart::core::zodiac_placement(house.cusp_deg);
    house.lord = config_.sign_lords[static_cast<std::size_t>(house.zodiac.sign_index)];
    house.occupants.clear();
  }

  for (const Planet body : astrochart::core::kAllPlanets) {
    auto& slot = chart.planets[static_cast<std::size_t>(body)];
    slot.zodiac = astrochart::core::zodiac_placement(slot.position.longitude_deg);
    slot.house = house_of(cusps.cusps_deg, slot.position.longitude_deg);
    chart.houses[static_cast<std::size_t>(slot.house - 1)].occupants.push_back(body);
  }

  out.status = Status::Ok;
  return out;
}

}  // namespace astrochart::chart
