/**
 * @file chart_builder.hpp
 * @brief Birth chart construction: body positions, houses, occupancy and lordship.
 * @author Watosn
 */
#pragma once

#include <array>
#include <vector>

#include "astrochart/chart/house_system.hpp"
#include "astrochart/core/interfaces.hpp"
#include "astrochart/core/types.hpp"
#include "astrochart/core/zodiac.hpp"

namespace astrochart::chart {

/**
 * @brief One body in the chart.
 */
struct PlanetPlacement {
  astrochart::core::CelestialPosition position{};
  astrochart::core::ZodiacPlacement zodiac{};
  int house{1};
};

/**
 * @brief One house: cusp, sign on the cusp, its lord and the bodies inside.
 */
struct HousePlacement {
  int number{1};
  double cusp_deg{};
  astrochart::core::ZodiacPlacement zodiac{};
  astrochart::core::Planet lord{astrochart::core::Planet::Mars};
  std::vector<astrochart::core::Planet> occupants{};
};

/**
 * @brief Fully shaped chart; bodies are indexed by `Planet`, houses by number - 1.
 */
struct BirthChart {
  astrochart::core::Instant instant{};
  astrochart::core::GeoCoordinate coordinate{};
  HouseSystem house_system{HouseSystem::Placidus};
  double ascendant_deg{};
  double midheaven_deg{};
  double sidereal_time_deg{};
  double obliquity_deg{};
  std::array<PlanetPlacement, astrochart::core::kPlanetCount> planets{};
  std::array<HousePlacement, 12> houses{};

  [[nodiscard]] const PlanetPlacement& planet(astrochart::core::Planet p) const {
    return planets[static_cast<std::size_t>(p)];
  }
  [[nodiscard]] const HousePlacement& house(int number) const {
    return houses[static_cast<std::size_t>((number - 1 + 12) % 12)];
  }
  [[nodiscard]] std::vector<astrochart::core::CelestialPosition> positions() const;
};

/**
 * @brief Chart plus the non-fatal degradations met while building it.
 */
struct ChartResult {
  astrochart::core::Status status{astrochart::core::Status::Ok};
  BirthChart chart{};
  std::vector<astrochart::core::Warning> warnings{};
};

/**
 * @brief Builds charts from an ephemeris provider.
 *
 * A failed ephemeris evaluation never aborts the build: the body is placed at 0 deg Aries with
 * `fallback` set and an EphemerisUnavailable warning is recorded. A failed Rahu also leaves Ketu
 * as a placeholder (0 deg Libra), which gets its own warning.
 */
class ChartBuilder {
 public:
  struct Config {
    HouseSystem house_system{HouseSystem::Placidus};
    astrochart::core::SignLords sign_lords{astrochart::core::kDefaultSignLords};
  };

  explicit ChartBuilder(const astrochart::core::IEphemeris& ephemeris);
  ChartBuilder(const astrochart::core::IEphemeris& ephemeris, Config config);

  /**
   * @brief Build a chart.
   * @return status InvalidInput for an out-of-range coordinate; otherwise Ok with a complete chart.
   */
  [[nodiscard]] ChartResult build(const astrochart::core::Instant& instant,
                                  const astrochart::core::GeoCoordinate& coordinate) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  const astrochart::core::IEphemeris& ephemeris_;
  Config config_{};
};

/**
 * @brief Placeholder substituted for a body whose position could not be computed.
 */
[[nodiscard]] astrochart::core::CelestialPosition fallback_position(astrochart::core::Planet body);

/**
 * @brief Descending node opposite a Rahu position.
 */
[[nodiscard]] astrochart::core::CelestialPosition ketu_from_rahu(const astrochart::core::CelestialPosition& rahu);

}  // namespace astrochart::chart
