/**
 * @file types.hpp
 * @brief Core domain types for astrochart.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace astrochart::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, NotImplemented, DataUnavailable, NumericalError };

/**
 * @brief Bodies tracked by a chart, in canonical order.
 *
 * Rahu/Ketu are the ascending/descending lunar nodes.
 */
enum class Planet : std::uint8_t { Sun, Moon, Mercury, Venus, Mars, Jupiter, Saturn, Rahu, Ketu };

inline constexpr int kPlanetCount = 9;
inline constexpr int kClassicalPlanetCount = 7;

/**
 * @brief Tropical zodiac signs starting at 0 deg Aries.
 */
enum class ZodiacSign : std::uint8_t {
  Aries,
  Taurus,
  Gemini,
  Cancer,
  Leo,
  Virgo,
  Libra,
  Scorpio,
  Sagittarius,
  Capricorn,
  Aquarius,
  Pisces
};

/**
 * @brief Non-fatal degradation reported next to a result.
 */
enum class WarningCode : std::uint8_t { LocationNotFound, EphemerisUnavailable, HouseSystemFallback, RulesFileIgnored };

struct Warning {
  WarningCode code{WarningCode::LocationNotFound};
  std::optional<Planet> planet{};
  std::string message{};
};

/**
 * @brief Geographic coordinate in decimal degrees (north/east positive).
 */
struct GeoCoordinate {
  double latitude_deg{};
  double longitude_deg{};
};

[[nodiscard]] inline bool is_valid(const GeoCoordinate& c) {
  return c.latitude_deg >= -90.0 && c.latitude_deg <= 90.0 && c.longitude_deg >= -180.0 && c.longitude_deg <= 180.0;
}

/**
 * @brief Proleptic Gregorian civil date-time at the birth place.
 */
struct CivilDateTime {
  int year{2000};
  int month{1};
  int day{1};
  int hour{};
  int minute{};
  double second{};
};

/**
 * @brief Time instant in the scales used by ephemeris and sidereal-time evaluation.
 */
struct Instant {
  double jd_ut{};
  double jd_tt{};
  double jd_tdb{};
};

/**
 * @brief Geocentric ecliptic position of one body at an instant.
 *
 * `fallback` marks a placeholder substituted for a failed ephemeris evaluation.
 */
struct CelestialPosition {
  Planet planet{Planet::Sun};
  double longitude_deg{};
  double latitude_deg{};
  double distance_au{};
  double speed_deg_per_day{};
  bool retrograde{};
  bool fallback{};
};

/**
 * @brief Sign view of an ecliptic longitude.
 */
struct ZodiacPlacement {
  ZodiacSign sign{ZodiacSign::Aries};
  int sign_index{};
  double degree_in_sign{};
};

}  // namespace astrochart::core
