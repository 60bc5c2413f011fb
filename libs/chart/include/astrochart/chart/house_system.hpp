/**
 * @file house_system.hpp
 * @brief House cusp computation (Placidus, Porphyry, Equal, Whole-sign).
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "astrochart/core/types.hpp"

namespace astrochart::chart {

enum class HouseSystem : std::uint8_t { Placidus, Porphyry, Equal, WholeSign };

/**
 * @brief Twelve cusps, cusp of house N at index N-1.
 *
 * `system` is the system actually used; `fallback` is set when Placidus was requested but
 * undefined at the latitude and Porphyry was substituted.
 */
struct HouseCusps {
  std::array<double, 12> cusps_deg{};
  double ascendant_deg{};
  double midheaven_deg{};
  HouseSystem system{HouseSystem::Placidus};
  bool fallback{false};
  astrochart::core::Status status{astrochart::core::Status::Ok};
};

/**
 * @brief Ecliptic longitude of the midheaven for a sidereal angle (RAMC) and obliquity.
 */
[[nodiscard]] double midheaven_deg(double ramc_deg, double obliquity_deg);

/**
 * @brief Ecliptic longitude of the ascendant; always lies within 180 deg after the midheaven.
 */
[[nodiscard]] double ascendant_deg(double ramc_deg, double obliquity_deg, double latitude_deg);

/**
 * @brief Compute house cusps.
 * @param system Requested system.
 * @param ramc_deg Local sidereal time (right ascension of the meridian).
 * @param obliquity_deg Obliquity of the ecliptic of date.
 * @param latitude_deg Geographic latitude.
 * @return Cusps; status InvalidInput for a latitude outside [-90, 90] or non-finite inputs.
 */
[[nodiscard]] HouseCusps compute_house_cusps(HouseSystem system, double ramc_deg, double obliquity_deg, double latitude_deg);

/**
 * @brief House number (1..12) whose arc [cusp_i, cusp_i+1) contains the longitude.
 */
[[nodiscard]] int house_of(const std::array<double, 12>& cusps_deg, double longitude_deg);

[[nodiscard]] std::string_view to_string(HouseSystem system);
[[nodiscard]] std::optional<HouseSystem> house_system_from_name(std::string_view name);

}  // namespace astrochart::chart
