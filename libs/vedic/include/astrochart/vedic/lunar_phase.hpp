/**
 * @file lunar_phase.hpp
 * @brief Lunar phase, tithi and paksha from the Sun-Moon elongation.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace astrochart::vedic {

enum class Paksha : std::uint8_t { Shukla, Krishna };

struct LunarPhase {
  double elongation_deg{};
  std::string_view phase_name{};
  double illumination{};
  /// Mean age since new moon, days.
  double age_days{};
  int tithi{1};
  Paksha paksha{Paksha::Shukla};
};

/**
 * @brief Phase for tropical Sun and Moon longitudes.
 *
 * Phase names use 45 deg bins centred on the principal phases; tithi = floor(e / 12) + 1.
 */
[[nodiscard]] LunarPhase lunar_phase(double sun_longitude_deg, double moon_longitude_deg);

[[nodiscard]] std::string_view to_string(Paksha paksha);

}  // namespace astrochart::vedic
