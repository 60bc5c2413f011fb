/**
 * @file lunar_phase.cpp
 * @brief Lunar phase implementation.
 * @author Watosn
 */

#include "astrochart/vedic/lunar_phase.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "astrochart/core/angles.hpp"

namespace astrochart::vedic {
namespace {

constexpr double kSynodicMonthDays = 29.530588853;

constexpr std::array<std::string_view, 8> kPhaseNames{
    "New Moon", "Waxing Crescent", "First Quarter", "Waxing Gibbous",
    "Full Moon", "Waning Gibbous", "Last Quarter", "Waning Crescent",
};

}  // namespace

LunarPhase lunar_phase(double sun_longitude_deg, double moon_longitude_deg) {
  const double e = astrochart::core::forward_arc_deg(sun_longitude_deg, moon_longitude_deg);
  const int bin = static_cast<int>(std::floor(astrochart::core::normalize_deg(e + 22.5) / 45.0)) % 8;
  return LunarPhase{
      .elongation_deg = e,
      .phase_name = kPhaseNames[static_cast<std::size_t>(bin)],
      .illumination = 0.5 * (1.0 - astrochart::core::cos_deg(e)),
      .age_days = e / 360.0 * kSynodicMonthDays,
      .tithi = std::clamp(static_cast<int>(std::floor(e / 12.0)) + 1, 1, 30),
      .paksha = e < 180.0 ? Paksha::Shukla : Paksha::Krishna,
  };
}

std::string_view to_string(Paksha paksha) {
  switch (paksha) {
    case Paksha::Shukla:
      return "shukla";
    case Paksha::Krishna:
      return "krishna";
  }
  return "unknown";
}

}  // namespace astrochart::vedic
