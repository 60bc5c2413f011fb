/**
 * @file nakshatra.cpp
 * @brief Nakshatra lookup implementation.
 * @author Watosn
 */

#include "astrochart/vedic/nakshatra.hpp"

#include <algorithm>
#include <cmath>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/zodiac.hpp"

namespace astrochart::vedic {

Nakshatra nakshatra_for(double longitude_deg, const RulesTable& rules) {
  namespace constants = astrochart::core::constants;
  const double lon = astrochart::core::normalize_deg(longitude_deg);
  const int index = static_cast<int>(std::floor(lon / constants::kNakshatraSpanDeg)) % 27;
  const double within = std::max(0.0, lon - static_cast<double>(index) * constants::kNakshatraSpanDeg);
  const int pada = std::clamp(static_cast<int>(std::floor(within / constants::kPadaSpanDeg)) + 1, 1, 4);

  return Nakshatra{
      .index = index,
      .name = astrochart::core::kNakshatraNames[static_cast<std::size_t>(index)],
      .pada = pada,
      .lord = rules.nakshatra_lords[static_cast<std::size_t>(index)],
      .fraction_elapsed = std::clamp(within / constants::kNakshatraSpanDeg, 0.0, 1.0 - 1e-12),
  };
}

}  // namespace astrochart::vedic
