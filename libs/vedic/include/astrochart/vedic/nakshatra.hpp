/**
 * @file nakshatra.hpp
 * @brief Lunar mansion (nakshatra) and pada lookup.
 * @author Watosn
 */
#pragma once

#include <string_view>

#include "astrochart/core/types.hpp"
#include "astrochart/vedic/rules.hpp"

namespace astrochart::vedic {

struct Nakshatra {
  int index{};
  std::string_view name{};
  int pada{1};
  astrochart::core::Planet lord{astrochart::core::Planet::Ketu};
  /// Fraction of the mansion already traversed, in [0, 1).
  double fraction_elapsed{};
};

/**
 * @brief Nakshatra of a longitude (normalized first); index in [0, 26], pada in [1, 4].
 */
[[nodiscard]] Nakshatra nakshatra_for(double longitude_deg, const RulesTable& rules);

}  // namespace astrochart::vedic
