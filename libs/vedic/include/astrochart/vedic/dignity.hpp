/**
 * @file dignity.hpp
 * @brief Planetary dignity classification and house strength.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "astrochart/chart/chart_builder.hpp"
#include "astrochart/core/types.hpp"
#include "astrochart/vedic/rules.hpp"

namespace astrochart::vedic {

/**
 * @brief Dignity classes in priority order.
 */
enum class Dignity : std::uint8_t { Exalted, Debilitated, Own, Friendly, Enemy, Neutral };

struct DignityAssessment {
  astrochart::core::Planet planet{astrochart::core::Planet::Sun};
  astrochart::core::ZodiacSign sign{astrochart::core::ZodiacSign::Aries};
  Dignity dignity{Dignity::Neutral};
};

enum class HouseStrength : std::uint8_t { Strong, Moderate, Weak };

/**
 * @brief Classify one classical planet in a sign; nodes are always Neutral.
 */
[[nodiscard]] Dignity classify_dignity(astrochart::core::Planet planet, astrochart::core::ZodiacSign sign,
                                       const RulesTable& rules);

/**
 * @brief Dignity of each computed classical planet in chart order; placeholders are left out.
 */
[[nodiscard]] std::vector<DignityAssessment> assess_dignities(const astrochart::chart::BirthChart& chart,
                                                              const RulesTable& rules);

[[nodiscard]] bool is_benefic(astrochart::core::Planet planet);

/**
 * @brief Strength of each house from its benefic occupants (Jupiter, Venus, Moon): two or more
 * Strong, one Moderate, none Weak. Indexed by house number - 1.
 */
[[nodiscard]] std::array<HouseStrength, 12> house_strengths(const astrochart::chart::BirthChart& chart);

[[nodiscard]] std::string_view to_string(Dignity dignity);
[[nodiscard]] std::string_view to_string(HouseStrength strength);

}  // namespace astrochart::vedic
