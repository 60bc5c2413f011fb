/**
 * @file yogas.hpp
 * @brief Yoga (planetary combination) detection.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "astrochart/chart/chart_builder.hpp"

namespace astrochart::vedic {

enum class YogaStrength : std::uint8_t { Strong, Moderate };

struct Yoga {
  std::string name{};
  std::string description{};
  YogaStrength strength{YogaStrength::Moderate};
};

/**
 * @brief Thresholds for the separation-based yogas, degrees.
 */
struct YogaConfig {
  double budh_aditya_max_deg{15.0};
  double budh_aditya_strong_deg{5.0};
  double shasha_max_deg{30.0};
  double shasha_strong_deg{10.0};
};

/**
 * @brief Evaluate every rule independently; the result may be empty.
 *
 * A rule involving a placeholder position never fires.
 *
 * Rules: Gajakesari (Jupiter in a kendra from the Moon), Budh-Aditya (Mercury close to the Sun),
 * Shasha (Saturn close to the Moon), Dharma-Karmadhipati (9th and 10th lords share a house).
 */
[[nodiscard]] std::vector<Yoga> detect_yogas(const astrochart::chart::BirthChart& chart,
                                             const YogaConfig& config = YogaConfig{});

[[nodiscard]] std::string_view to_string(YogaStrength strength);

}  // namespace astrochart::vedic
