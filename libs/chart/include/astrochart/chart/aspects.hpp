/**
 * @file aspects.hpp
 * @brief Angular aspects between the classical bodies.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "astrochart/core/types.hpp"

namespace astrochart::chart {

enum class AspectType : std::uint8_t { Conjunction, Sextile, Square, Trine, Opposition };

enum class AspectStrength : std::uint8_t { VeryStrong, Strong, Moderate, Weak };

struct AspectRule {
  AspectType type{AspectType::Conjunction};
  double angle_deg{};
  double orb_deg{};
};

/**
 * @brief Target angles and orbs, evaluated in order; the first rule within orb wins.
 */
struct AspectConfig {
  std::array<AspectRule, 5> rules{{
      {AspectType::Conjunction, 0.0, 10.0},
      {AspectType::Sextile, 60.0, 6.0},
      {AspectType::Square, 90.0, 8.0},
      {AspectType::Trine, 120.0, 8.0},
      {AspectType::Opposition, 180.0, 10.0},
  }};
};

/**
 * @brief Aspect between two bodies, `first` before `second` in enum order.
 *
 * `orb_deg` is the distance of the separation from the exact aspect angle.
 */
struct Aspect {
  astrochart::core::Planet first{astrochart::core::Planet::Sun};
  astrochart::core::Planet second{astrochart::core::Planet::Moon};
  AspectType type{AspectType::Conjunction};
  double separation_deg{};
  double orb_deg{};
  AspectStrength strength{AspectStrength::Weak};
};

[[nodiscard]] AspectStrength strength_for_orb(double orb_deg);

/**
 * @brief Aspect between two positions, if any; argument order does not matter.
 */
[[nodiscard]] std::optional<Aspect> detect_pair(const astrochart::core::CelestialPosition& a,
                                                const astrochart::core::CelestialPosition& b,
                                                const AspectConfig& config = AspectConfig{});

/**
 * @brief All aspects among the classical bodies present in `positions`.
 *
 * Nodes and placeholder (`fallback`) positions take no part.
 *
 * Pairs are visited in canonical order, so the output does not depend on the input order.
 */
[[nodiscard]] std::vector<Aspect> detect_aspects(const std::vector<astrochart::core::CelestialPosition>& positions,
                                                 const AspectConfig& config = AspectConfig{});

[[nodiscard]] std::string_view to_string(AspectType type);
[[nodiscard]] std::string_view to_string(AspectStrength strength);

}  // namespace astrochart::chart
