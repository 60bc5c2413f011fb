/**
 * @file aspects.cpp
 * @brief Aspect detection implementation.
 * @author Watosn
 */

#include "astrochart/chart/aspects.hpp"

#include <cmath>
#include <utility>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/zodiac.hpp"

namespace astrochart::chart {

AspectStrength strength_for_orb(double orb_deg) {
  if (orb_deg <= 2.0) {
    return AspectStrength::VeryStrong;
  }
  if (orb_deg <= 5.0) {
    return AspectStrength::Strong;
  }
  if (orb_deg <= 8.0) {
    return AspectStrength::Moderate;
  }
  return AspectStrength::Weak;
}

std::optional<Aspect> detect_pair(const astrochart::core::CelestialPosition& a,
                                  const astrochart::core::CelestialPosition& b, const AspectConfig& config) {
  if (a.planet == b.planet) {
    return std::nullopt;
  }
  const auto& lo = (a.planet < b.planet) ? a : b;
  const auto& hi = (a.planet < b.planet) ? b : a;
  const double separation = astrochart::core::angular_separation_deg(lo.longitude_deg, hi.longitude_deg);

  for (const auto& rule : config.rules) {
    const double orb = std::abs(separation - rule.angle_deg);
    if (orb <= rule.orb_deg) {
      return Aspect{
          .first = lo.planet,
          .second = hi.planet,
          .type = rule.type,
          .separation_deg = separation,
          .orb_deg = orb,
          .strength = strength_for_orb(orb),
      };
    }
  }
  return std::nullopt;
}

std::vector<Aspect> detect_aspects(const std::vector<astrochart::core::CelestialPosition>& positions,
                                   const AspectConfig& config) {
  std::array<const astrochart::core::CelestialPosition*, astrochart::core::kClassicalPlanetCount> by_planet{};
  for (const auto& p : positions) {
    if (astrochart::core::is_classical(p.planet) && !p.fallback) {
      by_planet[static_cast<std::size_t>(p.planet)] = &p;
    }
  }

  std::vector<Aspect> out;
  for (std::size_t i = 0; i < by_planet.size(); ++i) {
    if (by_planet[i] == nullptr) {
      continue;
    }
    for (std::size_t j = i + 1; j < by_planet.size(); ++j) {
      if (by_planet[j] == nullptr) {
        continue;
      }
      if (auto aspect = detect_pair(*by_planet[i], *by_planet[j], config)) {
        out.push_back(std::move(*aspect));
      }
    }
  }
  return out;
}

std::string_view to_string(AspectType type) {
  switch (type) {
    case AspectType::Conjunction:
      return "conjunction";
    case AspectType::Sextile:
      return "sextile";
    case AspectType::Square:
      return "square";
    case AspectType::Trine:
      return "trine";
    case AspectType::Opposition:
      return "opposition";
  }
  return "unknown";
}

std::string_view to_string(AspectStrength strength) {
  switch (strength) {
    case AspectStrength::VeryStrong:
      return "very_strong";
    case AspectStrength::Strong:
      return "strong";
    case AspectStrength::Moderate:
      return "moderate";
    case AspectStrength::Weak:
      return "weak";
  }
  return "unknown";
}

}  // namespace astrochart::chart
