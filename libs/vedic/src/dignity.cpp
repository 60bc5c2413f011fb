/**
 * @file dignity.cpp
 * @brief Dignity and house strength implementation.
 * @author Watosn
 */

#include "astrochart/vedic/dignity.hpp"

#include <algorithm>

#include "astrochart/core/zodiac.hpp"

namespace astrochart::vedic {
namespace {

bool contains(const std::vector<astrochart::core::ZodiacSign>& signs, astrochart::core::ZodiacSign sign) {
  return std::find(signs.begin(), signs.end(), sign) != signs.end();
}

}  // namespace

Dignity classify_dignity(astrochart::core::Planet planet, astrochart::core::ZodiacSign sign, const RulesTable& rules) {
  if (!astrochart::core::is_classical(planet)) {
    return Dignity::Neutral;
  }
  const DignityRule& rule = rules.dignity_for(planet);
  if (rule.exaltation == sign) {
    return Dignity::Exalted;
  }
  if (rule.debilitation == sign) {
    return Dignity::Debilitated;
  }
  if (contains(rule.own, sign)) {
    return Dignity::Own;
  }
  if (contains(rule.friendly, sign)) {
    return Dignity::Friendly;
  }
  if (contains(rule.enemy, sign)) {
    return Dignity::Enemy;
  }
  return Dignity::Neutral;
}

std::vector<DignityAssessment> assess_dignities(const astrochart::chart::BirthChart& chart, const RulesTable& rules) {
  std::vector<DignityAssessment> out;
  out.reserve(astrochart::core::kClassicalPlanets.size());
  for (const auto planet : astrochart::core::kClassicalPlanets) {
    if (chart.planet(planet).position.fallback) {
      continue;
    }
    const auto sign = chart.planet(planet).zodiac.sign;
    out.push_back(DignityAssessment{.planet = planet, .sign = sign, .dignity = classify_dignity(planet, sign, rules)});
  }
  return out;
}

bool is_benefic(astrochart::core::Planet planet) {
  return planet == astrochart::core::Planet::Jupiter || planet == astrochart::core::Planet::Venus ||
         planet == astrochart::core::Planet::Moon;
}

std::array<HouseStrength, 12> house_strengths(const astrochart::chart::BirthChart& chart) {
  std::array<HouseStrength, 12> out{};
  for (const auto& house : chart.houses) {
    const auto benefics = std::count_if(house.occupants.begin(), house.occupants.end(), [&chart](auto p) {
      return is_benefic(p) && !chart.planet(p).position.fallback;
    });
    HouseStrength s = HouseStrength::Weak;
    if (benefics >= 2) {
      s = HouseStrength::Strong;
    } else if (benefics == 1) {
      s = HouseStrength::Moderate;
    }
    out[static_cast<std::size_t>(house.number - 1)] = s;
  }
  return out;
}

std::string_view to_string(Dignity dignity) {
  switch (dignity) {
    case Dignity::Exalted:
      return "exalted";
    case Dignity::Debilitated:
      return "debilitated";
    case Dignity::Own:
      return "own";
    case Dignity::Friendly:
      return "friendly";
    case Dignity::Enemy:
      return "enemy";
    case Dignity::Neutral:
      return "neutral";
  }
  return "unknown";
}

std::string_view to_string(HouseStrength strength) {
  switch (strength) {
    case HouseStrength::Strong:
      return "strong";
    case HouseStrength::Moderate:
      return "moderate";
    case HouseStrength::Weak:
      return "weak";
  }
  return "unknown";
}

}  // namespace astrochart::vedic
