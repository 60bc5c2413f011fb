/**
 * @file yogas.cpp
 * @brief Yoga detection implementation.
 * @author Watosn
 */

#include "astrochart/vedic/yogas.hpp"

#include "astrochart/core/angles.hpp"

namespace astrochart::vedic {
namespace {

using astrochart::core::Planet;

int house_distance(int from_house, int to_house) { return ((to_house - from_house) % 12 + 12) % 12; }

bool computed(const astrochart::chart::BirthChart& chart, Planet p) { return !chart.planet(p).position.fallback; }

double separation(const astrochart::chart::BirthChart& chart, Planet a, Planet b) {
  return astrochart::core::angular_separation_deg(chart.planet(a).position.longitude_deg,
                                                  chart.planet(b).position.longitude_deg);
}

}  // namespace

std::vector<Yoga> detect_yogas(const astrochart::chart::BirthChart& chart, const YogaConfig& config) {
  std::vector<Yoga> out;

  const int kendra = house_distance(chart.planet(Planet::Moon).house, chart.planet(Planet::Jupiter).house);
  if (computed(chart, Planet::Moon) && computed(chart, Planet::Jupiter) && kendra % 3 == 0) {
    out.push_back(Yoga{.name = "Gajakesari",
                       .description = "Jupiter in a kendra from the Moon: wisdom, prosperity, good reputation",
                       .strength = YogaStrength::Strong});
  }

  const double mercury_sun = separation(chart, Planet::Mercury, Planet::Sun);
  if (computed(chart, Planet::Mercury) && computed(chart, Planet::Sun) && mercury_sun < config.budh_aditya_max_deg) {
    out.push_back(Yoga{.name = "Budh-Aditya",
                       .description = "Mercury conjunct the Sun: intelligence, communication skills",
                       .strength = mercury_sun < config.budh_aditya_strong_deg ? YogaStrength::Strong
                                                                               : YogaStrength::Moderate});
  }

  const double saturn_moon = separation(chart, Planet::Saturn, Planet::Moon);
  if (computed(chart, Planet::Saturn) && computed(chart, Planet::Moon) && saturn_moon < config.shasha_max_deg) {
    out.push_back(Yoga{.name = "Shasha",
                       .description = "Saturn close to the Moon: discipline, endurance, authority",
                       .strength = saturn_moon < config.shasha_strong_deg ? YogaStrength::Strong
                                                                          : YogaStrength::Moderate});
  }

  const Planet ninth_lord = chart.house(9).lord;
  const Planet tenth_lord = chart.house(10).lord;
  if (computed(chart, ninth_lord) && computed(chart, tenth_lord) &&
      chart.planet(ninth_lord).house == chart.planet(tenth_lord).house) {
    out.push_back(Yoga{.name = "Dharma-Karmadhipati",
                       .description = "Lords of the 9th and 10th houses together: success, recognition, purpose",
                       .strength = YogaStrength::Strong});
  }

  return out;
}

std::string_view to_string(YogaStrength strength) {
  switch (strength) {
    case YogaStrength::Strong:
      return "strong";
    case YogaStrength::Moderate:
      return "moderate";
  }
  return "unknown";
}

}  // namespace astrochart::vedic
