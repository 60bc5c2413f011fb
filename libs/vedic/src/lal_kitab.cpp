/**
 * @file lal_kitab.cpp
 * @brief Lal Kitab analysis implementation.
 * @author Watosn
 */

#include "astrochart/vedic/lal_kitab.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace astrochart::vedic {
namespace {

using astrochart::core::Planet;
using astrochart::core::ZodiacSign;

constexpr std::array<std::string_view, 3> kGeneralRemedies{
    "Keep a piece of silver with you",
    "Feed crows regularly",
    "Donate to the needy on Saturdays",
};

void add_unique(std::vector<std::string>& list, std::string_view item) {
  if (std::find(list.begin(), list.end(), item) == list.end()) {
    list.emplace_back(item);
  }
}

}  // namespace

bool is_manglik_house(int house) {
  return house == 1 || house == 2 || house == 4 || house == 7 || house == 8 || house == 12;
}

std::string_view planet_remedy(Planet planet) {
  switch (planet) {
    case Planet::Sun:
      return "Offer water to Sun every morning while chanting Surya mantras";
    case Planet::Moon:
      return "Offer milk and white flowers to Moon on Monday evenings";
    case Planet::Mercury:
      return "Feed green fodder to cows on Wednesdays";
    case Planet::Venus:
      return "Donate white clothes and curd on Fridays";
    case Planet::Mars:
      return "Donate red lentils and jaggery every Tuesday";
    case Planet::Jupiter:
      return "Apply saffron tilak and donate yellow items on Thursdays";
    case Planet::Saturn:
      return "Donate black sesame and mustard oil on Saturdays";
    default:
      return {};
  }
}

LalKitabAnalysis analyze_lal_kitab(const astrochart::chart::BirthChart& chart,
                                   const std::vector<DignityAssessment>& dignities) {
  LalKitabAnalysis out{};
  const auto& mars = chart.planet(Planet::Mars);
  out.mars_house = mars.position.fallback ? 0 : mars.house;
  if (is_manglik_house(out.mars_house)) {
    out.manglik = true;
    add_unique(out.remedies, "Donate red lentils and jaggery every Tuesday");
    add_unique(out.remedies, "Visit Hanuman temple every Tuesday and offer sindoor and oil");
  }

  const auto& sun = chart.planet(Planet::Sun);
  const auto& moon = chart.planet(Planet::Moon);
  if (!sun.position.fallback && sun.zodiac.sign == ZodiacSign::Libra) {
    out.debts.emplace_back("Pitru Rin (Ancestral debt)");
    add_unique(out.remedies, "Offer water to Sun daily");
  }
  if (!moon.position.fallback && moon.zodiac.sign == ZodiacSign::Scorpio) {
    out.debts.emplace_back("Matru Rin (Mother's debt)");
    add_unique(out.remedies, "Donate milk and rice");
  }

  for (const auto& d : dignities) {
    if (d.dignity == Dignity::Debilitated) {
      const auto remedy = planet_remedy(d.planet);
      if (!remedy.empty()) {
        add_unique(out.remedies, remedy);
      }
    }
  }

  for (const auto remedy : kGeneralRemedies) {
    add_unique(out.remedies, remedy);
  }
  return out;
}

}  // namespace astrochart::vedic
