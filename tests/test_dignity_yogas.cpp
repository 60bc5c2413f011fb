/**
 * @file test_dignity_yogas.cpp
 * @brief Dignity classes, house strength, yogas and Lal Kitab rules on hand-built charts.
 * @author Watosn
 */

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "astrochart/chart/aspects.hpp"
#include "astrochart/chart/chart_builder.hpp"
#include "astrochart/core/leap_seconds.hpp"
#include "astrochart/core/time_scales.hpp"
#include "astrochart/core/zodiac.hpp"
#include "astrochart/ephemeris/analytic_ephemeris.hpp"
#include "astrochart/vedic/dignity.hpp"
#include "astrochart/vedic/lal_kitab.hpp"
#include "astrochart/vedic/rules.hpp"
#include "astrochart/vedic/yogas.hpp"

namespace {

using astrochart::core::Planet;
using astrochart::core::ZodiacSign;

// Equal 30-degree houses from 0 Aries, each house lorded as its sign.
astrochart::chart::BirthChart aries_rising_chart() {
  astrochart::chart::BirthChart chart{};
  for (int i = 0; i < 12; ++i) {
    auto& h = chart.houses[static_cast<std::size_t>(i)];
    h.number = i + 1;
    h.cusp_deg = 30.0 * i;
    h.zodiac = astrochart::core::zodiac_placement(h.cusp_deg);
    h.lord = astrochart::core::kDefaultSignLords[static_cast<std::size_t>(i)];
  }
  for (const Planet p : astrochart::core::kAllPlanets) {
    chart.planets[static_cast<std::size_t>(p)].position.planet = p;
  }
  return chart;
}

void place(astrochart::chart::BirthChart& chart, Planet p, double lon) {
  auto& slot = chart.planets[static_cast<std::size_t>(p)];
  auto& old = chart.houses[static_cast<std::size_t>(slot.house - 1)].occupants;
  old.erase(std::remove(old.begin(), old.end(), p), old.end());
  slot.position.longitude_deg = lon;
  slot.zodiac = astrochart::core::zodiac_placement(lon);
  slot.house = slot.zodiac.sign_index + 1;
  chart.houses[static_cast<std::size_t>(slot.house - 1)].occupants.push_back(p);
}

bool has_yoga(const std::vector<astrochart::vedic::Yoga>& yogas, const std::string& name,
              astrochart::vedic::YogaStrength strength) {
  return std::any_of(yogas.begin(), yogas.end(),
                     [&](const auto& y) { return y.name == name && y.strength == strength; });
}

// Delegates to a real ephemeris but fails for a set of bodies.
class FailingEphemeris final : public astrochart::core::IEphemeris {
 public:
  FailingEphemeris(const astrochart::core::IEphemeris& inner, std::vector<Planet> failing)
      : inner_(inner), failing_(std::move(failing)) {}

  [[nodiscard]] astrochart::core::EphemerisSample position(Planet body, const astrochart::core::Instant& instant,
                                                           const astrochart::core::GeoCoordinate& observer) const override {
    if (std::find(failing_.begin(), failing_.end(), body) != failing_.end()) {
      return astrochart::core::EphemerisSample{.position = {}, .status = astrochart::core::Status::DataUnavailable};
    }
    return inner_.position(body, instant, observer);
  }

 private:
  const astrochart::core::IEphemeris& inner_;
  std::vector<Planet> failing_;
};

bool involves(const astrochart::chart::Aspect& a, Planet p) { return a.first == p || a.second == p; }

bool contains(const std::vector<std::string>& list, const std::string& item) {
  return std::find(list.begin(), list.end(), item) != list.end();
}

}  // namespace

int main() {
  using namespace astrochart::vedic;
  const RulesTable rules = default_rules();

  if (classify_dignity(Planet::Sun, ZodiacSign::Aries, rules) != Dignity::Exalted ||
      classify_dignity(Planet::Sun, ZodiacSign::Libra, rules) != Dignity::Debilitated ||
      classify_dignity(Planet::Sun, ZodiacSign::Leo, rules) != Dignity::Own ||
      classify_dignity(Planet::Sun, ZodiacSign::Pisces, rules) != Dignity::Friendly ||
      classify_dignity(Planet::Sun, ZodiacSign::Aquarius, rules) != Dignity::Enemy ||
      classify_dignity(Planet::Sun, ZodiacSign::Gemini, rules) != Dignity::Neutral) {
    spdlog::error("sun dignity classes wrong");
    return 1;
  }
  // Mercury is exalted in one of its own signs; exaltation wins.
  if (classify_dignity(Planet::Mercury, ZodiacSign::Virgo, rules) != Dignity::Exalted ||
      classify_dignity(Planet::Rahu, ZodiacSign::Taurus, rules) != Dignity::Neutral) {
    spdlog::error("dignity precedence wrong");
    return 2;
  }

  auto chart = aries_rising_chart();
  place(chart, Planet::Sun, 195.0);      // Libra, house 7
  place(chart, Planet::Moon, 215.0);     // Scorpio, house 8
  place(chart, Planet::Mercury, 199.0);  // 4 deg from the Sun
  place(chart, Planet::Venus, 100.0);    // Cancer, house 4
  place(chart, Planet::Mars, 5.0);       // Aries, house 1
  place(chart, Planet::Jupiter, 305.0);  // Aquarius, house 11: 3 houses from the Moon
  place(chart, Planet::Saturn, 240.0);   // 25 deg from the Moon
  place(chart, Planet::Rahu, 40.0);
  place(chart, Planet::Ketu, 220.0);

  const auto dignities = assess_dignities(chart, rules);
  if (dignities.size() != 7U || dignities[0].planet != Planet::Sun || dignities[0].dignity != Dignity::Debilitated ||
      dignities[1].dignity != Dignity::Debilitated || dignities[4].dignity != Dignity::Own) {
    spdlog::error("chart dignities wrong");
    return 3;
  }

  const auto strengths = house_strengths(chart);
  if (strengths[7] != HouseStrength::Moderate || strengths[3] != HouseStrength::Moderate ||
      strengths[0] != HouseStrength::Weak) {
    spdlog::error("house strengths wrong");
    return 4;
  }
  place(chart, Planet::Venus, 225.0);
  if (house_strengths(chart)[7] != HouseStrength::Strong) {
    spdlog::error("two benefics should make a strong house");
    return 5;
  }
  place(chart, Planet::Venus, 100.0);

  const auto yogas = detect_yogas(chart);
  if (!has_yoga(yogas, "Gajakesari", YogaStrength::Strong) || !has_yoga(yogas, "Budh-Aditya", YogaStrength::Strong) ||
      !has_yoga(yogas, "Shasha", YogaStrength::Moderate)) {
    spdlog::error("expected yogas missing ({} found)", yogas.size());
    return 6;
  }
  // 9th lord Jupiter in house 11, 10th lord Saturn in house 9.
  if (has_yoga(yogas, "Dharma-Karmadhipati", YogaStrength::Strong)) {
    spdlog::error("dharma-karmadhipati reported with lords apart");
    return 7;
  }
  place(chart, Planet::Saturn, 310.0);
  if (!has_yoga(detect_yogas(chart), "Dharma-Karmadhipati", YogaStrength::Strong)) {
    spdlog::error("dharma-karmadhipati missing with lords together");
    return 8;
  }
  place(chart, Planet::Saturn, 240.0);

  place(chart, Planet::Jupiter, 335.0);  // Pisces: 4 houses from the Moon
  place(chart, Planet::Mercury, 230.0);
  place(chart, Planet::Saturn, 100.0);
  if (!detect_yogas(chart).empty()) {
    spdlog::error("no yoga expected");
    return 9;
  }
  YogaConfig wide{};
  wide.budh_aditya_max_deg = 40.0;
  if (!has_yoga(detect_yogas(chart, wide), "Budh-Aditya", YogaStrength::Moderate)) {
    spdlog::error("yoga thresholds not configurable");
    return 10;
  }

  const auto lk = analyze_lal_kitab(chart, assess_dignities(chart, rules));
  if (!lk.manglik || lk.mars_house != 1 || lk.debts.size() != 2U || !contains(lk.debts, "Pitru Rin (Ancestral debt)") ||
      !contains(lk.debts, "Matru Rin (Mother's debt)")) {
    spdlog::error("lal kitab manglik/debts wrong");
    return 11;
  }
  if (!contains(lk.remedies, std::string(planet_remedy(Planet::Moon))) ||
      !contains(lk.remedies, std::string(planet_remedy(Planet::Sun))) || !contains(lk.remedies, "Feed crows regularly")) {
    spdlog::error("lal kitab remedies incomplete");
    return 12;
  }
  for (std::size_t i = 0; i < lk.remedies.size(); ++i) {
    if (std::count(lk.remedies.begin(), lk.remedies.end(), lk.remedies[i]) != 1) {
      spdlog::error("duplicate remedy: {}", lk.remedies[i]);
      return 13;
    }
  }

  place(chart, Planet::Mars, 65.0);  // house 3
  const auto calm = analyze_lal_kitab(chart, assess_dignities(chart, rules));
  if (calm.manglik || calm.mars_house != 3 || is_manglik_house(3) || !is_manglik_house(12)) {
    spdlog::error("non-manglik mars misclassified");
    return 14;
  }

  // Placeholders sit together at 0 Aries; none of the derived rules may read them as real positions.
  const astrochart::ephemeris::AnalyticEphemeris analytic;
  const FailingEphemeris failing(analytic, {Planet::Sun, Planet::Mercury, Planet::Mars});
  const auto instant = astrochart::core::make_instant(
      astrochart::core::CivilDateTime{.year = 1990, .month = 5, .day = 15, .hour = 14, .minute = 30, .second = 0.0}, 5.5,
      astrochart::core::leap_seconds::default_table());
  const auto built = astrochart::chart::ChartBuilder(failing).build(
      instant, astrochart::core::GeoCoordinate{.latitude_deg = 19.0760, .longitude_deg = 72.8777});
  if (built.status != astrochart::core::Status::Ok || !built.chart.planet(Planet::Sun).position.fallback ||
      !built.chart.planet(Planet::Mercury).position.fallback) {
    spdlog::error("degraded chart not built");
    return 15;
  }
  for (const auto& a : astrochart::chart::detect_aspects(built.chart.positions())) {
    if (involves(a, Planet::Sun) || involves(a, Planet::Mercury) || involves(a, Planet::Mars)) {
      spdlog::error("aspect {}-{} uses a placeholder", astrochart::core::planet_name(a.first),
                    astrochart::core::planet_name(a.second));
      return 16;
    }
  }
  const auto degraded_yogas = detect_yogas(built.chart);
  if (std::any_of(degraded_yogas.begin(), degraded_yogas.end(), [](const auto& y) { return y.name == "Budh-Aditya"; })) {
    spdlog::error("budh-aditya detected from placeholders");
    return 17;
  }
  const auto degraded_dignities = assess_dignities(built.chart, rules);
  if (degraded_dignities.size() != 4U ||
      std::any_of(degraded_dignities.begin(), degraded_dignities.end(), [](const auto& d) {
        return d.planet == Planet::Sun || d.planet == Planet::Mercury || d.planet == Planet::Mars;
      })) {
    spdlog::error("dignities assessed for placeholders");
    return 18;
  }
  const auto degraded_lk = analyze_lal_kitab(built.chart, degraded_dignities);
  if (degraded_lk.manglik || degraded_lk.mars_house != 0) {
    spdlog::error("manglik derived from a mars placeholder");
    return 19;
  }

  // Placeholder benefics do not strengthen the house they were parked in.
  auto parked = aries_rising_chart();
  place(parked, Planet::Jupiter, 5.0);
  place(parked, Planet::Venus, 10.0);
  parked.planets[static_cast<std::size_t>(Planet::Jupiter)].position.fallback = true;
  parked.planets[static_cast<std::size_t>(Planet::Venus)].position.fallback = true;
  if (house_strengths(parked)[0] != HouseStrength::Weak) {
    spdlog::error("placeholder benefics counted for house strength");
    return 20;
  }

  return 0;
}
