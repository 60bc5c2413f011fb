/**
 * @file test_vedic_indices.cpp
 * @brief Nakshatra, dasha, numerology and lunar phase calculators.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "astrochart/core/constants.hpp"
#include "astrochart/vedic/dasha.hpp"
#include "astrochart/vedic/lunar_phase.hpp"
#include "astrochart/vedic/nakshatra.hpp"
#include "astrochart/vedic/numerology.hpp"
#include "astrochart/vedic/rules.hpp"

int main() {
  using namespace astrochart::vedic;
  using astrochart::core::Planet;
  namespace constants = astrochart::core::constants;
  const RulesTable rules = default_rules();

  const Nakshatra ashwini = nakshatra_for(0.0, rules);
  if (ashwini.index != 0 || ashwini.name != "Ashwini" || ashwini.pada != 1 || ashwini.lord != Planet::Ketu) {
    spdlog::error("0 deg should be Ashwini pada 1");
    return 1;
  }
  const Nakshatra revati = nakshatra_for(359.99, rules);
  if (revati.index != 26 || revati.name != "Revati" || revati.pada != 4 || revati.lord != Planet::Mercury) {
    spdlog::error("end of zodiac should be Revati pada 4");
    return 2;
  }
  if (nakshatra_for(constants::kNakshatraSpanDeg, rules).index != 1 || nakshatra_for(-1.0, rules).index != 26 ||
      nakshatra_for(3.5, rules).pada != 2) {
    spdlog::error("nakshatra boundaries wrong");
    return 3;
  }
  for (double lon = 0.0; lon < 360.0; lon += 0.173) {
    const Nakshatra n = nakshatra_for(lon, rules);
    if (n.index < 0 || n.index > 26 || n.pada < 1 || n.pada > 4 || n.fraction_elapsed < 0.0 || n.fraction_elapsed >= 1.0) {
      spdlog::error("nakshatra out of range at {}", lon);
      return 4;
    }
  }

  if (std::abs(rules.dasha_cycle_years() - 120.0) > 1e-12) {
    spdlog::error("dasha cycle does not sum to 120");
    return 5;
  }

  const double birth_jd = 2448000.5;
  const auto at_birth = dasha_for(ashwini, birth_jd, birth_jd, rules);
  if (at_birth.ruling_planet != Planet::Ketu || at_birth.elapsed_years != 0.0 || at_birth.segment_end_years != 7.0 ||
      std::abs(at_birth.balance_at_birth_years - 7.0) > 1e-12) {
    spdlog::error("dasha at birth should be the nakshatra lord");
    return 6;
  }
  const auto before_birth = dasha_for(ashwini, birth_jd, birth_jd - 1000.0, rules);
  if (before_birth.elapsed_years != 0.0 || before_birth.ruling_planet != Planet::Ketu) {
    spdlog::error("reference date before birth must clamp to zero");
    return 7;
  }
  // 30 years after a Ketu start: Ketu 7 + Venus 20 = 27, then Sun 6.
  const auto thirty = dasha_for(ashwini, birth_jd, birth_jd + 30.0 * constants::kDaysPerJulianYear, rules);
  if (thirty.ruling_planet != Planet::Sun || std::abs(thirty.segment_start_years - 27.0) > 1e-9 ||
      std::abs(thirty.years_remaining - 3.0) > 1e-9 || thirty.starting_lord != Planet::Ketu) {
    spdlog::error("dasha walk wrong: ruling={} start={}", static_cast<int>(thirty.ruling_planet), thirty.segment_start_years);
    return 8;
  }
  const auto wrapped = dasha_for(ashwini, birth_jd, birth_jd + 125.0 * constants::kDaysPerJulianYear, rules);
  if (wrapped.ruling_planet != Planet::Ketu || std::abs(wrapped.cycle_position_years - 5.0) > 1e-9) {
    spdlog::error("dasha cycle should wrap after 120 years");
    return 9;
  }
  // Halfway through Bharani: half of Venus' 20 years remain at birth.
  const Nakshatra bharani = nakshatra_for(1.5 * constants::kNakshatraSpanDeg, rules);
  if (std::abs(dasha_for(bharani, birth_jd, birth_jd, rules).balance_at_birth_years - 10.0) > 1e-9) {
    spdlog::error("dasha balance at birth wrong");
    return 10;
  }

  // 2000-01-08 -> 8 + 1 + 2 = 11, a master number.
  if (life_path_number(astrochart::core::CivilDateTime{.year = 2000, .month = 1, .day = 8}) != 11) {
    spdlog::error("life path master number reduced");
    return 11;
  }
  if (life_path_number(astrochart::core::CivilDateTime{.year = 1990, .month = 5, .day = 15}) != 3) {
    spdlog::error("life path 1990-05-15 should be 3");
    return 12;
  }
  for (int v = 0; v < 5000; ++v) {
    const int r = reduce_number(v);
    if (reduce_number(r) != r || (r > 9 && !is_master_number(r))) {
      spdlog::error("reduction not idempotent for {}", v);
      return 13;
    }
  }
  if (reduce_number(29) != 11 || reduce_number(38) != 11 || reduce_number(985) != 22) {
    spdlog::error("master number stop wrong");
    return 14;
  }
  if (letter_value('A') != 1 || letter_value('i') != 9 || letter_value('J') != 1 || letter_value('S') != 1 ||
      letter_value('Z') != 8 || letter_value(' ') != 0) {
    spdlog::error("letter values wrong");
    return 15;
  }
  // JOHN: 1+6+8+5 = 20 -> 2; vowels O = 6.
  const auto profile = numerology_profile("John", astrochart::core::CivilDateTime{.year = 1990, .month = 5, .day = 29});
  if (profile.destiny != 2 || profile.soul != 6 || profile.birth_day != 11) {
    spdlog::error("numerology profile wrong: destiny={} soul={} day={}", profile.destiny, profile.soul, profile.birth_day);
    return 16;
  }

  const auto new_moon = lunar_phase(100.0, 100.0);
  if (new_moon.phase_name != "New Moon" || new_moon.illumination > 1e-12 || new_moon.tithi != 1 ||
      new_moon.paksha != Paksha::Shukla) {
    spdlog::error("new moon wrong");
    return 17;
  }
  const auto full_moon = lunar_phase(10.0, 190.0);
  if (full_moon.phase_name != "Full Moon" || std::abs(full_moon.illumination - 1.0) > 1e-12 || full_moon.tithi != 16 ||
      full_moon.paksha != Paksha::Krishna) {
    spdlog::error("full moon wrong");
    return 18;
  }
  const auto first_quarter = lunar_phase(350.0, 80.0);
  if (first_quarter.phase_name != "First Quarter" || std::abs(first_quarter.elongation_deg - 90.0) > 1e-9 ||
      std::abs(first_quarter.illumination - 0.5) > 1e-9) {
    spdlog::error("first quarter wrong");
    return 19;
  }
  if (lunar_phase(0.0, 359.9).tithi != 30 || lunar_phase(0.0, 359.9).phase_name != "New Moon") {
    spdlog::error("end of lunation wrong");
    return 20;
  }

  return 0;
}
