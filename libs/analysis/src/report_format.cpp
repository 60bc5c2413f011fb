/**
 * @file report_format.cpp
 * @brief key=value report serialization.
 * @author Watosn
 */

#include "astrochart/analysis/report_format.hpp"

#include <cctype>
#include <iterator>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "astrochart/core/zodiac.hpp"

namespace astrochart::analysis {
namespace {

std::string lower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

template <typename... Args>
void line(std::string& out, fmt::format_string<Args...> format, Args&&... args) {
  fmt::format_to(std::back_inserter(out), format, std::forward<Args>(args)...);
  out.push_back('\n');
}

std::string joined_planets(const std::vector<astrochart::core::Planet>& planets) {
  std::string out;
  for (const auto p : planets) {
    if (!out.empty()) {
      out.push_back('|');
    }
    out.append(astrochart::core::planet_name(p));
  }
  return out.empty() ? std::string("-") : out;
}

}  // namespace

std::string format_report(const ChartReport& r) {
  using astrochart::core::planet_name;
  using astrochart::core::sign_name;

  std::string out;
  line(out, "name={}", r.name);
  line(out, "birth={:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02.0f}", r.birth.year, r.birth.month, r.birth.day, r.birth.hour,
       r.birth.minute, r.birth.second);
  line(out, "utc_offset_hours={:.2f}", r.utc_offset_hours);
  line(out, "place={}", r.place);
  line(out, "matched_place={}", r.matched_place.empty() ? std::string("-") : r.matched_place);
  line(out, "latitude_deg={:.4f}", r.coordinate.latitude_deg);
  line(out, "longitude_deg={:.4f}", r.coordinate.longitude_deg);
  line(out, "jd_ut={:.6f}", r.instant.jd_ut);
  line(out, "jd_tdb={:.6f}", r.instant.jd_tdb);
  line(out, "house_system={}", chart::to_string(r.house_system));
  line(out, "ascendant_deg={:.4f}", r.ascendant_deg);
  line(out, "midheaven_deg={:.4f}", r.midheaven_deg);

  for (const auto& p : r.planets) {
    const std::string key = lower(planet_name(p.position.planet));
    line(out, "planet.{}.longitude_deg={:.4f}", key, p.position.longitude_deg);
    line(out, "planet.{}.latitude_deg={:.4f}", key, p.position.latitude_deg);
    line(out, "planet.{}.speed_deg_per_day={:.4f}", key, p.position.speed_deg_per_day);
    line(out, "planet.{}.retrograde={}", key, p.position.retrograde);
    line(out, "planet.{}.sign={}", key, sign_name(p.zodiac.sign));
    line(out, "planet.{}.degree_in_sign={:.4f}", key, p.zodiac.degree_in_sign);
    line(out, "planet.{}.house={}", key, p.house);
    line(out, "planet.{}.nakshatra={}", key, p.nakshatra.name);
    line(out, "planet.{}.pada={}", key, p.nakshatra.pada);
    line(out, "planet.{}.dignity={}", key, vedic::to_string(p.dignity));
    line(out, "planet.{}.fallback={}", key, p.position.fallback);
  }

  for (const auto& h : r.houses) {
    const int n = h.placement.number;
    line(out, "house.{}.cusp_deg={:.4f}", n, h.placement.cusp_deg);
    line(out, "house.{}.sign={}", n, sign_name(h.placement.zodiac.sign));
    line(out, "house.{}.lord={}", n, planet_name(h.placement.lord));
    line(out, "house.{}.occupants={}", n, joined_planets(h.placement.occupants));
    line(out, "house.{}.strength={}", n, vedic::to_string(h.strength));
  }

  line(out, "aspect.count={}", r.aspects.size());
  for (std::size_t i = 0; i < r.aspects.size(); ++i) {
    const auto& a = r.aspects[i];
    line(out, "aspect.{}={}-{} {} separation_deg={:.4f} orb_deg={:.4f} strength={}", i, planet_name(a.first),
         planet_name(a.second), chart::to_string(a.type), a.separation_deg, a.orb_deg, chart::to_string(a.strength));
  }

  line(out, "nakshatra={}", r.nakshatra.name);
  line(out, "nakshatra.index={}", r.nakshatra.index);
  line(out, "nakshatra.pada={}", r.nakshatra.pada);
  line(out, "nakshatra.lord={}", planet_name(r.nakshatra.lord));

  line(out, "dasha.current={}", planet_name(r.dasha.ruling_planet));
  line(out, "dasha.starting_lord={}", planet_name(r.dasha.starting_lord));
  line(out, "dasha.elapsed_years={:.4f}", r.dasha.elapsed_years);
  line(out, "dasha.segment_start_years={:.4f}", r.dasha.segment_start_years);
  line(out, "dasha.segment_end_years={:.4f}", r.dasha.segment_end_years);
  line(out, "dasha.years_remaining={:.4f}", r.dasha.years_remaining);
  line(out, "dasha.balance_at_birth_years={:.4f}", r.dasha.balance_at_birth_years);

  line(out, "numerology.life_path={}", r.numerology.life_path);
  line(out, "numerology.destiny={}", r.numerology.destiny);
  line(out, "numerology.soul={}", r.numerology.soul);
  line(out, "numerology.birth_day={}", r.numerology.birth_day);

  line(out, "yoga.count={}", r.yogas.size());
  for (std::size_t i = 0; i < r.yogas.size(); ++i) {
    line(out, "yoga.{}={} ({})", i, r.yogas[i].name, vedic::to_string(r.yogas[i].strength));
  }

  line(out, "lal_kitab.manglik={}", r.lal_kitab.manglik);
  line(out, "lal_kitab.mars_house={}", r.lal_kitab.mars_house);
  for (std::size_t i = 0; i < r.lal_kitab.debts.size(); ++i) {
    line(out, "lal_kitab.debt.{}={}", i, r.lal_kitab.debts[i]);
  }
  for (std::size_t i = 0; i < r.lal_kitab.remedies.size(); ++i) {
    line(out, "lal_kitab.remedy.{}={}", i, r.lal_kitab.remedies[i]);
  }

  line(out, "lunar.phase={}", r.lunar_phase.phase_name);
  line(out, "lunar.elongation_deg={:.4f}", r.lunar_phase.elongation_deg);
  line(out, "lunar.illumination={:.4f}", r.lunar_phase.illumination);
  line(out, "lunar.tithi={}", r.lunar_phase.tithi);
  line(out, "lunar.paksha={}", vedic::to_string(r.lunar_phase.paksha));

  line(out, "summary.sun_sign={}", sign_name(r.summary.sun_sign));
  line(out, "summary.moon_sign={}", sign_name(r.summary.moon_sign));
  line(out, "summary.ascendant_sign={}", sign_name(r.summary.ascendant_sign));
  for (std::size_t i = 0; i < r.summary.strengths.size(); ++i) {
    line(out, "summary.strength.{}={}", i, r.summary.strengths[i]);
  }
  for (std::size_t i = 0; i < r.summary.weaknesses.size(); ++i) {
    line(out, "summary.weakness.{}={}", i, r.summary.weaknesses[i]);
  }
  return out;
}

std::string format_result(const AnalysisResult& result) {
  std::string out;
  line(out, "status={}", astrochart::core::to_string(result.status));
  for (std::size_t i = 0; i < result.warnings.size(); ++i) {
    const auto& w = result.warnings[i];
    line(out, "warning.{}={}{}{} {}", i, astrochart::core::to_string(w.code), w.planet ? ":" : "",
         w.planet ? astrochart::core::planet_name(*w.planet) : std::string_view{}, w.message);
  }
  if (result.status == astrochart::core::Status::Ok) {
    out += format_report(result.report);
  }
  return out;
}

}  // namespace astrochart::analysis
