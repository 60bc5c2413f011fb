/**
 * @file chart_engine.cpp
 * @brief Chart analysis engine implementation.
 * @author Watosn
 */

#include "astrochart/analysis/chart_engine.hpp"

#include <cmath>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "astrochart/core/time_scales.hpp"
#include "astrochart/core/zodiac.hpp"
#include "astrochart/vedic/lunar_phase.hpp"
#include "astrochart/vedic/numerology.hpp"

namespace astrochart::analysis {
namespace {

using astrochart::core::Planet;
using astrochart::core::Status;

constexpr double kMaxUtcOffsetHours = 14.0;

}  // namespace

ChartSummary summarize(const chart::BirthChart& chart, const std::vector<vedic::DignityAssessment>& dignities) {
  ChartSummary out{};
  out.sun_sign = chart.planet(Planet::Sun).zodiac.sign;
  out.moon_sign = chart.planet(Planet::Moon).zodiac.sign;
  out.ascendant_sign = astrochart::core::zodiac_placement(chart.ascendant_deg).sign;
  for (const auto& d : dignities) {
    if (d.dignity == vedic::Dignity::Exalted || d.dignity == vedic::Dignity::Own) {
      out.strengths.push_back(fmt::format("{} is {} {}", astrochart::core::planet_name(d.planet),
                                          d.dignity == vedic::Dignity::Own ? "in own sign" : "exalted in",
                                          astrochart::core::sign_name(d.sign)));
    } else if (d.dignity == vedic::Dignity::Debilitated) {
      out.weaknesses.push_back(fmt::format("{} is debilitated in {}", astrochart::core::planet_name(d.planet),
                                           astrochart::core::sign_name(d.sign)));
    }
  }
  return out;
}

ChartReport aggregate(const ChartComponents& c) {
  ChartReport report{};
  if (c.input != nullptr) {
    report.name = c.input->name;
    report.place = c.input->place;
  }
  report.birth = c.birth;
  report.utc_offset_hours = c.utc_offset_hours;
  report.matched_place = c.matched_place;
  if (c.chart != nullptr) {
    const chart::BirthChart& ch = *c.chart;
    report.coordinate = ch.coordinate;
    report.instant = ch.instant;
    report.house_system = ch.house_system;
    report.ascendant_deg = ch.ascendant_deg;
    report.midheaven_deg = ch.midheaven_deg;
    for (std::size_t i = 0; i < ch.planets.size(); ++i) {
      auto& p = report.planets[i];
      p.position = ch.planets[i].position;
      p.zodiac = ch.planets[i].zodiac;
      p.house = ch.planets[i].house;
      p.nakshatra = c.planet_nakshatras[i];
    }
    for (std::size_t i = 0; i < ch.houses.size(); ++i) {
      report.houses[i] = HouseReport{.placement = ch.houses[i], .strength = c.house_strengths[i]};
    }
  }
  for (const auto& d : c.dignities) {
    report.planets[static_cast<std::size_t>(d.planet)].dignity = d.dignity;
  }
  report.aspects = c.aspects;
  report.nakshatra = c.nakshatra;
  report.dasha = c.dasha;
  report.numerology = c.numerology;
  report.dignities = c.dignities;
  report.yogas = c.yogas;
  report.lal_kitab = c.lal_kitab;
  report.lunar_phase = c.lunar_phase;
  report.summary = c.summary;
  return report;
}

ChartAnalysisEngine::ChartAnalysisEngine(const astrochart::core::IEphemeris& ephemeris,
                                         const geo::CoordinateResolver& resolver, const vedic::RulesTable& rules)
    : ChartAnalysisEngine(ephemeris, resolver, rules, Config{}) {}

ChartAnalysisEngine::ChartAnalysisEngine(const astrochart::core::IEphemeris& ephemeris,
                                         const geo::CoordinateResolver& resolver, const vedic::RulesTable& rules,
                                         Config config)
    : ephemeris_(ephemeris), resolver_(resolver), rules_(rules), config_(std::move(config)) {}

AnalysisResult ChartAnalysisEngine::analyze(const BirthInput& input, double as_of_jd_ut) const {
  AnalysisResult out{};

  astrochart::core::CivilDateTime birth{};
  if (!astrochart::core::parse_civil_date(input.date, birth) || !astrochart::core::parse_civil_time(input.time, birth)) {
    out.status = Status::InvalidInput;
    return out;
  }
  const double utc_offset = input.utc_offset_hours.value_or(0.0);
  if (!std::isfinite(utc_offset) || std::abs(utc_offset) > kMaxUtcOffsetHours) {
    out.status = Status::InvalidInput;
    return out;
  }

  astrochart::core::GeoCoordinate coordinate{};
  std::string matched_place;
  if (input.coordinate.has_value()) {
    if (!astrochart::core::is_valid(*input.coordinate)) {
      out.status = Status::InvalidInput;
      return out;
    }
    coordinate = *input.coordinate;
  } else {
    const geo::Resolution resolved = resolver_.resolve(input.place);
    coordinate = resolved.coordinate;
    matched_place = resolved.matched_key;
    if (!resolved.found) {
      out.warnings.push_back(astrochart::core::Warning{
          .code = astrochart::core::WarningCode::LocationNotFound,
          .planet = std::nullopt,
          .message = fmt::format("location '{}' not found; using default ({:.4f}, {:.4f})", input.place,
                                 coordinate.latitude_deg, coordinate.longitude_deg),
      });
    }
  }

  const astrochart::core::Instant instant = astrochart::core::make_instant(birth, utc_offset, config_.leap_seconds);
  const chart::ChartBuilder builder(
      ephemeris_, chart::ChartBuilder::Config{.house_system = config_.house_system, .sign_lords = rules_.sign_lords});
  chart::ChartResult built = builder.build(instant, coordinate);
  if (built.status != Status::Ok) {
    out.status = built.status;
    return out;
  }
  for (auto& w : built.warnings) {
    out.warnings.push_back(std::move(w));
  }
  const chart::BirthChart& ch = built.chart;

  ChartComponents components{};
  components.input = &input;
  components.birth = birth;
  components.utc_offset_hours = utc_offset;
  components.matched_place = matched_place;
  components.chart = &ch;
  components.aspects = chart::detect_aspects(ch.positions(), config_.aspects);
  for (const Planet body : astrochart::core::kAllPlanets) {
    components.planet_nakshatras[static_cast<std::size_t>(body)] =
        vedic::nakshatra_for(ch.planet(body).position.longitude_deg, rules_);
  }
  components.nakshatra = components.planet_nakshatras[static_cast<std::size_t>(Planet::Moon)];
  components.dasha = vedic::dasha_for(components.nakshatra, instant.jd_ut, as_of_jd_ut, rules_);
  components.numerology = vedic::numerology_profile(input.name, birth);
  components.dignities = vedic::assess_dignities(ch, rules_);
  components.house_strengths = vedic::house_strengths(ch);
  components.yogas = vedic::detect_yogas(ch, config_.yogas);
  components.lal_kitab = vedic::analyze_lal_kitab(ch, components.dignities);
  components.lunar_phase =
      vedic::lunar_phase(ch.planet(Planet::Sun).position.longitude_deg, ch.planet(Planet::Moon).position.longitude_deg);
  components.summary = summarize(ch, components.dignities);

  out.report = aggregate(components);
  out.status = Status::Ok;
  return out;
}

}  // namespace astrochart::analysis
