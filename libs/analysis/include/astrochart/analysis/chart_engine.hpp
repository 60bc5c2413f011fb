/**
 * @file chart_engine.hpp
 * @brief Chart analysis engine composing every calculator into one report.
 * @author Watosn
 */
#pragma once

#include <array>
#include <string>
#include <vector>

#include "astrochart/analysis/report.hpp"
#include "astrochart/chart/aspects.hpp"
#include "astrochart/chart/chart_builder.hpp"
#include "astrochart/core/interfaces.hpp"
#include "astrochart/core/leap_seconds.hpp"
#include "astrochart/geo/coordinate_resolver.hpp"
#include "astrochart/vedic/rules.hpp"
#include "astrochart/vedic/yogas.hpp"

namespace astrochart::analysis {

/**
 * @brief Already computed parts of a report, all taken from the same chart.
 */
struct ChartComponents {
  const BirthInput* input{nullptr};
  astrochart::core::CivilDateTime birth{};
  double utc_offset_hours{};
  std::string matched_place{};
  const chart::BirthChart* chart{nullptr};
  std::vector<chart::Aspect> aspects{};
  std::array<vedic::Nakshatra, astrochart::core::kPlanetCount> planet_nakshatras{};
  vedic::Nakshatra nakshatra{};
  vedic::DashaPeriod dasha{};
  vedic::NumerologyProfile numerology{};
  std::vector<vedic::DignityAssessment> dignities{};
  std::array<vedic::HouseStrength, 12> house_strengths{};
  std::vector<vedic::Yoga> yogas{};
  vedic::LalKitabAnalysis lal_kitab{};
  vedic::LunarPhase lunar_phase{};
  ChartSummary summary{};
};

/**
 * @brief Merge components into a report without further computation.
 */
[[nodiscard]] ChartReport aggregate(const ChartComponents& components);

/**
 * @brief Strengths (exalted/own planets) and weaknesses (debilitated planets) of a chart.
 */
[[nodiscard]] ChartSummary summarize(const chart::BirthChart& chart, const std::vector<vedic::DignityAssessment>& dignities);

/**
 * @brief Stateless analysis front end; collaborators are borrowed and must outlive the engine.
 */
class ChartAnalysisEngine {
 public:
  struct Config {
    chart::HouseSystem house_system{chart::HouseSystem::Placidus};
    chart::AspectConfig aspects{};
    vedic::YogaConfig yogas{};
    astrochart::core::leap_seconds::Table leap_seconds{astrochart::core::leap_seconds::default_table()};
  };

  ChartAnalysisEngine(const astrochart::core::IEphemeris& ephemeris, const geo::CoordinateResolver& resolver,
                      const vedic::RulesTable& rules);
  ChartAnalysisEngine(const astrochart::core::IEphemeris& ephemeris, const geo::CoordinateResolver& resolver,
                      const vedic::RulesTable& rules, Config config);

  /**
   * @brief Analyse one birth.
   * @param input Birth data.
   * @param as_of_jd_ut Reference date (Julian Day, UT) for the current dasha.
   * @return InvalidInput without a report when the date/time cannot be parsed, the explicit
   *         coordinate is out of range or the UTC offset is outside [-14, 14] hours.
   */
  [[nodiscard]] AnalysisResult analyze(const BirthInput& input, double as_of_jd_ut) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  const astrochart::core::IEphemeris& ephemeris_;
  const geo::CoordinateResolver& resolver_;
  const vedic::RulesTable& rules_;
  Config config_{};
};

}  // namespace astrochart::analysis
