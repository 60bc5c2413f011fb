/**
 * @file report.hpp
 * @brief Plain-data chart report produced by the analysis engine.
 * @author Watosn
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "astrochart/chart/aspects.hpp"
#include "astrochart/chart/chart_builder.hpp"
#include "astrochart/core/types.hpp"
#include "astrochart/vedic/dasha.hpp"
#include "astrochart/vedic/dignity.hpp"
#include "astrochart/vedic/lal_kitab.hpp"
#include "astrochart/vedic/lunar_phase.hpp"
#include "astrochart/vedic/nakshatra.hpp"
#include "astrochart/vedic/numerology.hpp"
#include "astrochart/vedic/yogas.hpp"

namespace astrochart::analysis {

/**
 * @brief Birth data as supplied by the caller.
 *
 * `coordinate`, when set, bypasses place resolution. Without `utc_offset_hours` the clock time
 * is taken as UT.
 */
struct BirthInput {
  std::string name{};
  std::string date{};
  std::string time{};
  std::string place{};
  std::optional<astrochart::core::GeoCoordinate> coordinate{};
  std::optional<double> utc_offset_hours{};
};

struct PlanetReport {
  astrochart::core::CelestialPosition position{};
  astrochart::core::ZodiacPlacement zodiac{};
  int house{1};
  vedic::Nakshatra nakshatra{};
  vedic::Dignity dignity{vedic::Dignity::Neutral};
};

struct HouseReport {
  chart::HousePlacement placement{};
  vedic::HouseStrength strength{vedic::HouseStrength::Weak};
};

struct ChartSummary {
  astrochart::core::ZodiacSign sun_sign{astrochart::core::ZodiacSign::Aries};
  astrochart::core::ZodiacSign moon_sign{astrochart::core::ZodiacSign::Aries};
  astrochart::core::ZodiacSign ascendant_sign{astrochart::core::ZodiacSign::Aries};
  std::vector<std::string> strengths{};
  std::vector<std::string> weaknesses{};
};

/**
 * @brief Aggregate root of one analysis; every part refers to the same instant and coordinate.
 */
struct ChartReport {
  std::string name{};
  astrochart::core::CivilDateTime birth{};
  double utc_offset_hours{};
  std::string place{};
  std::string matched_place{};
  astrochart::core::GeoCoordinate coordinate{};
  astrochart::core::Instant instant{};
  chart::HouseSystem house_system{chart::HouseSystem::Placidus};
  double ascendant_deg{};
  double midheaven_deg{};
  std::array<PlanetReport, astrochart::core::kPlanetCount> planets{};
  std::array<HouseReport, 12> houses{};
  std::vector<chart::Aspect> aspects{};
  vedic::Nakshatra nakshatra{};
  vedic::DashaPeriod dasha{};
  vedic::NumerologyProfile numerology{};
  std::vector<vedic::DignityAssessment> dignities{};
  std::vector<vedic::Yoga> yogas{};
  vedic::LalKitabAnalysis lal_kitab{};
  vedic::LunarPhase lunar_phase{};
  ChartSummary summary{};

  [[nodiscard]] const PlanetReport& planet(astrochart::core::Planet p) const {
    return planets[static_cast<std::size_t>(p)];
  }
};

/**
 * @brief Outcome of ChartAnalysisEngine::analyze().
 *
 * `report` is meaningful only when `status` is Ok; `warnings` lists every fail-soft substitution.
 */
struct AnalysisResult {
  astrochart::core::Status status{astrochart::core::Status::Ok};
  ChartReport report{};
  std::vector<astrochart::core::Warning> warnings{};

  [[nodiscard]] bool has_warning(astrochart::core::WarningCode code) const {
    for (const auto& w : warnings) {
      if (w.code == code) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace astrochart::analysis
