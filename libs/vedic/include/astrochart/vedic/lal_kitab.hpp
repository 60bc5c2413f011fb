/**
 * @file lal_kitab.hpp
 * @brief Simplified Lal Kitab analysis: manglik status, planetary debts and remedies.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "astrochart/chart/chart_builder.hpp"
#include "astrochart/vedic/dignity.hpp"

namespace astrochart::vedic {

/**
 * @brief Lal Kitab findings; `mars_house` is 0 when Mars could not be computed.
 */
struct LalKitabAnalysis {
  bool manglik{false};
  int mars_house{1};
  std::vector<std::string> debts{};
  std::vector<std::string> remedies{};
};

/**
 * @brief Mars in houses 1, 2, 4, 7, 8 or 12.
 */
[[nodiscard]] bool is_manglik_house(int house);

/**
 * @brief Remedy text for a weak (debilitated) classical planet.
 */
[[nodiscard]] std::string_view planet_remedy(astrochart::core::Planet planet);

/**
 * @brief Analyse a chart; remedies are de-duplicated, general remedies come last.
 */
[[nodiscard]] LalKitabAnalysis analyze_lal_kitab(const astrochart::chart::BirthChart& chart,
                                                 const std::vector<DignityAssessment>& dignities);

}  // namespace astrochart::vedic
