/**
 * @file dasha.hpp
 * @brief Vimshottari dasha period lookup.
 * @author Watosn
 */
#pragma once

#include "astrochart/core/types.hpp"
#include "astrochart/vedic/nakshatra.hpp"
#include "astrochart/vedic/rules.hpp"

namespace astrochart::vedic {

/**
 * @brief Current dasha segment.
 *
 * The cycle is walked from the birth nakshatra lord using the years (365.25 days) elapsed since
 * birth modulo the cycle length, so the ruling planet moves with the reference date. Segment bounds are
 * offsets (years) into that walk. The traditional balance at birth is reported alongside and does
 * not feed the segment lookup.
 */
struct DashaPeriod {
  astrochart::core::Planet ruling_planet{astrochart::core::Planet::Ketu};
  astrochart::core::Planet starting_lord{astrochart::core::Planet::Ketu};
  double elapsed_years{};
  double cycle_position_years{};
  double segment_start_years{};
  double segment_end_years{};
  double years_remaining{};
  double balance_at_birth_years{};
};

/**
 * @brief Dasha for a reference date.
 * @param birth_nakshatra Nakshatra of the natal Moon.
 * @param birth_jd_ut Birth instant.
 * @param as_of_jd_ut Reference instant; dates before birth count as zero elapsed years.
 */
[[nodiscard]] DashaPeriod dasha_for(const Nakshatra& birth_nakshatra, double birth_jd_ut, double as_of_jd_ut,
                                    const RulesTable& rules);

}  // namespace astrochart::vedic
