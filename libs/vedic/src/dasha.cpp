/**
 * @file dasha.cpp
 * @brief Dasha lookup implementation.
 * @author Watosn
 */

#include "astrochart/vedic/dasha.hpp"

#include <cmath>
#include <cstddef>

#include "astrochart/core/constants.hpp"

namespace astrochart::vedic {

DashaPeriod dasha_for(const Nakshatra& birth_nakshatra, double birth_jd_ut, double as_of_jd_ut, const RulesTable& rules) {
  DashaPeriod out{};
  out.starting_lord = birth_nakshatra.lord;
  out.ruling_planet = birth_nakshatra.lord;
  out.balance_at_birth_years = (1.0 - birth_nakshatra.fraction_elapsed) * rules.dasha_years(birth_nakshatra.lord);

  const double total = rules.dasha_cycle_years();
  const double elapsed_days = as_of_jd_ut - birth_jd_ut;
  out.elapsed_years = (elapsed_days > 0.0) ? elapsed_days / astrochart::core::constants::kDaysPerJulianYear : 0.0;
  if (!(total > 0.0)) {
    return out;
  }
  out.cycle_position_years = std::fmod(out.elapsed_years, total);

  std::size_t start = 0;
  for (std::size_t i = 0; i < rules.dasha_cycle.size(); ++i) {
    if (rules.dasha_cycle[i].planet == birth_nakshatra.lord) {
      start = i;
      break;
    }
  }

  double accumulated = 0.0;
  for (std::size_t k = 0; k < rules.dasha_cycle.size(); ++k) {
    const auto& seg = rules.dasha_cycle[(start + k) % rules.dasha_cycle.size()];
    const bool last = (k + 1 == rules.dasha_cycle.size());
    if (out.cycle_position_years < accumulated + seg.years || last) {
      out.ruling_planet = seg.planet;
      out.segment_start_years = accumulated;
      out.segment_end_years = accumulated + seg.years;
      out.years_remaining = out.segment_end_years - out.cycle_position_years;
      break;
    }
    accumulated += seg.years;
  }
  return out;
}

}  // namespace astrochart::vedic
