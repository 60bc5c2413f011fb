/**
 * @file analytic_ephemeris.hpp
 * @brief Low-precision analytic ephemeris (mean elements + truncated lunar series).
 * @author Watosn
 */
#pragma once

#include "astrochart/core/interfaces.hpp"

namespace astrochart::ephemeris {

/**
 * @brief Built-in ephemeris for deployments without a JPL file.
 *
 * Planets use Keplerian mean elements (J2000 ecliptic, Standish 1800-2050 fit); the Moon uses the
 * leading terms of Brown's series. Typical errors are well under a degree inside the validity window.
 */
class AnalyticEphemeris final : public astrochart::core::IEphemeris {
 public:
  /**
   * @brief Validity window; evaluations outside it report DataUnavailable.
   */
  struct Config {
    double valid_from_jd{2378496.5};  // 1800-01-01
    double valid_to_jd{2470171.5};    // 2050-12-31
  };

  AnalyticEphemeris() = default;
  explicit AnalyticEphemeris(Config config) : config_(config) {}

  [[nodiscard]] astrochart::core::EphemerisSample position(astrochart::core::Planet body,
                                                           const astrochart::core::Instant& instant,
                                                           const astrochart::core::GeoCoordinate& observer) const override;

 private:
  Config config_{};
};

}  // namespace astrochart::ephemeris
