/**
 * @file interfaces.hpp
 * @brief Core model interfaces for ephemeris providers.
 * @author Watosn
 */
#pragma once

#include "astrochart/core/types.hpp"

namespace astrochart::core {

/**
 * @brief One ephemeris evaluation; `position` is meaningful only when `status` is Ok.
 */
struct EphemerisSample {
  CelestialPosition position{};
  Status status{Status::Ok};
};

/**
 * @brief Interface for geocentric ecliptic position providers.
 */
class IEphemeris {
 public:
  virtual ~IEphemeris() = default;
  /**
   * @brief Evaluate the tropical (equinox of date) geocentric position of one body.
   * @param body Tracked body. Providers reject Ketu, which is derived from Rahu by the chart builder.
   * @param instant Evaluation instant.
   * @param observer Observer location (geocentric providers may ignore it).
   * @return Sample with `status` set.
   */
  [[nodiscard]] virtual EphemerisSample position(Planet body, const Instant& instant,
                                                 const GeoCoordinate& observer) const = 0;
};

}  // namespace astrochart::core
