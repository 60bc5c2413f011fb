/**
 * @file jpl_ephemeris_adapter.hpp
 * @brief Ephemeris provider backed by JPL DE binary files.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>

#include "astrochart/core/interfaces.hpp"

namespace jpl::eph {
class Ephemeris;
class Workspace;
}

namespace astrochart::adapters {

/**
 * @brief Geocentric positions from a JPL DE4xx file, rotated into the ecliptic of date.
 */
class JplEphemerisAdapter final : public astrochart::core::IEphemeris {
 public:
  /**
   * @brief Configuration for adapter construction.
   */
  struct Config {
    std::filesystem::path ephemeris_file{};
  };

  /**
   * @brief Factory helper that opens the ephemeris file.
   *
   * Always returns an adapter; when the file cannot be opened every evaluation reports DataUnavailable.
   */
  static std::unique_ptr<JplEphemerisAdapter> Create(const Config& config);

  [[nodiscard]] bool is_loaded() const { return static_cast<bool>(ephemeris_); }

  [[nodiscard]] astrochart::core::EphemerisSample position(astrochart::core::Planet body,
                                                           const astrochart::core::Instant& instant,
                                                           const astrochart::core::GeoCoordinate& observer) const override;

 private:
  explicit JplEphemerisAdapter(Config config);

  Config config_{};
  std::shared_ptr<jpl::eph::Ephemeris> ephemeris_{};
};

}  // namespace astrochart::adapters
