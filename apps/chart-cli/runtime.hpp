/**
 * @file runtime.hpp
 * @brief Startup assets shared by the chart command-line tools.
 * @author Watosn
 */
#pragma once

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "astrochart/core/interfaces.hpp"
#include "astrochart/core/leap_seconds.hpp"
#include "astrochart/ephemeris/analytic_ephemeris.hpp"
#include "astrochart/geo/coordinate_resolver.hpp"
#include "astrochart/vedic/rules.hpp"

#if defined(ASTROCHART_HAVE_JPL_EPH)
#include "astrochart/adapters/jpl_ephemeris_adapter.hpp"
#endif

namespace astrochart::apps {

/**
 * @brief Tables and ephemeris loaded once per process; every analysis borrows them.
 */
struct Runtime {
  vedic::RulesTable rules{vedic::default_rules()};
  geo::CityTable cities{geo::default_city_table()};
  core::leap_seconds::Table leap_seconds{core::leap_seconds::default_table()};
  std::unique_ptr<core::IEphemeris> ephemeris{};
  std::string ephemeris_name{"analytic"};
  std::vector<core::Warning> startup_warnings{};
};

inline std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string{};
}

inline std::unique_ptr<core::IEphemeris> make_ephemeris(std::string* name) {
  const std::string eph_file = env_or_empty("ASTROCHART_JPL_EPH_FILE");
#if defined(ASTROCHART_HAVE_JPL_EPH)
  if (!eph_file.empty()) {
    auto jpl = adapters::JplEphemerisAdapter::Create(adapters::JplEphemerisAdapter::Config{.ephemeris_file = eph_file});
    if (jpl->is_loaded()) {
      *name = "jpl";
      return jpl;
    }
    spdlog::warn("failed to open JPL ephemeris {}; using analytic model", eph_file);
  }
#else
  if (!eph_file.empty()) {
    spdlog::warn("built without jpl_eph; ignoring ASTROCHART_JPL_EPH_FILE={}", eph_file);
  }
#endif
  *name = "analytic";
  return std::make_unique<ephemeris::AnalyticEphemeris>();
}

/**
 * @brief Load the compiled-in tables, then apply the files named by the ASTROCHART_* environment.
 *
 * A rejected rules file keeps the defaults and is reported as a RulesFileIgnored warning on every result.
 */
inline Runtime load_runtime() {
  Runtime rt{};

  const std::string rules_file = env_or_empty("ASTROCHART_RULES_FILE");
  if (!rules_file.empty()) {
    if (vedic::load_rules_from_file(rules_file, &rt.rules)) {
      spdlog::info("loaded rules from {}", rules_file);
    } else {
      spdlog::warn("rules file rejected, using defaults: {}", rules_file);
      rt.startup_warnings.push_back(core::Warning{
          .code = core::WarningCode::RulesFileIgnored,
          .planet = std::nullopt,
          .message = fmt::format("rules file '{}' rejected; using built-in rules", rules_file),
      });
    }
  }

  const std::string cities_file = env_or_empty("ASTROCHART_CITIES_FILE");
  if (!cities_file.empty()) {
    if (geo::load_city_table(cities_file, &rt.cities)) {
      spdlog::info("loaded {} places from {}", rt.cities.size(), cities_file);
    } else {
      spdlog::warn("city table rejected, using built-in table: {}", cities_file);
    }
  }

  const std::string leap_file = env_or_empty("ASTROCHART_LEAP_SECONDS_FILE");
  if (!leap_file.empty()) {
    if (!core::leap_seconds::load_table_from_file(leap_file, &rt.leap_seconds)) {
      spdlog::warn("leap-second table rejected, using built-in table: {}", leap_file);
    }
  }

  rt.ephemeris = make_ephemeris(&rt.ephemeris_name);
  return rt;
}

}  // namespace astrochart::apps
