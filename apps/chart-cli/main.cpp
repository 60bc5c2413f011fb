/**
 * @file main.cpp
 * @brief astrochart single-chart command-line entrypoint.
 * @author Watosn
 */

#include <charconv>
#include <system_error>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "astrochart/analysis/chart_engine.hpp"
#include "astrochart/analysis/report_format.hpp"
#include "astrochart/chart/house_system.hpp"
#include "astrochart/core/time_scales.hpp"
#include "runtime.hpp"

namespace {

bool parse_double(std::string_view text, double& value) {
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto res = std::from_chars(first, last, value);
  return res.ec == std::errc{} && res.ptr == last;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 5 || argc > 9 || argc == 8) {
    spdlog::error("usage: chart_cli <name> <YYYY-MM-DD> <HH:MM[:SS]> <place> [utc_offset_h] [house_system] [lat_deg lon_deg]");
    spdlog::error("house_system: placidus | porphyry | equal | whole_sign");
    spdlog::error("env: ASTROCHART_RULES_FILE ASTROCHART_CITIES_FILE ASTROCHART_LEAP_SECONDS_FILE ASTROCHART_JPL_EPH_FILE");
    return 1;
  }

  astrochart::analysis::BirthInput input{.name = argv[1], .date = argv[2], .time = argv[3], .place = argv[4]};
  if (argc >= 6) {
    double offset = 0.0;
    if (!parse_double(argv[5], offset)) {
      spdlog::error("invalid utc offset: {}", argv[5]);
      return 1;
    }
    input.utc_offset_hours = offset;
  }
  const std::string house_name = (argc >= 7) ? argv[6] : "placidus";
  const auto house_system = astrochart::chart::house_system_from_name(house_name);
  if (!house_system) {
    spdlog::error("unknown house system: {}", house_name);
    return 1;
  }
  if (argc == 9) {
    astrochart::core::GeoCoordinate coordinate{};
    if (!parse_double(argv[7], coordinate.latitude_deg) || !parse_double(argv[8], coordinate.longitude_deg)) {
      spdlog::error("invalid coordinate: {} {}", argv[7], argv[8]);
      return 1;
    }
    input.coordinate = coordinate;
  }

  const astrochart::apps::Runtime rt = astrochart::apps::load_runtime();
  const astrochart::geo::CoordinateResolver resolver(rt.cities);
  const astrochart::analysis::ChartAnalysisEngine engine(
      *rt.ephemeris, resolver, rt.rules,
      astrochart::analysis::ChartAnalysisEngine::Config{
          .house_system = *house_system, .aspects = {}, .yogas = {}, .leap_seconds = rt.leap_seconds});

  auto result = engine.analyze(input, astrochart::core::current_julian_date_utc());
  result.warnings.insert(result.warnings.begin(), rt.startup_warnings.begin(), rt.startup_warnings.end());
  for (const auto& w : result.warnings) {
    spdlog::warn("{}: {}", astrochart::core::to_string(w.code), w.message);
  }

  fmt::print("ephemeris={}\n", rt.ephemeris_name);
  fmt::print("{}", astrochart::analysis::format_result(result));
  if (result.status != astrochart::core::Status::Ok) {
    spdlog::error("chart analysis failed: {}", astrochart::core::to_string(result.status));
    return 2;
  }
  return 0;
}
