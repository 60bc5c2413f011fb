/**
 * @file chart_batch_cli.cpp
 * @brief Batch chart runner: CSV of birth records in, one key=value block per record out.
 * @author Watosn
 */

#include <charconv>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "astrochart/analysis/chart_engine.hpp"
#include "astrochart/analysis/report_format.hpp"
#include "astrochart/chart/house_system.hpp"
#include "astrochart/core/time_scales.hpp"
#include "runtime.hpp"

namespace {

bool parse_double(std::string_view text, double& value) {
  const auto* last = text.data() + text.size();
  const auto res = std::from_chars(text.data(), last, value);
  return res.ec == std::errc{} && res.ptr == last;
}

// Comma separated; a field may be double-quoted to carry commas ("Mumbai, India").
bool split_row(const std::string& line, std::vector<std::string>& fields) {
  fields.clear();
  std::string field;
  bool quoted = false;
  for (const char c : line) {
    if (c == '"') {
      quoted = !quoted;
    } else if (c == ',' && !quoted) {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field.push_back(c);
    }
  }
  fields.push_back(field);
  return !quoted;
}

// name,date,time,place[,utc_offset_h[,lat_deg,lon_deg]]
bool parse_birth_row(const std::string& line, astrochart::analysis::BirthInput& out) {
  std::vector<std::string> f;
  if (!split_row(line, f)) {
    return false;
  }
  if (f.size() != 4U && f.size() != 5U && f.size() != 7U) {
    return false;
  }
  out = astrochart::analysis::BirthInput{.name = f[0], .date = f[1], .time = f[2], .place = f[3]};
  if (f.size() >= 5U && !f[4].empty()) {
    double offset = 0.0;
    if (!parse_double(f[4], offset)) {
      return false;
    }
    out.utc_offset_hours = offset;
  }
  if (f.size() == 7U) {
    astrochart::core::GeoCoordinate c{};
    if (!parse_double(f[5], c.latitude_deg) || !parse_double(f[6], c.longitude_deg)) {
      return false;
    }
    out.coordinate = c;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 4) {
    spdlog::error("usage: chart_batch_cli <input_csv> <output_file> [house_system]");
    spdlog::error("input row: name,YYYY-MM-DD,HH:MM[:SS],place[,utc_offset_h[,lat_deg,lon_deg]]");
    return 1;
  }

  const std::filesystem::path input_path = argv[1];
  const std::filesystem::path output_path = argv[2];
  const std::string house_name = (argc >= 4) ? argv[3] : "placidus";
  const auto house_system = astrochart::chart::house_system_from_name(house_name);
  if (!house_system) {
    spdlog::error("unknown house system: {}", house_name);
    return 4;
  }

  std::ifstream in(input_path);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_path.string());
    return 2;
  }
  std::FILE* out = std::fopen(output_path.string().c_str(), "w");
  if (out == nullptr) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }

  const astrochart::apps::Runtime rt = astrochart::apps::load_runtime();
  const astrochart::geo::CoordinateResolver resolver(rt.cities);
  const astrochart::analysis::ChartAnalysisEngine engine(
      *rt.ephemeris, resolver, rt.rules,
      astrochart::analysis::ChartAnalysisEngine::Config{
          .house_system = *house_system, .aspects = {}, .yogas = {}, .leap_seconds = rt.leap_seconds});
  const double as_of_jd = astrochart::core::current_julian_date_utc();

  fmt::print(out, "#record_type=metadata,schema=chart_batch_v1,project=astrochart,generated_unix_utc={},"
                  "ephemeris={},house_system={}\n",
             static_cast<long long>(std::time(nullptr)), rt.ephemeris_name, house_name);

  std::string line;
  std::size_t line_no = 0;
  std::size_t records = 0;
  std::size_t failures = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    astrochart::analysis::BirthInput input{};
    if (!parse_birth_row(line, input)) {
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }
    if (line_no == 1 && input.date == "date") {
      continue;
    }

    auto result = engine.analyze(input, as_of_jd);
    result.warnings.insert(result.warnings.begin(), rt.startup_warnings.begin(), rt.startup_warnings.end());
    if (result.status != astrochart::core::Status::Ok) {
      spdlog::warn("row {} failed: {}", line_no, astrochart::core::to_string(result.status));
      ++failures;
    }
    fmt::print(out, "record={}\nsource_line={}\n{}\n", records, line_no, astrochart::analysis::format_result(result));
    ++records;
  }
  std::fclose(out);

  spdlog::info("wrote {} records ({} failed) to {}", records, failures, output_path.string());
  return 0;
}
