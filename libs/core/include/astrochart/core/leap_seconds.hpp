/**
 * @file leap_seconds.hpp
 * @brief TAI-UTC steps keyed by Modified Julian Day, as published in the IERS Leap_Second.dat file.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace astrochart::core::leap_seconds {

inline constexpr double kMjdOffset = 2400000.5;

/**
 * @brief One step: from `mjd` (0h UTC) onward TAI-UTC equals `tai_minus_utc_s`.
 */
struct Step {
  int mjd{};
  double tai_minus_utc_s{};
};

using Table = std::vector<Step>;

/**
 * @brief Steps since 1972-01-01. Births before the first step use it as well.
 */
inline Table default_table() {
  return Table{
      {41317, 10.0}, {41499, 11.0}, {41683, 12.0}, {42048, 13.0}, {42413, 14.0}, {42778, 15.0}, {43144, 16.0},
      {43509, 17.0}, {43874, 18.0}, {44239, 19.0}, {44786, 20.0}, {45151, 21.0}, {45516, 22.0}, {46247, 23.0},
      {47161, 24.0}, {47892, 25.0}, {48257, 26.0}, {48804, 27.0}, {49169, 28.0}, {49534, 29.0}, {50083, 30.0},
      {50630, 31.0}, {51179, 32.0}, {53736, 33.0}, {54832, 34.0}, {56109, 35.0}, {57204, 36.0}, {57754, 37.0},
  };
}

/**
 * @brief Read an IERS Leap_Second.dat file.
 *
 * Data rows are `MJD day month year TAI-UTC`; lines starting with `#` and blank lines are skipped.
 * @return false when the file cannot be read, a row is malformed or no step was found; `out` is
 *         only written on success.
 */
inline bool load_table_from_file(const std::string& path, Table* out) {
  if (out == nullptr) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    return false;
  }

  Table steps;
  std::string row;
  while (std::getline(in, row)) {
    const auto first = row.find_first_not_of(" \t\r");
    if (first == std::string::npos || row[first] == '#') {
      continue;
    }
    std::istringstream fields(row);
    double mjd = 0.0;
    int day = 0;
    int month = 0;
    int year = 0;
    double offset = 0.0;
    if (!(fields >> mjd >> day >> month >> year >> offset) || month < 1 || month > 12 || day < 1 || day > 31) {
      return false;
    }
    steps.push_back(Step{.mjd = static_cast<int>(mjd), .tai_minus_utc_s = offset});
  }
  if (steps.empty()) {
    return false;
  }

  std::sort(steps.begin(), steps.end(), [](const Step& a, const Step& b) { return a.mjd < b.mjd; });
  *out = std::move(steps);
  return true;
}

/**
 * @brief TAI-UTC in seconds at a UTC Julian Day; 0 for an empty table.
 */
inline double tai_minus_utc_seconds(double jd_utc, const Table& table) {
  if (table.empty()) {
    return 0.0;
  }
  const double mjd = jd_utc - kMjdOffset;
  const auto after = std::upper_bound(table.begin(), table.end(), mjd,
                                      [](double value, const Step& s) { return value < static_cast<double>(s.mjd); });
  return after == table.begin() ? table.front().tai_minus_utc_s : std::prev(after)->tai_minus_utc_s;
}

}  // namespace astrochart::core::leap_seconds
