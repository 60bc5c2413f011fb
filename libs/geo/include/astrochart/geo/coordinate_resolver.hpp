/**
 * @file coordinate_resolver.hpp
 * @brief Offline place-name to coordinate resolution.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "astrochart/core/constants.hpp"
#include "astrochart/core/types.hpp"

namespace astrochart::geo {

/**
 * @brief One table row; `key` is lowercase "city, country" (country optional).
 */
struct CityEntry {
  std::string key{};
  astrochart::core::GeoCoordinate coordinate{};
};

using CityTable = std::vector<CityEntry>;

/**
 * @brief Result of resolving a place string.
 *
 * When `found` is false `coordinate` holds the configured default and `matched_key` is empty.
 */
struct Resolution {
  astrochart::core::GeoCoordinate coordinate{};
  std::string matched_key{};
  bool found{false};
};

/**
 * @brief Compiled-in city table, in lookup priority order.
 */
[[nodiscard]] CityTable default_city_table();

/**
 * @brief Load `name,lat,lon` rows; blank lines, `#` comments and a `name,lat,lon` header are skipped.
 * @return false (and `out` untouched) on I/O failure, malformed rows, out-of-range coordinates or an empty file.
 */
bool load_city_table(const std::string& path, CityTable* out);

/**
 * @brief City token of a table key (text before the first comma, trimmed).
 */
[[nodiscard]] std::string city_token(std::string_view key);

/**
 * @brief Best-effort resolver: exact key, then city-token substring match, then the default.
 */
class CoordinateResolver {
 public:
  struct Config {
    astrochart::core::GeoCoordinate fallback{astrochart::core::constants::kDefaultLatitudeDeg,
                                             astrochart::core::constants::kDefaultLongitudeDeg};
  };

  CoordinateResolver();
  explicit CoordinateResolver(CityTable table);
  CoordinateResolver(CityTable table, Config config);

  [[nodiscard]] Resolution resolve(std::string_view place) const;
  [[nodiscard]] const CityTable& table() const { return table_; }
  [[nodiscard]] const Config& config() const { return config_; }

 private:
  CityTable table_{};
  Config config_{};
};

}  // namespace astrochart::geo
