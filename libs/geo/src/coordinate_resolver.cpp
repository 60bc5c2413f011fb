/**
 * @file coordinate_resolver.cpp
 * @brief Offline coordinate resolver implementation.
 * @author Watosn
 */

#include "astrochart/geo/coordinate_resolver.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <utility>

#include "astrochart/core/time_scales.hpp"

namespace astrochart::geo {
namespace {

std::string normalize_place(std::string_view text) {
  const std::string_view trimmed = astrochart::core::detail::trim_view(text);
  std::string out;
  out.reserve(trimmed.size());
  for (const char c : trimmed) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

// True when `needle` occurs in `haystack` without letters/digits glued on either side.
bool contains_word(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return false;
  }
  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
    const std::size_t end = pos + needle.size();
    const bool right_ok = end == haystack.size() || !is_word_char(haystack[end]);
    if (left_ok && right_ok) {
      return true;
    }
    pos = haystack.find(needle, pos + 1);
  }
  return false;
}

bool parse_double(std::string_view text, double& value) {
  text = astrochart::core::detail::trim_view(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  return ec == std::errc() && ptr == last && !text.empty();
}

}  // namespace

CityTable default_city_table() {
  return CityTable{
      {"mumbai, india", {19.0760, 72.8777}},
      {"delhi, india", {28.7041, 77.1025}},
      {"bangalore, india", {12.9716, 77.5946}},
      {"hyderabad, india", {17.3850, 78.4867}},
      {"ahmedabad, india", {23.0225, 72.5714}},
      {"chennai, india", {13.0827, 80.2707}},
      {"kolkata, india", {22.5726, 88.3639}},
      {"pune, india", {18.5204, 73.8567}},
      {"jaipur, india", {26.9124, 75.7873}},
      {"lucknow, india", {26.8467, 80.9462}},
      {"kanpur, india", {26.4499, 80.3319}},
      {"nagpur, india", {21.1458, 79.0882}},
      {"indore, india", {22.7196, 75.8577}},
      {"thane, india", {19.2183, 72.9781}},
      {"bhopal, india", {23.2599, 77.4126}},
      {"visakhapatnam, india", {17.6868, 83.2185}},
      {"pimpri-chinchwad, india", {18.6298, 73.7997}},
      {"patna, india", {25.5941, 85.1376}},
      {"vadodara, india", {22.3072, 73.1812}},
      {"ghaziabad, india", {28.6692, 77.4538}},
      {"new york, usa", {40.7128, -74.0060}},
      {"london, uk", {51.5074, -0.1278}},
      {"tokyo, japan", {35.6762, 139.6503}},
      {"paris, france", {48.8566, 2.3522}},
      {"sydney, australia", {-33.8688, 151.2093}},
      {"toronto, canada", {43.6532, -79.3832}},
      {"dubai, uae", {25.2048, 55.2708}},
      {"singapore", {1.3521, 103.8198}},
      {"hong kong", {22.3193, 114.1694}},
      {"los angeles, usa", {34.0522, -118.2437}},
      {"chicago, usa", {41.8781, -87.6298}},
      {"berlin, germany", {52.5200, 13.4050}},
      {"madrid, spain", {40.4168, -3.7038}},
      {"rome, italy", {41.9028, 12.4964}},
      {"moscow, russia", {55.7558, 37.6176}},
      {"beijing, china", {39.9042, 116.4074}},
      {"shanghai, china", {31.2304, 121.4737}},
      {"seoul, south korea", {37.5665, 126.9780}},
      {"bangkok, thailand", {13.7563, 100.5018}},
      {"kuala lumpur, malaysia", {3.1390, 101.6869}},
      {"jakarta, indonesia", {-6.2088, 106.8456}},
      {"manila, philippines", {14.5995, 120.9842}},
      {"cairo, egypt", {30.0444, 31.2357}},
      {"johannesburg, south africa", {-26.2041, 28.0473}},
      {"lagos, nigeria", {6.5244, 3.3792}},
      {"nairobi, kenya", {-1.2921, 36.8219}},
      {"buenos aires, argentina", {-34.6118, -58.3960}},
      {"sao paulo, brazil", {-23.5558, -46.6396}},
      {"mexico city, mexico", {19.4326, -99.1332}},
      {"lima, peru", {-12.0464, -77.0428}},
      {"bogota, colombia", {4.7110, -74.0721}},
      {"santiago, chile", {-33.4489, -70.6693}},
      {"caracas, venezuela", {10.4806, -66.9036}},
      {"montevideo, uruguay", {-34.9011, -56.1645}},
      {"quito, ecuador", {-0.1807, -78.4678}},
      {"la paz, bolivia", {-16.5000, -68.1193}},
      {"asuncion, paraguay", {-25.2637, -57.5759}},
      {"georgetown, guyana", {6.8013, -58.1551}},
      {"paramaribo, suriname", {5.8520, -55.2038}},
      {"cayenne, french guiana", {4.9333, -52.3333}},
  };
}

bool load_city_table(const std::string& path, CityTable* out) {
  if (out == nullptr) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    return false;
  }

  CityTable parsed;
  std::string line;
  while (std::getline(in, line)) {
    const std::string_view view = astrochart::core::detail::trim_view(line);
    if (view.empty() || view.front() == '#') {
      continue;
    }
    // Coordinates are the last two fields; the name itself may contain commas.
    const std::size_t lon_sep = view.rfind(',');
    if (lon_sep == std::string_view::npos || lon_sep == 0) {
      return false;
    }
    const std::size_t lat_sep = view.rfind(',', lon_sep - 1);
    if (lat_sep == std::string_view::npos) {
      return false;
    }
    std::string name = normalize_place(view.substr(0, lat_sep));
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
      name = name.substr(1, name.size() - 2);
    }
    const std::string_view lat_text = view.substr(lat_sep + 1, lon_sep - lat_sep - 1);
    const std::string_view lon_text = view.substr(lon_sep + 1);
    if (parsed.empty() && name == "name" && astrochart::core::detail::trim_view(lat_text) == "lat") {
      continue;
    }

    CityEntry entry{.key = std::move(name), .coordinate = {}};
    if (entry.key.empty() || !parse_double(lat_text, entry.coordinate.latitude_deg) ||
        !parse_double(lon_text, entry.coordinate.longitude_deg) || !astrochart::core::is_valid(entry.coordinate)) {
      return false;
    }
    parsed.push_back(std::move(entry));
  }

  if (parsed.empty()) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

std::string city_token(std::string_view key) {
  const std::size_t comma = key.find(',');
  return std::string(astrochart::core::detail::trim_view(key.substr(0, comma)));
}

CoordinateResolver::CoordinateResolver() : CoordinateResolver(default_city_table(), Config{}) {}

CoordinateResolver::CoordinateResolver(CityTable table) : CoordinateResolver(std::move(table), Config{}) {}

CoordinateResolver::CoordinateResolver(CityTable table, Config config) : table_(std::move(table)), config_(config) {}

Resolution CoordinateResolver::resolve(std::string_view place) const {
  const std::string query = normalize_place(place);
  if (query.empty()) {
    return Resolution{.coordinate = config_.fallback, .matched_key = {}, .found = false};
  }

  for (const auto& entry : table_) {
    if (entry.key == query) {
      return Resolution{.coordinate = entry.coordinate, .matched_key = entry.key, .found = true};
    }
  }

  for (const auto& entry : table_) {
    const std::string token = city_token(entry.key);
    if (token.empty()) {
      continue;
    }
    if (contains_word(query, token) || token.find(query) != std::string::npos) {
      return Resolution{.coordinate = entry.coordinate, .matched_key = entry.key, .found = true};
    }
  }

  return Resolution{.coordinate = config_.fallback, .matched_key = {}, .found = false};
}

}  // namespace astrochart::geo
