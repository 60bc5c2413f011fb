/**
 * @file zodiac.hpp
 * @brief Static metadata for planets, signs and nakshatras plus sign placement.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

#include "astrochart/core/angles.hpp"
#include "astrochart/core/constants.hpp"
#include "astrochart/core/types.hpp"

namespace astrochart::core {

struct PlanetInfo {
  std::string_view name;
  std::string_view symbol;
  std::string_view sanskrit;
};

struct SignInfo {
  std::string_view name;
  std::string_view symbol;
  std::string_view sanskrit;
  std::string_view element;
};

inline constexpr std::array<PlanetInfo, kPlanetCount> kPlanetTable{{
    {"Sun", "☉", "सूर्य"},
    {"Moon", "☽", "चंद्र"},
    {"Mercury", "☿", "बुध"},
    {"Venus", "♀", "शुक्र"},
    {"Mars", "♂", "मंगल"},
    {"Jupiter", "♃", "गुरु"},
    {"Saturn", "♄", "शनि"},
    {"Rahu", "☊", "राहु"},
    {"Ketu", "☋", "केतु"},
}};

inline constexpr std::array<SignInfo, 12> kSignTable{{
    {"Aries", "♈", "मेष", "Fire"},
    {"Taurus", "♉", "वृषभ", "Earth"},
    {"Gemini", "♊", "मिथुन", "Air"},
    {"Cancer", "♋", "कर्क", "Water"},
    {"Leo", "♌", "सिंह", "Fire"},
    {"Virgo", "♍", "कन्या", "Earth"},
    {"Libra", "♎", "तुला", "Air"},
    {"Scorpio", "♏", "वृश्चिक", "Water"},
    {"Sagittarius", "♐", "धनु", "Fire"},
    {"Capricorn", "♑", "मकर", "Earth"},
    {"Aquarius", "♒", "कुंभ", "Air"},
    {"Pisces", "♓", "मीन", "Water"},
}};

inline constexpr std::array<std::string_view, 27> kNakshatraNames{
    "Ashwini",       "Bharani",          "Krittika",          "Rohini",   "Mrigashira", "Ardra",     "Punarvasu",
    "Pushya",        "Ashlesha",         "Magha",             "Purva Phalguni", "Uttara Phalguni", "Hasta", "Chitra",
    "Swati",         "Vishakha",         "Anuradha",          "Jyeshtha", "Mula",       "Purva Ashadha", "Uttara Ashadha",
    "Shravana",      "Dhanishta",        "Shatabhisha",       "Purva Bhadrapada", "Uttara Bhadrapada", "Revati"};

inline constexpr std::array<Planet, kClassicalPlanetCount> kClassicalPlanets{
    Planet::Sun, Planet::Moon, Planet::Mercury, Planet::Venus, Planet::Mars, Planet::Jupiter, Planet::Saturn};

inline constexpr std::array<Planet, kPlanetCount> kAllPlanets{Planet::Sun,     Planet::Moon,   Planet::Mercury,
                                                             Planet::Venus,   Planet::Mars,   Planet::Jupiter,
                                                             Planet::Saturn,  Planet::Rahu,   Planet::Ketu};

/**
 * @brief Ruling planet per sign, indexed by sign index.
 */
using SignLords = std::array<Planet, 12>;

inline constexpr SignLords kDefaultSignLords{Planet::Mars,    Planet::Venus,   Planet::Mercury, Planet::Moon,
                                             Planet::Sun,     Planet::Mercury, Planet::Venus,   Planet::Mars,
                                             Planet::Jupiter, Planet::Saturn,  Planet::Saturn,  Planet::Jupiter};

inline const PlanetInfo& planet_info(Planet p) { return kPlanetTable[static_cast<std::size_t>(p)]; }
inline const SignInfo& sign_info(ZodiacSign s) { return kSignTable[static_cast<std::size_t>(s)]; }
inline std::string_view planet_name(Planet p) { return planet_info(p).name; }
inline std::string_view sign_name(ZodiacSign s) { return sign_info(s).name; }

inline bool is_classical(Planet p) { return static_cast<int>(p) < kClassicalPlanetCount; }

/**
 * @brief Sign index in [0,11] for any longitude (wrapped first).
 */
inline int sign_index(double longitude_deg) {
  const int idx = static_cast<int>(std::floor(normalize_deg(longitude_deg) / constants::kSignSpanDeg));
  return ((idx % 12) + 12) % 12;
}

inline ZodiacSign sign_from_index(int index) { return static_cast<ZodiacSign>(((index % 12) + 12) % 12); }

inline ZodiacPlacement zodiac_placement(double longitude_deg) {
  const double lon = normalize_deg(longitude_deg);
  const int idx = sign_index(lon);
  double deg = lon - static_cast<double>(idx) * constants::kSignSpanDeg;
  if (deg < 0.0) {
    deg = 0.0;
  }
  return ZodiacPlacement{.sign = sign_from_index(idx), .sign_index = idx, .degree_in_sign = deg};
}

namespace detail {

inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

/**
 * @brief Case-insensitive lookup by English name.
 */
inline std::optional<Planet> planet_from_name(std::string_view name) {
  for (std::size_t i = 0; i < kPlanetTable.size(); ++i) {
    if (detail::iequals(kPlanetTable[i].name, name)) {
      return static_cast<Planet>(i);
    }
  }
  return std::nullopt;
}

inline std::optional<ZodiacSign> sign_from_name(std::string_view name) {
  for (std::size_t i = 0; i < kSignTable.size(); ++i) {
    if (detail::iequals(kSignTable[i].name, name)) {
      return static_cast<ZodiacSign>(i);
    }
  }
  return std::nullopt;
}

inline std::string to_string(Planet p) { return std::string(planet_name(p)); }
inline std::string to_string(ZodiacSign s) { return std::string(sign_name(s)); }

inline std::string_view to_string(WarningCode c) {
  switch (c) {
    case WarningCode::LocationNotFound:
      return "location_not_found";
    case WarningCode::EphemerisUnavailable:
      return "ephemeris_unavailable";
    case WarningCode::HouseSystemFallback:
      return "house_system_fallback";
    case WarningCode::RulesFileIgnored:
      return "rules_file_ignored";
  }
  return "unknown";
}

inline std::string_view to_string(Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::NotImplemented:
      return "not_implemented";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

}  // namespace astrochart::core
