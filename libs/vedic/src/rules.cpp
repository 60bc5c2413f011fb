/**
 * @file rules.cpp
 * @brief Rules table defaults and text loader.
 * @author Watosn
 */

#include "astrochart/vedic/rules.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "astrochart/core/constants.hpp"
#include "astrochart/core/time_scales.hpp"

namespace astrochart::vedic {
namespace {

using astrochart::core::Planet;
using astrochart::core::ZodiacSign;
using Z = ZodiacSign;

constexpr std::array<Planet, 9> kNakshatraLordCycle{Planet::Ketu, Planet::Venus,   Planet::Sun,
                                                    Planet::Moon, Planet::Mars,    Planet::Rahu,
                                                    Planet::Jupiter, Planet::Saturn, Planet::Mercury};

std::optional<std::vector<ZodiacSign>> parse_sign_list(const std::string& token) {
  std::vector<ZodiacSign> out;
  if (token == "-") {
    return out;
  }
  for (const auto part : astrochart::core::detail::split(token, '|')) {
    const auto sign = astrochart::core::sign_from_name(part);
    if (!sign.has_value()) {
      return std::nullopt;
    }
    out.push_back(*sign);
  }
  return out;
}

std::optional<std::optional<ZodiacSign>> parse_optional_sign(const std::string& token) {
  if (token == "-") {
    return std::optional<ZodiacSign>{};
  }
  const auto sign = astrochart::core::sign_from_name(token);
  if (!sign.has_value()) {
    return std::nullopt;
  }
  return std::optional<ZodiacSign>{*sign};
}

bool parse_years(const std::string& token, double& years) {
  std::istringstream ss(token);
  ss >> years;
  return !ss.fail() && ss.eof() && years > 0.0 && std::isfinite(years);
}

bool apply_record(const std::vector<std::string>& fields, RulesTable& rules, std::vector<DashaAllocation>& dasha) {
  const std::string& kind = fields.front();
  if (kind == "dignity") {
    if (fields.size() != 7) {
      return false;
    }
    const auto planet = astrochart::core::planet_from_name(fields[1]);
    if (!planet.has_value() || !astrochart::core::is_classical(*planet)) {
      return false;
    }
    const auto exalt = parse_optional_sign(fields[2]);
    const auto debil = parse_optional_sign(fields[3]);
    const auto own = parse_sign_list(fields[4]);
    const auto friendly = parse_sign_list(fields[5]);
    const auto enemy = parse_sign_list(fields[6]);
    if (!exalt || !debil || !own || !friendly || !enemy) {
      return false;
    }
    rules.dignity[static_cast<std::size_t>(*planet)] = DignityRule{
        .exaltation = *exalt, .debilitation = *debil, .own = *own, .friendly = *friendly, .enemy = *enemy};
    return true;
  }
  if (kind == "lord") {
    if (fields.size() != 3) {
      return false;
    }
    const auto sign = astrochart::core::sign_from_name(fields[1]);
    const auto planet = astrochart::core::planet_from_name(fields[2]);
    if (!sign || !planet || !astrochart::core::is_classical(*planet)) {
      return false;
    }
    rules.sign_lords[static_cast<std::size_t>(*sign)] = *planet;
    return true;
  }
  if (kind == "nakshatra_lord") {
    int index = -1;
    if (fields.size() != 3 || !astrochart::core::detail::parse_int_field(fields[1], index) || index < 0 || index > 26) {
      return false;
    }
    const auto planet = astrochart::core::planet_from_name(fields[2]);
    if (!planet) {
      return false;
    }
    rules.nakshatra_lords[static_cast<std::size_t>(index)] = *planet;
    return true;
  }
  if (kind == "dasha") {
    double years = 0.0;
    if (fields.size() != 3 || !parse_years(fields[2], years)) {
      return false;
    }
    const auto planet = astrochart::core::planet_from_name(fields[1]);
    if (!planet) {
      return false;
    }
    dasha.push_back(DashaAllocation{.planet = *planet, .years = years});
    return true;
  }
  return false;
}

}  // namespace

double RulesTable::dasha_years(Planet p) const {
  for (const auto& d : dasha_cycle) {
    if (d.planet == p) {
      return d.years;
    }
  }
  return 0.0;
}

double RulesTable::dasha_cycle_years() const {
  double total = 0.0;
  for (const auto& d : dasha_cycle) {
    total += d.years;
  }
  return total;
}

RulesTable default_rules() {
  RulesTable rules{};
  rules.dignity = {{
      // Sun
      {Z::Aries, Z::Libra, {Z::Leo}, {Z::Cancer, Z::Aries, Z::Scorpio, Z::Sagittarius, Z::Pisces},
       {Z::Taurus, Z::Libra, Z::Capricorn, Z::Aquarius}},
      // Moon
      {Z::Taurus, Z::Scorpio, {Z::Cancer}, {Z::Leo, Z::Gemini, Z::Virgo}, {}},
      // Mercury
      {Z::Virgo, Z::Pisces, {Z::Gemini, Z::Virgo}, {Z::Leo, Z::Taurus, Z::Libra}, {Z::Cancer}},
      // Venus
      {Z::Pisces, Z::Virgo, {Z::Taurus, Z::Libra}, {Z::Gemini, Z::Virgo, Z::Capricorn, Z::Aquarius},
       {Z::Leo, Z::Cancer}},
      // Mars
      {Z::Capricorn, Z::Cancer, {Z::Aries, Z::Scorpio}, {Z::Leo, Z::Cancer, Z::Sagittarius, Z::Pisces},
       {Z::Gemini, Z::Virgo}},
      // Jupiter
      {Z::Cancer, Z::Capricorn, {Z::Sagittarius, Z::Pisces}, {Z::Leo, Z::Cancer, Z::Aries, Z::Scorpio},
       {Z::Gemini, Z::Virgo, Z::Taurus, Z::Libra}},
      // Saturn
      {Z::Libra, Z::Aries, {Z::Capricorn, Z::Aquarius}, {Z::Gemini, Z::Virgo, Z::Taurus, Z::Libra},
       {Z::Leo, Z::Cancer, Z::Aries, Z::Scorpio}},
  }};
  rules.sign_lords = astrochart::core::kDefaultSignLords;
  for (std::size_t i = 0; i < rules.nakshatra_lords.size(); ++i) {
    rules.nakshatra_lords[i] = kNakshatraLordCycle[i % kNakshatraLordCycle.size()];
  }
  rules.dasha_cycle = {{
      {Planet::Ketu, 7.0},
      {Planet::Venus, 20.0},
      {Planet::Sun, 6.0},
      {Planet::Moon, 10.0},
      {Planet::Mars, 7.0},
      {Planet::Rahu, 18.0},
      {Planet::Jupiter, 16.0},
      {Planet::Saturn, 19.0},
      {Planet::Mercury, 17.0},
  }};
  return rules;
}

bool parse_rules(std::string_view text, RulesTable* out) {
  if (out == nullptr) {
    return false;
  }
  RulesTable rules = default_rules();
  std::vector<DashaAllocation> dasha;

  std::istringstream in{std::string(text)};
  std::string line;
  while (std::getline(in, line)) {
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    std::istringstream ss(line);
    std::vector<std::string> fields;
    std::string token;
    while (ss >> token) {
      fields.push_back(token);
    }
    if (fields.empty()) {
      continue;
    }
    if (!apply_record(fields, rules, dasha)) {
      return false;
    }
  }

  if (!dasha.empty()) {
    if (dasha.size() != rules.dasha_cycle.size()) {
      return false;
    }
    std::set<Planet> seen;
    double total = 0.0;
    for (std::size_t i = 0; i < dasha.size(); ++i) {
      seen.insert(dasha[i].planet);
      total += dasha[i].years;
      rules.dasha_cycle[i] = dasha[i];
    }
    if (seen.size() != dasha.size() || std::abs(total - astrochart::core::constants::kDashaCycleYears) > 1e-9) {
      return false;
    }
  }
  // Every nakshatra lord must own a dasha segment.
  for (const Planet lord : rules.nakshatra_lords) {
    if (!(rules.dasha_years(lord) > 0.0)) {
      return false;
    }
  }

  *out = std::move(rules);
  return true;
}

bool load_rules_from_file(const std::string& path, RulesTable* out) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_rules(buffer.str(), out);
}

}  // namespace astrochart::vedic
