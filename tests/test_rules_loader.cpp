/**
 * @file test_rules_loader.cpp
 * @brief Rules asset parsing and rejection of malformed tables.
 * @author Watosn
 */

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "astrochart/vedic/rules.hpp"

namespace {

using astrochart::core::Planet;
using astrochart::core::ZodiacSign;

bool same_rules(const astrochart::vedic::RulesTable& a, const astrochart::vedic::RulesTable& b) {
  for (std::size_t i = 0; i < a.dignity.size(); ++i) {
    const auto& x = a.dignity[i];
    const auto& y = b.dignity[i];
    if (x.exaltation != y.exaltation || x.debilitation != y.debilitation || x.own != y.own || x.friendly != y.friendly ||
        x.enemy != y.enemy) {
      return false;
    }
  }
  for (std::size_t i = 0; i < a.dasha_cycle.size(); ++i) {
    if (a.dasha_cycle[i].planet != b.dasha_cycle[i].planet || a.dasha_cycle[i].years != b.dasha_cycle[i].years) {
      return false;
    }
  }
  return a.sign_lords == b.sign_lords && a.nakshatra_lords == b.nakshatra_lords;
}

}  // namespace

int main() {
  using namespace astrochart::vedic;
  const RulesTable defaults = default_rules();

  const auto asset = std::filesystem::path(ASTROCHART_SOURCE_DIR) / "data" / "rules" / "vedic_rules.txt";
  RulesTable loaded{};
  if (!load_rules_from_file(asset.string(), &loaded)) {
    spdlog::error("failed to load rules asset: {}", asset.string());
    return 1;
  }
  if (!same_rules(loaded, defaults)) {
    spdlog::error("rules asset differs from the built-in table");
    return 2;
  }

  RulesTable custom = defaults;
  const std::string override_text =
      "# Saturn exalted in Capricorn for this tradition\n"
      "dignity Saturn Capricorn Cancer Aquarius - -\n"
      "lord Aquarius Saturn\n";
  if (!parse_rules(override_text, &custom)) {
    spdlog::error("override rejected");
    return 3;
  }
  if (custom.dignity_for(Planet::Saturn).exaltation != ZodiacSign::Capricorn ||
      custom.dignity_for(Planet::Saturn).own.size() != 1U || !custom.dignity_for(Planet::Saturn).friendly.empty() ||
      custom.dignity_for(Planet::Sun).exaltation != ZodiacSign::Aries) {
    spdlog::error("override not applied on top of defaults");
    return 4;
  }

  const std::string rejected[] = {
      "dignity Saturn Capricorn\n",                                   // too few fields
      "dignity Rahu Gemini Sagittarius - - -\n",                      // nodes carry no dignity
      "dignity Sun Arie Libra Leo - -\n",                             // unknown sign
      "lord Leo Pluto\n",                                             // unknown planet
      "nakshatra_lord 27 Ketu\n",                                     // index out of range
      "retrograde Mars\n",                                            // unknown record
      "dasha Ketu 7\n",                                               // incomplete cycle
      "dasha Ketu 8\ndasha Venus 20\ndasha Sun 6\ndasha Moon 10\ndasha Mars 7\n"
      "dasha Rahu 18\ndasha Jupiter 16\ndasha Saturn 19\ndasha Mercury 17\n",  // sums to 121
      "dasha Ketu 7\ndasha Ketu 20\ndasha Sun 6\ndasha Moon 10\ndasha Mars 7\n"
      "dasha Rahu 18\ndasha Jupiter 16\ndasha Saturn 19\ndasha Mercury 17\n",  // repeated planet
      "dasha Ketu seven\n",
  };
  for (const auto& text : rejected) {
    RulesTable untouched = custom;
    if (parse_rules(text, &untouched)) {
      spdlog::error("malformed rules accepted: {}", text);
      return 5;
    }
    if (!same_rules(untouched, custom)) {
      spdlog::error("rejected rules modified the table");
      return 6;
    }
  }

  // A cycle in a different order is accepted and replaces the default order.
  RulesTable reordered = defaults;
  const std::string cycle =
      "dasha Venus 20\ndasha Sun 6\ndasha Moon 10\ndasha Mars 7\ndasha Rahu 18\n"
      "dasha Jupiter 16\ndasha Saturn 19\ndasha Mercury 17\ndasha Ketu 7\n";
  if (!parse_rules(cycle, &reordered) || reordered.dasha_cycle[0].planet != Planet::Venus ||
      reordered.dasha_years(Planet::Ketu) != 7.0 || reordered.dasha_cycle_years() != 120.0) {
    spdlog::error("reordered dasha cycle rejected");
    return 7;
  }

  RulesTable missing = defaults;
  if (load_rules_from_file((std::filesystem::path(ASTROCHART_SOURCE_DIR) / "data" / "rules" / "nope.txt").string(), &missing) ||
      !same_rules(missing, defaults) || parse_rules("lord Leo Sun\n", nullptr)) {
    spdlog::error("missing file or null output handled wrong");
    return 8;
  }

  return 0;
}
