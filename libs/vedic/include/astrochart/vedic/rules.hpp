/**
 * @file rules.hpp
 * @brief Immutable Vedic rules table (dignities, lordships, dasha cycle).
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "astrochart/core/types.hpp"
#include "astrochart/core/zodiac.hpp"

namespace astrochart::vedic {

/**
 * @brief Per-planet dignity signs; an empty list means no sign in that class.
 */
struct DignityRule {
  std::optional<astrochart::core::ZodiacSign> exaltation{};
  std::optional<astrochart::core::ZodiacSign> debilitation{};
  std::vector<astrochart::core::ZodiacSign> own{};
  std::vector<astrochart::core::ZodiacSign> friendly{};
  std::vector<astrochart::core::ZodiacSign> enemy{};
};

struct DashaAllocation {
  astrochart::core::Planet planet{astrochart::core::Planet::Ketu};
  double years{};
};

/**
 * @brief Rules shared read-only by every calculator.
 *
 * `dasha_cycle` lists the Vimshottari order; its allocations sum to the cycle length.
 */
struct RulesTable {
  std::array<DignityRule, astrochart::core::kClassicalPlanetCount> dignity{};
  astrochart::core::SignLords sign_lords{astrochart::core::kDefaultSignLords};
  std::array<astrochart::core::Planet, 27> nakshatra_lords{};
  std::array<DashaAllocation, 9> dasha_cycle{};

  [[nodiscard]] const DignityRule& dignity_for(astrochart::core::Planet p) const {
    return dignity[static_cast<std::size_t>(p)];
  }
  [[nodiscard]] astrochart::core::Planet lord_of(astrochart::core::ZodiacSign s) const {
    return sign_lords[static_cast<std::size_t>(s)];
  }
  [[nodiscard]] double dasha_years(astrochart::core::Planet p) const;
  [[nodiscard]] double dasha_cycle_years() const;
};

/**
 * @brief Compiled-in defaults.
 */
[[nodiscard]] RulesTable default_rules();

/**
 * @brief Apply a rules file on top of the compiled-in defaults.
 *
 * Records: `dignity <planet> <exalt> <debil> <own> <friendly> <enemy>` with sign lists joined by
 * `|` and `-` for none; `lord <sign> <planet>`; `nakshatra_lord <index> <planet>`;
 * `dasha <planet> <years>` (when present, the dasha records replace the whole cycle in file order).
 * `#` starts a comment.
 *
 * @return false and `out` untouched on I/O failure or any unknown/malformed record.
 */
bool load_rules_from_file(const std::string& path, RulesTable* out);

/**
 * @brief Same as load_rules_from_file() for in-memory text.
 */
bool parse_rules(std::string_view text, RulesTable* out);

}  // namespace astrochart::vedic
