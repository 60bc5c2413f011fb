/**
 * @file numerology.hpp
 * @brief Pythagorean numerology numbers.
 * @author Watosn
 */
#pragma once

#include <string_view>

#include "astrochart/core/types.hpp"

namespace astrochart::vedic {

struct NumerologyProfile {
  int life_path{};
  int destiny{};
  int soul{};
  int birth_day{};
};

[[nodiscard]] bool is_master_number(int value);

/**
 * @brief Repeated digit sum; stops at a single digit or at 11, 22 or 33. Negative input maps to 0.
 */
[[nodiscard]] int reduce_number(int value);

/**
 * @brief Pythagorean letter value (A=1..I=9, J=1..R=9, S=1..Z=8); 0 for anything but ASCII letters.
 */
[[nodiscard]] int letter_value(char c);

[[nodiscard]] int life_path_number(const astrochart::core::CivilDateTime& birth);
[[nodiscard]] int destiny_number(std::string_view name);
[[nodiscard]] int soul_number(std::string_view name);

[[nodiscard]] NumerologyProfile numerology_profile(std::string_view name, const astrochart::core::CivilDateTime& birth);

}  // namespace astrochart::vedic
