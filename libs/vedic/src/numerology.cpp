/**
 * @file numerology.cpp
 * @brief Numerology implementation.
 * @author Watosn
 */

#include "astrochart/vedic/numerology.hpp"

#include <cctype>

namespace astrochart::vedic {
namespace {

int digit_sum(int value) {
  int sum = 0;
  while (value > 0) {
    sum += value % 10;
    value /= 10;
  }
  return sum;
}

bool is_vowel(char upper) { return upper == 'A' || upper == 'E' || upper == 'I' || upper == 'O' || upper == 'U'; }

}  // namespace

bool is_master_number(int value) { return value == 11 || value == 22 || value == 33; }

int reduce_number(int value) {
  if (value < 0) {
    return 0;
  }
  while (value > 9 && !is_master_number(value)) {
    value = digit_sum(value);
  }
  return value;
}

int letter_value(char c) {
  const auto u = static_cast<unsigned char>(c);
  if (u >= 0x80 || !std::isalpha(u)) {
    return 0;
  }
  const int offset = std::toupper(u) - 'A';
  return offset % 9 + 1;
}

int life_path_number(const astrochart::core::CivilDateTime& birth) {
  const int year = birth.year < 0 ? -birth.year : birth.year;
  return reduce_number(digit_sum(birth.day) + digit_sum(birth.month) + digit_sum(year));
}

int destiny_number(std::string_view name) {
  int total = 0;
  for (const char c : name) {
    total += letter_value(c);
  }
  return reduce_number(total);
}

int soul_number(std::string_view name) {
  int total = 0;
  for (const char c : name) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x80 && is_vowel(static_cast<char>(std::toupper(u)))) {
      total += letter_value(c);
    }
  }
  return reduce_number(total);
}

NumerologyProfile numerology_profile(std::string_view name, const astrochart::core::CivilDateTime& birth) {
  return NumerologyProfile{
      .life_path = life_path_number(birth),
      .destiny = destiny_number(name),
      .soul = soul_number(name),
      .birth_day = reduce_number(birth.day),
  };
}

}  // namespace astrochart::vedic
