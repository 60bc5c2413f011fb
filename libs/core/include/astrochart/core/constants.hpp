/**
 * @file constants.hpp
 * @brief Shared astronomical and chart constants.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace astrochart::core::constants {

inline constexpr double kPi = std::numbers::pi;
inline constexpr double kTwoPi = 2.0 * std::numbers::pi;
inline constexpr double kDegToRad = std::numbers::pi / 180.0;
inline constexpr double kRadToDeg = 180.0 / std::numbers::pi;
inline constexpr double kArcsecToRad = kDegToRad / 3600.0;

inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kDaysPerJulianCentury = 36525.0;
inline constexpr double kDaysPerJulianYear = 365.25;
inline constexpr double kJ2000Jd = 2451545.0;
inline constexpr double kUnixEpochJd = 2440587.5;
inline constexpr double kTtMinusTaiSeconds = 32.184;

inline constexpr double kAstronomicalUnitM = 149597870700.0;
// Mean obliquity of the ecliptic at J2000 (IAU 2006), degrees.
inline constexpr double kObliquityJ2000Deg = 23.43927944;

inline constexpr double kSignSpanDeg = 30.0;
inline constexpr double kNakshatraSpanDeg = 360.0 / 27.0;
inline constexpr double kPadaSpanDeg = kNakshatraSpanDeg / 4.0;
inline constexpr double kDashaCycleYears = 120.0;

// Fallback birth place when a place string cannot be resolved (Mumbai).
inline constexpr double kDefaultLatitudeDeg = 19.0760;
inline constexpr double kDefaultLongitudeDeg = 72.8777;

}  // namespace astrochart::core::constants
