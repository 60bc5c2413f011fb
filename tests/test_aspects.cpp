/**
 * @file test_aspects.cpp
 * @brief Aspect classification, symmetry and strength tiers.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "astrochart/chart/aspects.hpp"

namespace {

using astrochart::core::CelestialPosition;
using astrochart::core::Planet;

CelestialPosition at(Planet p, double lon) {
  CelestialPosition c{};
  c.planet = p;
  c.longitude_deg = lon;
  return c;
}

bool same(const std::optional<astrochart::chart::Aspect>& a, const std::optional<astrochart::chart::Aspect>& b) {
  if (a.has_value() != b.has_value()) {
    return false;
  }
  if (!a) {
    return true;
  }
  return a->first == b->first && a->second == b->second && a->type == b->type && a->strength == b->strength &&
         std::abs(a->orb_deg - b->orb_deg) < 1e-12;
}

}  // namespace

int main() {
  using namespace astrochart::chart;

  const auto sextile = detect_pair(at(Planet::Sun, 10.0), at(Planet::Moon, 70.0));
  if (!sextile || sextile->type != AspectType::Sextile || std::abs(sextile->separation_deg - 60.0) > 1e-12 ||
      sextile->orb_deg > 1e-12 || sextile->strength != AspectStrength::VeryStrong) {
    spdlog::error("10/70 should be an exact sextile");
    return 1;
  }

  // Separation across 0 deg uses the short arc.
  const auto conj = detect_pair(at(Planet::Venus, 355.0), at(Planet::Mars, 3.0));
  if (!conj || conj->type != AspectType::Conjunction || std::abs(conj->separation_deg - 8.0) > 1e-9 ||
      conj->strength != AspectStrength::Moderate) {
    spdlog::error("wrapping conjunction wrong");
    return 2;
  }

  const auto opp = detect_pair(at(Planet::Jupiter, 100.0), at(Planet::Saturn, 289.5));
  if (!opp || opp->type != AspectType::Opposition || std::abs(opp->orb_deg - 9.5) > 1e-9 || opp->strength != AspectStrength::Weak) {
    spdlog::error("wide opposition wrong");
    return 3;
  }

  if (detect_pair(at(Planet::Sun, 0.0), at(Planet::Moon, 45.0)).has_value()) {
    spdlog::error("45 deg should not be an aspect");
    return 4;
  }

  // Pairs are reported in canonical order whichever way they are passed.
  for (double a = 0.0; a < 360.0; a += 13.7) {
    for (double b = 0.0; b < 360.0; b += 29.3) {
      const auto ab = detect_pair(at(Planet::Mercury, a), at(Planet::Mars, b));
      const auto ba = detect_pair(at(Planet::Mars, b), at(Planet::Mercury, a));
      if (!same(ab, ba) || (ab && (ab->first != Planet::Mercury || ab->second != Planet::Mars))) {
        spdlog::error("aspect detection not symmetric for {} / {}", a, b);
        return 5;
      }
    }
  }

  if (strength_for_orb(2.0) != AspectStrength::VeryStrong || strength_for_orb(5.0) != AspectStrength::Strong ||
      strength_for_orb(8.0) != AspectStrength::Moderate || strength_for_orb(8.01) != AspectStrength::Weak) {
    spdlog::error("strength tiers wrong");
    return 6;
  }

  // Nodes never take part; each classical pair appears at most once.
  const std::vector<CelestialPosition> positions{
      at(Planet::Sun, 0.0),      at(Planet::Moon, 0.0),   at(Planet::Mercury, 0.0), at(Planet::Venus, 0.0),
      at(Planet::Mars, 0.0),     at(Planet::Jupiter, 0.0), at(Planet::Saturn, 0.0), at(Planet::Rahu, 0.0),
      at(Planet::Ketu, 180.0)};
  const auto all = detect_aspects(positions);
  if (all.size() != 21U) {
    spdlog::error("expected 21 conjunctions among classical bodies, got {}", all.size());
    return 7;
  }
  for (const auto& a : all) {
    if (a.first == Planet::Rahu || a.first == Planet::Ketu || a.second == Planet::Rahu || a.second == Planet::Ketu ||
        !(static_cast<int>(a.first) < static_cast<int>(a.second))) {
      spdlog::error("node or non-canonical pair reported");
      return 8;
    }
  }

  AspectConfig tight{};
  for (auto& rule : tight.rules) {
    rule.orb_deg = 1.0;
  }
  if (detect_pair(at(Planet::Sun, 10.0), at(Planet::Moon, 72.0), tight).has_value()) {
    spdlog::error("configured orb ignored");
    return 9;
  }

  return 0;
}
