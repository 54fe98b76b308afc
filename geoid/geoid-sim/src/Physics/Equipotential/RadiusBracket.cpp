// Ticket: 0002_equipotential_radius_solver

#include "geoid-sim/src/Physics/Equipotential/RadiusBracket.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace geoid_sim
{

bool RadiusBracket::isValid() const
{
  return std::isfinite(rMin) && std::isfinite(rMax) && rMin >= 0.0 &&
         rMin < rMax;
}

RadiusBracket RadiusBracket::defaults()
{
  return RadiusBracket{3.0, 8.0};
}

RadiusBracket RadiusBracket::fromMassScale(std::span<const PointMass> masses,
                                           double innerFactor,
                                           double outerFactor)
{
  double extent = 0.0;
  for (const auto& pointMass : masses)
  {
    extent = std::max(extent, std::abs(pointMass.y));
  }
  const double scale = extent + 1.0;

  RadiusBracket bracket{innerFactor * scale, outerFactor * scale};
  if (!bracket.isValid())
  {
    throw std::invalid_argument(std::format(
      "RadiusBracket: invalid bracket [{}, {}] from factors ({}, {})",
      bracket.rMin,
      bracket.rMax,
      innerFactor,
      outerFactor));
  }
  return bracket;
}

}  // namespace geoid_sim
