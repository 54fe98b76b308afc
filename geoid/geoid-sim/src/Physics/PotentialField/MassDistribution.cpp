// Ticket: 0003_tapered_pole_masses

#include "geoid-sim/src/Physics/PotentialField/MassDistribution.hpp"

#include <numeric>
#include <stdexcept>
#include <string>

namespace geoid_sim::MassDistribution
{

std::vector<PointMass> twoMassEgg()
{
  return {PointMass{-1.5, 4.0}, PointMass{2.0, 2.0}};
}

std::vector<PointMass> singleCentralMass(double mass)
{
  return {PointMass{0.0, mass}};
}

std::vector<PointMass> taperedPoles(double radius,
                                    double taper,
                                    int poleCount,
                                    double totalMass)
{
  if (radius <= 0.0)
  {
    throw std::invalid_argument("taperedPoles: radius must be positive, got " +
                                std::to_string(radius));
  }
  if (poleCount < 2)
  {
    throw std::invalid_argument("taperedPoles: poleCount must be >= 2, got " +
                                std::to_string(poleCount));
  }
  if (totalMass <= 0.0)
  {
    throw std::invalid_argument("taperedPoles: totalMass must be positive");
  }

  std::vector<PointMass> poles;
  poles.reserve(static_cast<size_t>(poleCount));

  const double lastIndex = static_cast<double>(poleCount - 1);
  for (int i = 0; i < poleCount; ++i)
  {
    const double yNormalized = -1.0 + 2.0 * static_cast<double>(i) / lastIndex;
    const double y = yNormalized * radius * taper;

    // Upper half narrows toward the tip of the egg
    double sliceScale = 1.0;
    if (y > 0.0)
    {
      sliceScale = 1.0 - taper * (y / radius) * 0.6;
    }

    const double sliceRadius = radius * sliceScale;
    poles.push_back(PointMass{y, sliceRadius * sliceRadius});
  }

  const double rawTotal = MassDistribution::totalMass(poles);
  const double scale = totalMass / rawTotal;
  for (auto& pole : poles)
  {
    pole.mass *= scale;
  }

  return poles;
}

double totalMass(std::span<const PointMass> masses)
{
  return std::accumulate(masses.begin(),
                         masses.end(),
                         0.0,
                         [](double acc, const PointMass& p)
                         { return acc + p.mass; });
}

}  // namespace geoid_sim::MassDistribution
