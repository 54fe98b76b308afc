/**
 * @file ocean_surface_example.cpp
 * @brief Sweeps the sea-level surface of a tapered egg at several rotation
 *        rates and logs how far the ocean reaches
 */

#include <spdlog/spdlog.h>
#include <cmath>
#include <format>
#include <numbers>
#include <vector>

#include "geoid-sim/src/Physics/Equipotential/EquipotentialRadiusSolver.hpp"
#include "geoid-sim/src/Physics/Equipotential/SeaLevel.hpp"
#include "geoid-sim/src/Physics/Equipotential/SurfaceSampler.hpp"
#include "geoid-sim/src/Physics/PotentialField/MassDistribution.hpp"
#include "geoid-sim/src/Physics/PotentialField/RotatingAxialField.hpp"

using namespace geoid_sim;

namespace
{

// Latitude/longitude grid of unit directions, poles included
std::vector<Coordinate> latLongDirections(int latSteps, int lonSteps)
{
  std::vector<Coordinate> directions;
  for (int i = 0; i <= latSteps; ++i)
  {
    double const theta = std::numbers::pi * i / latSteps;
    for (int j = 0; j < lonSteps; ++j)
    {
      double const phi = 2.0 * std::numbers::pi * j / lonSteps;
      directions.emplace_back(std::sin(theta) * std::cos(phi),
                              std::cos(theta),
                              std::sin(theta) * std::sin(phi));
    }
  }
  return directions;
}

}  // namespace

int main()
{
  spdlog::set_level(spdlog::level::debug);

  constexpr double eggRadius = 4.0;
  constexpr double eggTaper = 0.2;
  // Beyond this radius the surface is drawn as an outer ring or disk
  constexpr double diskRadius = 6.0;

  RotatingAxialField field;
  field.setMasses(MassDistribution::taperedPoles(eggRadius, eggTaper));

  SeaLevelRange const seaLevel = SeaLevel::calibrate(
    field, SeaLevel::kDefaultReferencePoint, SeaLevel::kEggInitialFactor);
  spdlog::info("Sea level {:.4f}, selectable range [{:.4f}, {:.4f}]",
               seaLevel.initial,
               seaLevel.min,
               seaLevel.max);

  EquipotentialRadiusSolver const solver;
  SurfaceSampler const sampler{field, solver};
  auto const directions = latLongDirections(32, 64);
  std::vector<double> radii(directions.size());

  for (double const omega : {0.0, 0.02, 0.05, 0.1, 0.2})
  {
    field.setOmega(omega);
    sampler.solveRadii(directions, seaLevel.initial, radii);

    double const equator = solver.solveRadius(
      field, Coordinate{1.0, 0.0, 0.0}, seaLevel.initial);
    double const north = solver.solveRadius(
      field, Coordinate{0.0, 1.0, 0.0}, seaLevel.initial);
    double const outermost = SurfaceSampler::maxRadius(radii);

    spdlog::info("omega {:.3f}: equator {:.4f}, north pole {:.4f}, max {:.4f}",
                 omega,
                 equator,
                 north,
                 outermost);

    if (outermost > diskRadius)
    {
      spdlog::warn("omega {:.3f}: surface reaches {:.2f}, beyond the disk radius",
                   omega,
                   outermost);
    }

    auto const check = solver.solveRadiusWithDiagnostics(
      field, Coordinate{1.0, 0.0, 0.0}, seaLevel.initial);
    if (!check.bracketStraddlesTarget)
    {
      spdlog::warn("omega {:.3f}: equatorial radius is not a true crossing "
                   "(residual {:.3e})",
                   omega,
                   check.residual);
    }

    Coordinate const ship = sampler.snapToSurface(Coordinate{1.0, 0.3, 0.5},
                                                  seaLevel.initial);
    spdlog::debug("ship at {} up {}",
                  std::format("{:.3f}", ship),
                  std::format("{:.3f}", sampler.surfaceNormal(ship)));
  }

  return 0;
}
