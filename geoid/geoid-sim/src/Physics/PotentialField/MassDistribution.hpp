// Ticket: 0003_tapered_pole_masses

#ifndef GEOID_SIM_PHYSICS_MASS_DISTRIBUTION_HPP
#define GEOID_SIM_PHYSICS_MASS_DISTRIBUTION_HPP

#include <span>
#include <vector>

#include "geoid-sim/src/Physics/PotentialField/PointMass.hpp"

namespace geoid_sim
{

/**
 * @brief Builders for the axial mass layouts used by the ocean scenes.
 *
 * A solid body of revolution is approximated by point masses on its axis.
 * Each builder returns a list suitable for RotatingAxialField::setMasses().
 */
namespace MassDistribution
{

/// Two-mass egg: heavy mass below the origin, lighter mass above it.
std::vector<PointMass> twoMassEgg();

/// A single mass at the origin (spherical planet).
std::vector<PointMass> singleCentralMass(double mass = 8.0);

/**
 * @brief Approximate a tapered egg by evenly spaced poles on the y axis.
 *
 * Pole i of n sits at y_i = (-1 + 2i/(n-1)) * radius * taper, so a taper of
 * zero collapses every pole onto the origin. Each pole stands for a
 * cylindrical slice whose radius follows the egg outline:
 *
 *   sliceRadius = radius * (1 - taper * (y / radius) * 0.6)   for y > 0
 *   sliceRadius = radius                                       otherwise
 *
 * and carries mass proportional to sliceRadius². Masses are then rescaled so
 * that they sum to totalMass.
 *
 * @param radius Base radius of the egg (> 0)
 * @param taper Taper factor, 0 for a sphere. The interactive range is [0, 0.5]
 * @param poleCount Number of poles (>= 2)
 * @param totalMass Sum of all pole masses after normalization (> 0)
 * @return Pole masses ordered from bottom to top
 * @throws std::invalid_argument if radius <= 0, poleCount < 2 or totalMass <= 0
 */
std::vector<PointMass> taperedPoles(double radius,
                                    double taper,
                                    int poleCount = 20,
                                    double totalMass = 10.0);

/// Sum of all masses in the list
double totalMass(std::span<const PointMass> masses);

}  // namespace MassDistribution

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_MASS_DISTRIBUTION_HPP
