// Ticket: 0004_sea_level_calibration

#ifndef GEOID_SIM_PHYSICS_SEA_LEVEL_HPP
#define GEOID_SIM_PHYSICS_SEA_LEVEL_HPP

#include "geoid-sim/src/DataTypes/Coordinate.hpp"
#include "geoid-sim/src/Physics/PotentialField/PotentialField.hpp"

namespace geoid_sim
{

/**
 * @brief Range of useful target potentials for the ocean surface
 *
 * Potentials are negative. min is the deepest (most negative) level and max
 * the shallowest, so min <= initial <= max holds for the default factors.
 */
struct SeaLevelRange
{
  double surfacePotential{0.0};  // V at the reference point on the solid surface
  double initial{0.0};           // Starting sea level
  double min{0.0};               // Deepest selectable level
  double max{0.0};               // Shallowest selectable level
};

namespace SeaLevel
{

/// Equator point of the default scenes
inline const Coordinate kDefaultReferencePoint{4.0, 0.0, 0.0};

/// Egg scene: sea level sits slightly above the surface potential
constexpr double kEggInitialFactor = 1.1;

/// Sphere scene: a thin global ocean
constexpr double kSphereInitialFactor = 1.002;

/**
 * @brief Derive sea-level defaults from the potential at a surface point
 *
 * Every value is a multiple of V(referencePoint). Evaluate this after the
 * masses are configured; the result does not follow later changes.
 *
 * @param field Field with its masses already set
 * @param referencePoint Point on the solid surface
 * @param initialFactor Multiplier for the starting level
 * @param deepFactor Multiplier for the deepest level
 * @param shallowFactor Multiplier for the shallowest level
 */
SeaLevelRange calibrate(const PotentialField& field,
                        const Coordinate& referencePoint,
                        double initialFactor,
                        double deepFactor = 2.0,
                        double shallowFactor = 0.2);

/// Clamp a requested level into [range.min, range.max]
double clamp(const SeaLevelRange& range, double potential);

}  // namespace SeaLevel

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_SEA_LEVEL_HPP
