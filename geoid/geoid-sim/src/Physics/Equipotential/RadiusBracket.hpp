// Ticket: 0002_equipotential_radius_solver

#ifndef GEOID_SIM_PHYSICS_RADIUS_BRACKET_HPP
#define GEOID_SIM_PHYSICS_RADIUS_BRACKET_HPP

#include <span>

#include "geoid-sim/src/Physics/PotentialField/PointMass.hpp"

namespace geoid_sim
{

/**
 * @brief Radial search interval [rMin, rMax] for the equipotential solve
 *
 * The solver assumes the potential increases monotonically with radius over
 * the whole bracket. The defaults [3, 8] cover the ocean of the egg and
 * sphere scenes: just inside the solid surface out to the outer disk.
 */
struct RadiusBracket
{
  double rMin{3.0};
  double rMax{8.0};

  [[nodiscard]] double width() const
  {
    return rMax - rMin;
  }

  [[nodiscard]] double midpoint() const
  {
    return (rMin + rMax) * 0.5;
  }

  /// True when 0 <= rMin < rMax and both bounds are finite
  [[nodiscard]] bool isValid() const;

  /// The [3, 8] bracket tuned for the egg and sphere scenes
  static RadiusBracket defaults();

  /**
   * @brief Scale a bracket to the extent of a mass layout
   *
   * The characteristic scale is s = max|y_i| + 1, so a lone mass at the
   * origin has unit scale. The bracket is [innerFactor * s, outerFactor * s].
   *
   * @param masses Mass layout (may be empty, giving s = 1)
   * @param innerFactor Multiplier for rMin
   * @param outerFactor Multiplier for rMax
   * @throws std::invalid_argument if the resulting bracket is not valid
   */
  static RadiusBracket fromMassScale(std::span<const PointMass> masses,
                                     double innerFactor,
                                     double outerFactor);

  bool operator==(const RadiusBracket&) const = default;
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_RADIUS_BRACKET_HPP
