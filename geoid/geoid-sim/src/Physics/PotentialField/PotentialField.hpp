// Ticket: 0001_rotating_axial_field

#ifndef GEOID_SIM_PHYSICS_POTENTIAL_FIELD_HPP
#define GEOID_SIM_PHYSICS_POTENTIAL_FIELD_HPP

#include "geoid-sim/src/DataTypes/Coordinate.hpp"
#include "geoid-sim/src/DataTypes/Vector3D.hpp"

namespace geoid_sim
{

/**
 * @brief Abstract interface for scalar potential fields
 *
 * The equipotential solver and the surface helpers only need to evaluate a
 * potential and its gradient at a point, so they depend on this interface
 * rather than on a concrete mass model.
 *
 * Implementations must be total over finite inputs: evaluation never throws
 * and never allocates, because it is called once per surface vertex.
 *
 * Thread safety: const evaluation is safe to call concurrently as long as no
 * thread mutates the implementation's configuration at the same time.
 */
class PotentialField
{
public:
  virtual ~PotentialField() = default;

  /**
   * @brief Evaluate the scalar potential
   * @param point Query point in the rotating frame
   * @return Potential V(point)
   */
  [[nodiscard]] virtual double getPotential(const Coordinate& point) const = 0;

  /**
   * @brief Evaluate the gradient of the potential
   *
   * The gradient points toward increasing potential, which on an
   * equipotential surface is the outward ("up") normal.
   *
   * @param point Query point in the rotating frame
   * @return Raw (non-normalized) gradient of V at point
   */
  [[nodiscard]] virtual Vector3D getGradient(const Coordinate& point) const = 0;

protected:
  PotentialField() = default;
  PotentialField(const PotentialField&) = default;
  PotentialField& operator=(const PotentialField&) = default;
  PotentialField(PotentialField&&) noexcept = default;
  PotentialField& operator=(PotentialField&&) noexcept = default;
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_POTENTIAL_FIELD_HPP
