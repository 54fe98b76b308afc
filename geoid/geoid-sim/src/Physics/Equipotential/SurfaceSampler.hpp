// Ticket: 0005_surface_sampler

#ifndef GEOID_SIM_PHYSICS_SURFACE_SAMPLER_HPP
#define GEOID_SIM_PHYSICS_SURFACE_SAMPLER_HPP

#include <span>

#include "geoid-sim/src/DataTypes/Coordinate.hpp"
#include "geoid-sim/src/DataTypes/Vector3D.hpp"
#include "geoid-sim/src/Physics/Equipotential/EquipotentialRadiusSolver.hpp"
#include "geoid-sim/src/Physics/PotentialField/PotentialField.hpp"

namespace geoid_sim
{

/**
 * @brief Batch and per-point access to an equipotential surface
 *
 * Holds references to a field and a solver; both must outlive the sampler.
 * A batch call reads the field configuration once per direction, so the
 * configuration must stay fixed for the duration of the call.
 */
class SurfaceSampler
{
public:
  SurfaceSampler(const PotentialField& field,
                 const EquipotentialRadiusSolver& solver);

  /**
   * @brief Solve one radius per direction
   * @throws std::invalid_argument if radii.size() != directions.size()
   */
  void solveRadii(std::span<const Coordinate> directions,
                  double targetPotential,
                  std::span<double> radii) const;

  /**
   * @brief Place each direction on the surface (radius * direction)
   * @throws std::invalid_argument if points.size() != directions.size()
   */
  void projectToSurface(std::span<const Coordinate> directions,
                        double targetPotential,
                        std::span<Coordinate> points) const;

  /**
   * @brief Move a point radially onto the surface
   *
   * A point at the origin has no direction; it is snapped along +y.
   */
  [[nodiscard]] Coordinate snapToSurface(const Coordinate& position,
                                         double targetPotential) const;

  /**
   * @brief Unit "up" direction at a point (normalized field gradient)
   *
   * Returns +y when the gradient vanishes.
   */
  [[nodiscard]] Vector3D surfaceNormal(const Coordinate& position) const;

  /// Largest radius in a sampled set, 0 for an empty set
  [[nodiscard]] static double maxRadius(std::span<const double> radii);

private:
  const PotentialField& field_;
  const EquipotentialRadiusSolver& solver_;
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_SURFACE_SAMPLER_HPP
