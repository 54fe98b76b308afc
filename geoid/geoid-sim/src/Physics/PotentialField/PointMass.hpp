// Ticket: 0001_rotating_axial_field

#ifndef GEOID_SIM_PHYSICS_POINT_MASS_HPP
#define GEOID_SIM_PHYSICS_POINT_MASS_HPP

namespace geoid_sim
{

/**
 * @brief A point mass on the rotation axis, located at (0, y, 0)
 *
 * Mass is expected to be positive. The evaluation path does not validate it.
 */
struct PointMass
{
  double y{0.0};     // Position along the vertical axis
  double mass{0.0};  // Mass in model units (G * mass has units of potential * length)

  bool operator==(const PointMass&) const = default;
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_POINT_MASS_HPP
