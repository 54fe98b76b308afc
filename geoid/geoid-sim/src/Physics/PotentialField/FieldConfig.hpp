// Ticket: 0001_rotating_axial_field

#ifndef GEOID_SIM_PHYSICS_FIELD_CONFIG_HPP
#define GEOID_SIM_PHYSICS_FIELD_CONFIG_HPP

#include <vector>

#include "geoid-sim/src/Physics/PotentialField/PointMass.hpp"

namespace geoid_sim
{

/**
 * @brief Mutable physical parameters of a rotating axial mass model
 *
 * Written by a single controller (parameter changes, geometry changes) and
 * read by every field query. Nothing here is synchronized: the writer must
 * not modify the configuration while a batch of queries (for example one
 * pass over all surface vertices) is in progress, otherwise the batch mixes
 * two configurations.
 *
 * Defaults describe the two-mass egg: a heavy lower mass and a lighter upper
 * mass, G = 1, no rotation.
 */
struct FieldConfig
{
  std::vector<PointMass> masses{{-1.5, 4.0}, {2.0, 2.0}};
  double gravitationalConstant{1.0};  // G
  double omega{0.0};                  // Rotation rate about the y axis [rad/time]
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_FIELD_CONFIG_HPP
