// Ticket: 0001_rotating_axial_field

#ifndef GEOID_SIM_PHYSICS_ROTATING_AXIAL_FIELD_HPP
#define GEOID_SIM_PHYSICS_ROTATING_AXIAL_FIELD_HPP

#include <span>
#include <vector>

#include "geoid-sim/src/Physics/PotentialField/FieldConfig.hpp"
#include "geoid-sim/src/Physics/PotentialField/PotentialField.hpp"

namespace geoid_sim
{

/**
 * @brief Effective potential of point masses on the y axis in a frame
 *        rotating uniformly about that axis
 *
 *   V(x, y, z) = -Σ G * m_i / |(x, y - y_i, z)|  -  0.5 * ω² * (x² + z²)
 *
 * The first term is Newtonian gravity (increasing outward, toward zero). The
 * second is the centrifugal potential (decreasing away from the axis).
 *
 * Singularity handling differs between potential and gradient:
 * - getPotential() returns kSingularityPotential as soon as the query point
 *   lies within kSingularityRadius of any mass. The centrifugal term and the
 *   remaining masses are not evaluated.
 * - getGradient() skips masses within kSingularityRadius and keeps summing.
 * Both behaviours shape the extracted surface near the masses and must stay
 * as they are.
 *
 * Configuration follows a single-writer discipline, see FieldConfig.
 *
 * @ticket 0001_rotating_axial_field
 */
class RotatingAxialField final : public PotentialField
{
public:
  /// Distance below which a mass is treated as singular
  static constexpr double kSingularityRadius = 0.1;

  /// Potential returned inside the singular region
  static constexpr double kSingularityPotential = -10000.0;

  /**
   * @brief Construct with the default two-mass egg, G = 1, ω = 0
   */
  RotatingAxialField() = default;

  /**
   * @brief Construct from an explicit configuration
   * @param config Masses, G and ω
   */
  explicit RotatingAxialField(FieldConfig config);

  ~RotatingAxialField() override = default;

  // PotentialField interface implementation
  [[nodiscard]] double getPotential(const Coordinate& point) const override;
  [[nodiscard]] Vector3D getGradient(const Coordinate& point) const override;

  [[nodiscard]] double getPotential(double x, double y, double z) const;
  [[nodiscard]] Vector3D getGradient(double x, double y, double z) const;

  /**
   * @brief Replace the mass list wholesale
   *
   * Non-positive or non-finite masses are accepted as given and reported
   * with a warning.
   */
  void setMasses(std::span<const PointMass> masses);
  void setMasses(std::vector<PointMass>&& masses);
  [[nodiscard]] const std::vector<PointMass>& getMasses() const;

  void setOmega(double omega);
  [[nodiscard]] double getOmega() const;

  void setGravitationalConstant(double g);
  [[nodiscard]] double getGravitationalConstant() const;

  void setConfig(FieldConfig config);
  [[nodiscard]] const FieldConfig& getConfig() const;

  RotatingAxialField(const RotatingAxialField&) = default;
  RotatingAxialField& operator=(const RotatingAxialField&) = default;
  RotatingAxialField(RotatingAxialField&&) noexcept = default;
  RotatingAxialField& operator=(RotatingAxialField&&) noexcept = default;

private:
  static void warnOnSuspiciousMasses(std::span<const PointMass> masses);

  FieldConfig config_{};
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_ROTATING_AXIAL_FIELD_HPP
