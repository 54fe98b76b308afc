#ifndef GEOID_SIM_VECTOR3D_HPP
#define GEOID_SIM_VECTOR3D_HPP

#include "geoid-sim/src/DataTypes/Vec3DBase.hpp"
#include "geoid-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace geoid_sim
{

/**
 * @brief Generic 3D vector type
 *
 * Returned by field gradient evaluation. Kept distinct from Coordinate so
 * that a gradient is never passed where a query point is expected.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Vector3D(const Vector3D&) = default;
  Vector3D(Vector3D&&) noexcept = default;
  Vector3D& operator=(const Vector3D&) = default;
  Vector3D& operator=(Vector3D&&) noexcept = default;
  ~Vector3D() = default;
};

}  // namespace geoid_sim

template <>
struct std::formatter<geoid_sim::Vector3D>
  : geoid_sim::detail::Vec3FormatterBase<geoid_sim::Vector3D>
{
};

#endif  // GEOID_SIM_VECTOR3D_HPP
