#ifndef GEOID_SIM_COORDINATE_HPP
#define GEOID_SIM_COORDINATE_HPP

#include "geoid-sim/src/DataTypes/Vec3DBase.hpp"
#include "geoid-sim/src/DataTypes/Vec3FormatterBase.hpp"

namespace geoid_sim
{

/**
 * @brief A point in the body-fixed rotating frame
 *
 * Used for field query points, ray directions and surface points. The
 * rotation axis is y; point masses always sit at (0, y, 0).
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

}  // namespace geoid_sim

template <>
struct std::formatter<geoid_sim::Coordinate>
  : geoid_sim::detail::Vec3FormatterBase<geoid_sim::Coordinate>
{
};

#endif  // GEOID_SIM_COORDINATE_HPP
