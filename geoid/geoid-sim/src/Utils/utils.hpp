#ifndef GEOID_SIM_UTILS_HPP
#define GEOID_SIM_UTILS_HPP

#include <cmath>
#include <concepts>

namespace geoid_sim
{

// Default tolerance for treating a length as zero
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool isNearlyZero(T value, double tolerance = TOLERANCE)
{
  return std::abs(value) < tolerance;
}

}  // namespace geoid_sim

#endif  // GEOID_SIM_UTILS_HPP
