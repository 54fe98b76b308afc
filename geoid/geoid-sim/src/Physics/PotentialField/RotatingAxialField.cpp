// Ticket: 0001_rotating_axial_field

#include "geoid-sim/src/Physics/PotentialField/RotatingAxialField.hpp"

#include <spdlog/spdlog.h>
#include <cmath>
#include <utility>

namespace geoid_sim
{

RotatingAxialField::RotatingAxialField(FieldConfig config)
  : config_{std::move(config)}
{
  warnOnSuspiciousMasses(config_.masses);
}

double RotatingAxialField::getPotential(const Coordinate& point) const
{
  return getPotential(point.x(), point.y(), point.z());
}

Vector3D RotatingAxialField::getGradient(const Coordinate& point) const
{
  return getGradient(point.x(), point.y(), point.z());
}

double RotatingAxialField::getPotential(double x, double y, double z) const
{
  double potential = 0.0;

  // Gravitational potential: -Σ G*m/r
  for (const auto& pointMass : config_.masses)
  {
    const double dy = y - pointMass.y;
    const double dist = std::sqrt(x * x + dy * dy + z * z);
    if (dist < kSingularityRadius)
    {
      return kSingularityPotential;
    }
    potential -= config_.gravitationalConstant * pointMass.mass / dist;
  }

  // Centrifugal potential: -0.5 * ω² * (x² + z²)
  const double omega2 = config_.omega * config_.omega;
  potential -= 0.5 * omega2 * (x * x + z * z);

  return potential;
}

Vector3D RotatingAxialField::getGradient(double x, double y, double z) const
{
  double gx = 0.0;
  double gy = 0.0;
  double gz = 0.0;

  // d(-G*m/r)/dr = G*m/r², directed away from the mass
  for (const auto& pointMass : config_.masses)
  {
    const double dy = y - pointMass.y;
    const double r2 = x * x + dy * dy + z * z;
    const double r = std::sqrt(r2);
    if (r < kSingularityRadius)
    {
      continue;
    }

    const double factor = config_.gravitationalConstant * pointMass.mass / (r2 * r);
    gx += factor * x;
    gy += factor * dy;
    gz += factor * z;
  }

  // d(-0.5*ω²*(x²+z²)) = -ω² * (x, 0, z), directed toward the axis
  const double omega2 = config_.omega * config_.omega;
  gx -= omega2 * x;
  gz -= omega2 * z;

  return Vector3D{gx, gy, gz};
}

void RotatingAxialField::setMasses(std::span<const PointMass> masses)
{
  warnOnSuspiciousMasses(masses);
  config_.masses.assign(masses.begin(), masses.end());
}

void RotatingAxialField::setMasses(std::vector<PointMass>&& masses)
{
  warnOnSuspiciousMasses(masses);
  config_.masses = std::move(masses);
}

const std::vector<PointMass>& RotatingAxialField::getMasses() const
{
  return config_.masses;
}

void RotatingAxialField::setOmega(double omega)
{
  config_.omega = omega;
}

double RotatingAxialField::getOmega() const
{
  return config_.omega;
}

void RotatingAxialField::setGravitationalConstant(double g)
{
  config_.gravitationalConstant = g;
}

double RotatingAxialField::getGravitationalConstant() const
{
  return config_.gravitationalConstant;
}

void RotatingAxialField::setConfig(FieldConfig config)
{
  warnOnSuspiciousMasses(config.masses);
  config_ = std::move(config);
}

const FieldConfig& RotatingAxialField::getConfig() const
{
  return config_;
}

void RotatingAxialField::warnOnSuspiciousMasses(std::span<const PointMass> masses)
{
  for (size_t i = 0; i < masses.size(); ++i)
  {
    if (!std::isfinite(masses[i].mass) || masses[i].mass <= 0.0)
    {
      spdlog::warn("RotatingAxialField: mass[{}] = {} at y = {} is not positive",
                   i, masses[i].mass, masses[i].y);
    }
  }
}

}  // namespace geoid_sim
