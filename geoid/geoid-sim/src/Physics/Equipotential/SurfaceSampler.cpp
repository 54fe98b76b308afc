// Ticket: 0005_surface_sampler

#include "geoid-sim/src/Physics/Equipotential/SurfaceSampler.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <stdexcept>

#include "geoid-sim/src/Utils/utils.hpp"

namespace geoid_sim
{

SurfaceSampler::SurfaceSampler(const PotentialField& field,
                               const EquipotentialRadiusSolver& solver)
  : field_{field}, solver_{solver}
{
}

void SurfaceSampler::solveRadii(std::span<const Coordinate> directions,
                                double targetPotential,
                                std::span<double> radii) const
{
  if (radii.size() != directions.size())
  {
    throw std::invalid_argument(
      std::format("SurfaceSampler: {} directions but {} radius slots",
                  directions.size(),
                  radii.size()));
  }

  for (size_t i = 0; i < directions.size(); ++i)
  {
    radii[i] = solver_.solveRadius(field_, directions[i], targetPotential);
  }
}

void SurfaceSampler::projectToSurface(std::span<const Coordinate> directions,
                                      double targetPotential,
                                      std::span<Coordinate> points) const
{
  if (points.size() != directions.size())
  {
    throw std::invalid_argument(
      std::format("SurfaceSampler: {} directions but {} point slots",
                  directions.size(),
                  points.size()));
  }

  for (size_t i = 0; i < directions.size(); ++i)
  {
    const double r = solver_.solveRadius(field_, directions[i], targetPotential);
    points[i] = directions[i] * r;
  }
}

Coordinate SurfaceSampler::snapToSurface(const Coordinate& position,
                                         double targetPotential) const
{
  Coordinate direction{0.0, 1.0, 0.0};
  const double length = position.norm();
  if (isNearlyZero(length))
  {
    spdlog::warn("SurfaceSampler: cannot snap the origin, using +y");
  }
  else
  {
    direction = position / length;
  }

  const double r = solver_.solveRadius(field_, direction, targetPotential);
  return Coordinate{direction * r};
}

Vector3D SurfaceSampler::surfaceNormal(const Coordinate& position) const
{
  const Vector3D gradient = field_.getGradient(position);
  const double length = gradient.norm();
  if (isNearlyZero(length))
  {
    spdlog::warn("SurfaceSampler: vanishing gradient at {}, using +y",
                 std::format("{:.4f}", position));
    return Vector3D{0.0, 1.0, 0.0};
  }
  return Vector3D{gradient / length};
}

double SurfaceSampler::maxRadius(std::span<const double> radii)
{
  if (radii.empty())
  {
    return 0.0;
  }
  return *std::max_element(radii.begin(), radii.end());
}

}  // namespace geoid_sim
