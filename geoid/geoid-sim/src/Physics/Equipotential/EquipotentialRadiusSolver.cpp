// Ticket: 0002_equipotential_radius_solver

#include "geoid-sim/src/Physics/Equipotential/EquipotentialRadiusSolver.hpp"

#include <spdlog/spdlog.h>
#include <cmath>
#include <format>
#include <stdexcept>

namespace geoid_sim
{

EquipotentialRadiusSolver::EquipotentialRadiusSolver()
  : bracket_{RadiusBracket::defaults()}, iterations_{kDefaultIterations}
{
}

EquipotentialRadiusSolver::EquipotentialRadiusSolver(RadiusBracket bracket,
                                                     int iterations)
  : bracket_{bracket}, iterations_{iterations}
{
  validateBracket(bracket_);
  validateIterations(iterations_);
}

double EquipotentialRadiusSolver::solveRadius(const PotentialField& field,
                                              double dx,
                                              double dy,
                                              double dz,
                                              double targetPotential) const
{
  double rMin = bracket_.rMin;
  double rMax = bracket_.rMax;

  for (int i = 0; i < iterations_; ++i)
  {
    const double rMid = (rMin + rMax) * 0.5;
    const double value =
      field.getPotential(Coordinate{dx * rMid, dy * rMid, dz * rMid});

    // Potential rises with r: below target means the surface is further out
    if (value < targetPotential)
    {
      rMin = rMid;
    }
    else
    {
      rMax = rMid;
    }
  }

  return (rMin + rMax) * 0.5;
}

double EquipotentialRadiusSolver::solveRadius(const PotentialField& field,
                                              const Coordinate& direction,
                                              double targetPotential) const
{
  return solveRadius(
    field, direction.x(), direction.y(), direction.z(), targetPotential);
}

EquipotentialRadiusSolver::SolveResult
EquipotentialRadiusSolver::solveRadiusWithDiagnostics(
  const PotentialField& field,
  const Coordinate& direction,
  double targetPotential) const
{
  SolveResult result;
  result.radius = solveRadius(field, direction, targetPotential);
  result.iterations = iterations_;

  result.potentialAtMin = field.getPotential(Coordinate{direction * bracket_.rMin});
  result.potentialAtMax = field.getPotential(Coordinate{direction * bracket_.rMax});
  result.residual =
    field.getPotential(Coordinate{direction * result.radius}) - targetPotential;

  result.bracketStraddlesTarget = result.potentialAtMin <= targetPotential &&
                                  targetPotential <= result.potentialAtMax;

  if (!result.bracketStraddlesTarget)
  {
    spdlog::debug(
      "EquipotentialRadiusSolver: target {} outside [{}, {}] along {}, "
      "radius {} is not a crossing",
      targetPotential,
      result.potentialAtMin,
      result.potentialAtMax,
      std::format("{:.4f}", direction),
      result.radius);
  }

  return result;
}

double EquipotentialRadiusSolver::precision() const
{
  return bracket_.width() / std::ldexp(1.0, iterations_);
}

void EquipotentialRadiusSolver::setBracket(const RadiusBracket& bracket)
{
  validateBracket(bracket);
  bracket_ = bracket;
}

const RadiusBracket& EquipotentialRadiusSolver::getBracket() const
{
  return bracket_;
}

void EquipotentialRadiusSolver::setIterations(int iterations)
{
  validateIterations(iterations);
  iterations_ = iterations;
}

int EquipotentialRadiusSolver::getIterations() const
{
  return iterations_;
}

void EquipotentialRadiusSolver::validateBracket(const RadiusBracket& bracket)
{
  if (!bracket.isValid())
  {
    throw std::invalid_argument(
      std::format("EquipotentialRadiusSolver: invalid bracket [{}, {}]",
                  bracket.rMin,
                  bracket.rMax));
  }
}

void EquipotentialRadiusSolver::validateIterations(int iterations)
{
  if (iterations < 0)
  {
    throw std::invalid_argument(std::format(
      "EquipotentialRadiusSolver: iterations must be >= 0, got {}", iterations));
  }
}

}  // namespace geoid_sim
