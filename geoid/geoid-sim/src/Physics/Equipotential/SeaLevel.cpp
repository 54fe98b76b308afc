// Ticket: 0004_sea_level_calibration

#include "geoid-sim/src/Physics/Equipotential/SeaLevel.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace geoid_sim::SeaLevel
{

SeaLevelRange calibrate(const PotentialField& field,
                        const Coordinate& referencePoint,
                        double initialFactor,
                        double deepFactor,
                        double shallowFactor)
{
  SeaLevelRange range;
  range.surfacePotential = field.getPotential(referencePoint);
  range.initial = range.surfacePotential * initialFactor;
  range.min = range.surfacePotential * deepFactor;
  range.max = range.surfacePotential * shallowFactor;

  if (range.min > range.max)
  {
    spdlog::warn("SeaLevel: surface potential {} is not negative, swapping "
                 "range bounds [{}, {}]",
                 range.surfacePotential,
                 range.min,
                 range.max);
    std::swap(range.min, range.max);
  }

  spdlog::debug("SeaLevel: surface {} initial {} range [{}, {}]",
                range.surfacePotential,
                range.initial,
                range.min,
                range.max);
  return range;
}

double clamp(const SeaLevelRange& range, double potential)
{
  return std::clamp(potential, range.min, range.max);
}

}  // namespace geoid_sim::SeaLevel
