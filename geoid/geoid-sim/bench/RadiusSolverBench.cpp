// Ticket: 0005_surface_sampler

#include <benchmark/benchmark.h>
#include <random>
#include <vector>

#include "geoid-sim/src/DataTypes/Coordinate.hpp"
#include "geoid-sim/src/Physics/Equipotential/EquipotentialRadiusSolver.hpp"
#include "geoid-sim/src/Physics/Equipotential/SeaLevel.hpp"
#include "geoid-sim/src/Physics/Equipotential/SurfaceSampler.hpp"
#include "geoid-sim/src/Physics/PotentialField/MassDistribution.hpp"
#include "geoid-sim/src/Physics/PotentialField/RotatingAxialField.hpp"

using namespace geoid_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Random unit directions with a fixed seed for reproducible runs
std::vector<Coordinate> generateDirections(size_t count)
{
  static std::mt19937 rng{42};
  std::normal_distribution<double> dist{0.0, 1.0};

  std::vector<Coordinate> directions;
  directions.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    Coordinate const v{dist(rng), dist(rng), dist(rng)};
    directions.emplace_back(v.normalized());
  }
  return directions;
}

RotatingAxialField makeTaperedEgg()
{
  RotatingAxialField field;
  field.setMasses(MassDistribution::taperedPoles(4.0, 0.2));
  field.setOmega(0.02);
  return field;
}

}  // namespace

// ============================================================================
// Field evaluation
// ============================================================================

static void BM_Potential_TaperedEgg(benchmark::State& state)
{
  auto field = makeTaperedEgg();
  Coordinate const p{3.0, 1.2, -2.5};

  for (auto _ : state)
  {
    double v = field.getPotential(p);
    benchmark::DoNotOptimize(v);
  }
}
BENCHMARK(BM_Potential_TaperedEgg);

static void BM_Gradient_TaperedEgg(benchmark::State& state)
{
  auto field = makeTaperedEgg();
  Coordinate const p{3.0, 1.2, -2.5};

  for (auto _ : state)
  {
    Vector3D g = field.getGradient(p);
    benchmark::DoNotOptimize(g);
  }
}
BENCHMARK(BM_Gradient_TaperedEgg);

// ============================================================================
// Surface update (one solve per mesh vertex)
// ============================================================================

/**
 * @brief Cost of refreshing every vertex of an ocean mesh.
 *
 * The argument is the vertex count. A 128x128 sphere has about 16k vertices,
 * the size the interactive scenes refresh on every parameter change.
 */
static void BM_SurfaceUpdate_TwoMassEgg(benchmark::State& state)
{
  auto const count = static_cast<size_t>(state.range(0));
  RotatingAxialField field;
  EquipotentialRadiusSolver const solver;
  SurfaceSampler const sampler{field, solver};
  auto const directions = generateDirections(count);
  std::vector<double> radii(count);
  double const target = SeaLevel::calibrate(field,
                                            SeaLevel::kDefaultReferencePoint,
                                            SeaLevel::kEggInitialFactor)
                          .initial;

  for (auto _ : state)
  {
    sampler.solveRadii(directions, target, radii);
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}
BENCHMARK(BM_SurfaceUpdate_TwoMassEgg)->Arg(1024)->Arg(16641)->Arg(66049);

static void BM_SurfaceUpdate_TaperedEgg(benchmark::State& state)
{
  auto const count = static_cast<size_t>(state.range(0));
  auto field = makeTaperedEgg();
  EquipotentialRadiusSolver const solver;
  SurfaceSampler const sampler{field, solver};
  auto const directions = generateDirections(count);
  std::vector<double> radii(count);
  double const target = SeaLevel::calibrate(field,
                                            SeaLevel::kDefaultReferencePoint,
                                            SeaLevel::kEggInitialFactor)
                          .initial;

  for (auto _ : state)
  {
    sampler.solveRadii(directions, target, radii);
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}
BENCHMARK(BM_SurfaceUpdate_TaperedEgg)->Arg(1024)->Arg(16641);
