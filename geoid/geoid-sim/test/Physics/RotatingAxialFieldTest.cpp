// Ticket: 0001_rotating_axial_field
// Test: RotatingAxialField potential and gradient

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numbers>
#include <utility>
#include <vector>

#include "geoid-sim/src/Physics/PotentialField/MassDistribution.hpp"
#include "geoid-sim/src/Physics/PotentialField/RotatingAxialField.hpp"

namespace geoid_sim
{
namespace test
{

namespace
{

RotatingAxialField makeSingleMassField(double mass, double omega = 0.0)
{
  FieldConfig config;
  config.masses = MassDistribution::singleCentralMass(mass);
  config.omega = omega;
  return RotatingAxialField{config};
}

// Central difference of the potential along one axis
Vector3D finiteDifferenceGradient(const RotatingAxialField& field,
                                  const Coordinate& p,
                                  double h = 1e-5)
{
  Vector3D g;
  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    Coordinate plus = p;
    Coordinate minus = p;
    plus[axis] += h;
    minus[axis] -= h;
    g[axis] = (field.getPotential(plus) - field.getPotential(minus)) / (2.0 * h);
  }
  return g;
}

}  // namespace

// ========== Configuration ==========

TEST(RotatingAxialField, DefaultConfig_TwoMassEgg)
{
  RotatingAxialField const field;

  ASSERT_EQ(field.getMasses().size(), 2u);
  EXPECT_DOUBLE_EQ(field.getMasses()[0].y, -1.5);
  EXPECT_DOUBLE_EQ(field.getMasses()[0].mass, 4.0);
  EXPECT_DOUBLE_EQ(field.getMasses()[1].y, 2.0);
  EXPECT_DOUBLE_EQ(field.getMasses()[1].mass, 2.0);
  EXPECT_DOUBLE_EQ(field.getGravitationalConstant(), 1.0);
  EXPECT_DOUBLE_EQ(field.getOmega(), 0.0);
}

TEST(RotatingAxialField, SetMasses_ReplacesWholesale)
{
  RotatingAxialField field;
  std::vector<PointMass> const poles = MassDistribution::taperedPoles(4.0, 0.2);

  field.setMasses(poles);

  EXPECT_EQ(field.getMasses(), poles);
  EXPECT_EQ(field.getConfig().masses.size(), 20u);
}

TEST(RotatingAxialField, SetOmegaAndG_StoredInConfig)
{
  RotatingAxialField field;
  field.setOmega(0.15);
  field.setGravitationalConstant(2.0);

  EXPECT_DOUBLE_EQ(field.getConfig().omega, 0.15);
  EXPECT_DOUBLE_EQ(field.getConfig().gravitationalConstant, 2.0);
}

TEST(RotatingAxialField, NonPositiveMass_AcceptedAsGiven)
{
  RotatingAxialField field;
  std::vector<PointMass> masses{PointMass{0.0, -1.0}};

  field.setMasses(std::move(masses));

  // A negative mass flips the sign of the gravity term
  EXPECT_NEAR(field.getPotential(2.0, 0.0, 0.0), 0.5, 1e-12);
}

// ========== Potential ==========

TEST(RotatingAxialField, Potential_SingleMassMatchesNewtonian)
{
  double const m = 8.0;
  RotatingAxialField const field = makeSingleMassField(m);

  for (double const r : {0.5, 1.0, 2.0, 5.0, 10.0})
  {
    SCOPED_TRACE(r);
    EXPECT_NEAR(field.getPotential(r, 0.0, 0.0), -m / r, 1e-12);
  }
}

TEST(RotatingAxialField, Potential_ScalesWithG)
{
  RotatingAxialField field = makeSingleMassField(3.0);
  field.setGravitationalConstant(2.5);

  EXPECT_NEAR(field.getPotential(0.0, 0.0, 2.0), -2.5 * 3.0 / 2.0, 1e-12);
}

TEST(RotatingAxialField, Potential_TwoMassAboveUpperMass)
{
  // -(1*4/5.5) - (1*2/2.0) = -1.72727...
  RotatingAxialField const field;

  EXPECT_NEAR(field.getPotential(0.0, 4.0, 0.0), -1.7273, 1e-4);
  EXPECT_NEAR(
    field.getPotential(Coordinate{0.0, 4.0, 0.0}), -(4.0 / 5.5) - 1.0, 1e-12);
}

TEST(RotatingAxialField, Potential_CentrifugalOnly)
{
  FieldConfig config;
  config.masses.clear();
  config.omega = 0.1;
  RotatingAxialField const field{config};

  // -0.5 * 0.01 * (9 + 16), independent of y
  EXPECT_NEAR(field.getPotential(3.0, 7.0, 4.0), -0.125, 1e-12);
  EXPECT_NEAR(field.getPotential(3.0, -50.0, 4.0), -0.125, 1e-12);
}

TEST(RotatingAxialField, Potential_SymmetricAboutVerticalAxis)
{
  RotatingAxialField field;
  field.setOmega(0.04);

  std::array<Coordinate, 3> const points{Coordinate{3.0, 0.5, 1.0},
                                         Coordinate{-2.0, -4.0, 5.5},
                                         Coordinate{0.3, 6.0, -0.7}};

  for (const auto& p : points)
  {
    double const reference = field.getPotential(p);
    for (int k = 1; k < 12; ++k)
    {
      double const theta = k * std::numbers::pi / 6.0;
      double const c = std::cos(theta);
      double const s = std::sin(theta);
      double const rotated = field.getPotential(
        p.x() * c - p.z() * s, p.y(), p.x() * s + p.z() * c);
      EXPECT_NEAR(rotated, reference, 1e-12);
    }
  }
}

TEST(RotatingAxialField, Potential_SentinelInsideSingularRadius)
{
  RotatingAxialField field;
  field.setOmega(0.2);

  EXPECT_DOUBLE_EQ(field.getPotential(0.0, -1.5, 0.0),
                   RotatingAxialField::kSingularityPotential);
  // Near the second mass; the first mass and the centrifugal term are ignored
  EXPECT_DOUBLE_EQ(field.getPotential(0.05, 2.0, 0.0), -10000.0);
}

TEST(RotatingAxialField, Potential_AtSingularRadiusIsFinite)
{
  RotatingAxialField const field = makeSingleMassField(8.0);

  EXPECT_NEAR(field.getPotential(0.1, 0.0, 0.0), -80.0, 1e-9);
}

TEST(RotatingAxialField, Potential_SentinelBelowReachableRange)
{
  RotatingAxialField field;
  field.setMasses(MassDistribution::taperedPoles(4.0, 0.5));
  field.setOmega(0.2);

  // Deepest physical value: just outside a pole of the densest layout
  double deepest = 0.0;
  for (const auto& pole : field.getMasses())
  {
    deepest = std::min(deepest, field.getPotential(0.1, pole.y, 0.0));
  }
  EXPECT_GT(deepest, RotatingAxialField::kSingularityPotential);
}

// ========== Gradient ==========

TEST(RotatingAxialField, Gradient_SingleMassPointsAway)
{
  RotatingAxialField const field = makeSingleMassField(8.0);

  for (double const x : {0.5, 3.0, 12.0})
  {
    Vector3D const g = field.getGradient(x, 0.0, 0.0);
    EXPECT_GT(g.x(), 0.0);
    EXPECT_NEAR(g.x(), 8.0 / (x * x), 1e-12);
    EXPECT_DOUBLE_EQ(g.y(), 0.0);
    EXPECT_DOUBLE_EQ(g.z(), 0.0);
  }
}

TEST(RotatingAxialField, Gradient_CentrifugalPointsTowardAxis)
{
  FieldConfig config;
  config.masses.clear();
  config.omega = 0.1;
  RotatingAxialField const field{config};

  Vector3D const g = field.getGradient(Coordinate{3.0, 7.0, 4.0});
  EXPECT_NEAR(g.x(), -0.03, 1e-12);
  EXPECT_DOUBLE_EQ(g.y(), 0.0);
  EXPECT_NEAR(g.z(), -0.04, 1e-12);
}

TEST(RotatingAxialField, Gradient_MatchesFiniteDifference)
{
  RotatingAxialField field;
  field.setOmega(0.03);

  std::array<Coordinate, 4> const points{Coordinate{3.2, 0.7, -1.1},
                                         Coordinate{-4.0, 2.5, 1.0},
                                         Coordinate{0.5, -5.0, 2.0},
                                         Coordinate{6.0, 0.0, 6.0}};

  for (const auto& p : points)
  {
    SCOPED_TRACE(std::format("{}", p));
    Vector3D const analytic = field.getGradient(p);
    Vector3D const numeric = finiteDifferenceGradient(field, p);
    EXPECT_NEAR(analytic.x(), numeric.x(), 1e-7);
    EXPECT_NEAR(analytic.y(), numeric.y(), 1e-7);
    EXPECT_NEAR(analytic.z(), numeric.z(), 1e-7);
  }
}

TEST(RotatingAxialField, Gradient_SkipsSingularMassInsteadOfSentinel)
{
  RotatingAxialField const field;

  // 0.05 above the upper mass: the upper mass is skipped, the lower one
  // (3.55 below) still contributes G*m/r² along +y
  Vector3D const g = field.getGradient(0.0, 2.05, 0.0);
  EXPECT_DOUBLE_EQ(g.x(), 0.0);
  EXPECT_NEAR(g.y(), 4.0 / (3.55 * 3.55), 1e-12);
  EXPECT_DOUBLE_EQ(g.z(), 0.0);

  // The potential at the same point is the sentinel
  EXPECT_DOUBLE_EQ(field.getPotential(0.0, 2.05, 0.0),
                   RotatingAxialField::kSingularityPotential);
}

TEST(RotatingAxialField, Gradient_InsideOnlyMassIsCentrifugalOnly)
{
  RotatingAxialField const field = makeSingleMassField(8.0, 0.2);

  Vector3D const g = field.getGradient(0.05, 0.0, 0.0);
  EXPECT_NEAR(g.x(), -0.04 * 0.05, 1e-15);
  EXPECT_DOUBLE_EQ(g.y(), 0.0);
  EXPECT_DOUBLE_EQ(g.z(), 0.0);
}

}  // namespace test
}  // namespace geoid_sim
