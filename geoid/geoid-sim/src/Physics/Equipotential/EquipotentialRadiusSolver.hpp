// Ticket: 0002_equipotential_radius_solver

#ifndef GEOID_SIM_PHYSICS_EQUIPOTENTIAL_RADIUS_SOLVER_HPP
#define GEOID_SIM_PHYSICS_EQUIPOTENTIAL_RADIUS_SOLVER_HPP

#include <limits>

#include "geoid-sim/src/DataTypes/Coordinate.hpp"
#include "geoid-sim/src/Physics/Equipotential/RadiusBracket.hpp"
#include "geoid-sim/src/Physics/PotentialField/PotentialField.hpp"

namespace geoid_sim
{

/**
 * @brief Finds where a ray from the origin crosses a target equipotential
 *
 * For a direction d and target potential V*, returns r with
 * V(r * d) ≈ V*, by bisection over a fixed bracket for a fixed number of
 * iterations. There is no convergence test and no early exit, so every call
 * costs exactly `iterations` potential evaluations and returns the same value
 * for the same inputs.
 *
 * Precondition (not checked on the default path): V(r * d) increases with r
 * over the whole bracket. This holds while gravity dominates. When rotation
 * is fast enough for the centrifugal term to win inside the bracket, or when
 * V* is not reached inside the bracket, the result converges to whichever
 * bound the comparisons lead to. solveRadiusWithDiagnostics() reports this
 * case without changing the returned radius.
 *
 * Called once per surface vertex; the solve allocates nothing and keeps all
 * working state on the stack. The field's configuration must not change
 * while a batch of solves is running.
 *
 * @ticket 0002_equipotential_radius_solver
 */
class EquipotentialRadiusSolver
{
public:
  /// Outcome of a diagnosed solve
  struct SolveResult
  {
    double radius{0.0};                 ///< Identical to solveRadius()
    bool bracketStraddlesTarget{false}; ///< V(rMin*d) <= V* <= V(rMax*d)
    double potentialAtMin{std::numeric_limits<double>::quiet_NaN()};
    double potentialAtMax{std::numeric_limits<double>::quiet_NaN()};
    double residual{std::numeric_limits<double>::quiet_NaN()};  ///< V(radius*d) - V*
    int iterations{0};                  ///< Bisection steps performed
  };

  static constexpr int kDefaultIterations = 15;

  /**
   * @brief Construct with the [3, 8] bracket and 15 iterations
   */
  EquipotentialRadiusSolver();

  /**
   * @brief Construct with an explicit bracket and iteration count
   * @throws std::invalid_argument if the bracket is invalid or iterations < 0
   */
  explicit EquipotentialRadiusSolver(RadiusBracket bracket,
                                     int iterations = kDefaultIterations);

  ~EquipotentialRadiusSolver() = default;

  /**
   * @brief Solve for the radius along (dx, dy, dz) where V equals the target
   *
   * The direction is used as given. Callers normally pass a unit vector.
   *
   * @param field Potential field to evaluate
   * @param dx, dy, dz Ray direction
   * @param targetPotential Potential of the sought surface
   * @return Midpoint of the final bracket
   */
  [[nodiscard]] double solveRadius(const PotentialField& field,
                                   double dx,
                                   double dy,
                                   double dz,
                                   double targetPotential) const;

  [[nodiscard]] double solveRadius(const PotentialField& field,
                                   const Coordinate& direction,
                                   double targetPotential) const;

  /**
   * @brief Solve and report whether the bracket actually contains the root
   *
   * The returned radius is bit-identical to solveRadius(). Two extra
   * potential evaluations at the bracket ends and one at the result are made.
   */
  [[nodiscard]] SolveResult solveRadiusWithDiagnostics(
    const PotentialField& field,
    const Coordinate& direction,
    double targetPotential) const;

  /// Worst-case bracket width after the solve: (rMax - rMin) / 2^iterations
  [[nodiscard]] double precision() const;

  /**
   * @brief Replace the search bracket
   * @throws std::invalid_argument if the bracket is invalid
   */
  void setBracket(const RadiusBracket& bracket);
  [[nodiscard]] const RadiusBracket& getBracket() const;

  /**
   * @brief Set the bisection step count
   * @throws std::invalid_argument if iterations < 0
   */
  void setIterations(int iterations);
  [[nodiscard]] int getIterations() const;

  EquipotentialRadiusSolver(const EquipotentialRadiusSolver&) = default;
  EquipotentialRadiusSolver& operator=(const EquipotentialRadiusSolver&) = default;
  EquipotentialRadiusSolver(EquipotentialRadiusSolver&&) noexcept = default;
  EquipotentialRadiusSolver& operator=(EquipotentialRadiusSolver&&) noexcept = default;

private:
  static void validateBracket(const RadiusBracket& bracket);
  static void validateIterations(int iterations);

  RadiusBracket bracket_{RadiusBracket::defaults()};
  int iterations_{kDefaultIterations};
};

}  // namespace geoid_sim

#endif  // GEOID_SIM_PHYSICS_EQUIPOTENTIAL_RADIUS_SOLVER_HPP
