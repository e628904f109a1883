// Ticket: 0006_hungarian_matching

#ifndef ILI_CORE_MATCHING_LINEAR_ASSIGNMENT_SOLVER_HPP
#define ILI_CORE_MATCHING_LINEAR_ASSIGNMENT_SOLVER_HPP

#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace ili_core
{

/**
 * @brief Minimum-cost rectangular linear assignment (Hungarian algorithm).
 *
 * Shortest-augmenting-path formulation with row/column potentials.
 * For an n x m cost matrix it assigns exactly
 * min(n, m) rows to distinct columns, minimising the summed cost, in
 * O(min(n,m)^2 * max(n,m)).
 *
 * Wide matrices (n <= m) are solved directly; tall matrices are transposed
 * and the result mapped back.
 *
 * @ticket 0006_hungarian_matching
 */
class LinearAssignmentSolver
{
public:
  using Assignment = std::vector<std::pair<Eigen::Index, Eigen::Index>>;

  struct SolveResult
  {
    Assignment assignment;  ///< (row, col) pairs sorted by row
    double totalCost{0.0};
  };

  /**
   * @brief Solve the assignment problem for @p cost.
   *
   * @param cost Finite cost matrix (rows x cols); may be empty
   * @return Optimal assignment of size min(rows, cols)
   * @throws std::invalid_argument if any entry is not finite
   */
  [[nodiscard]] static SolveResult solve(const Eigen::MatrixXd& cost);

private:
  /// Core solver; requires cost.rows() <= cost.cols()
  static Assignment solveWide(const Eigen::MatrixXd& cost);
};

}  // namespace ili_core

#endif  // ILI_CORE_MATCHING_LINEAR_ASSIGNMENT_SOLVER_HPP
