// Ticket: 0006_hungarian_matching

#include "ili-core/src/Matching/LinearAssignmentSolver.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace ili_core
{

LinearAssignmentSolver::SolveResult LinearAssignmentSolver::solve(
  const Eigen::MatrixXd& cost)
{
  SolveResult result;
  if (cost.rows() == 0 || cost.cols() == 0)
  {
    return result;
  }
  if (!cost.allFinite())
  {
    throw std::invalid_argument{
      "LinearAssignmentSolver: cost matrix contains non-finite entries"};
  }

  if (cost.rows() <= cost.cols())
  {
    result.assignment = solveWide(cost);
  }
  else
  {
    Eigen::MatrixXd const transposed = cost.transpose();
    for (const auto& [row, col] : solveWide(transposed))
    {
      result.assignment.emplace_back(col, row);
    }
  }

  std::sort(result.assignment.begin(), result.assignment.end());
  for (const auto& [row, col] : result.assignment)
  {
    result.totalCost += cost(row, col);
  }
  return result;
}

LinearAssignmentSolver::Assignment LinearAssignmentSolver::solveWide(
  const Eigen::MatrixXd& cost)
{
  // 1-based indexing below; index 0 is the virtual source column
  Eigen::Index const n = cost.rows();
  Eigen::Index const m = cost.cols();
  double constexpr kInf = std::numeric_limits<double>::infinity();

  Eigen::VectorXd u = Eigen::VectorXd::Zero(n + 1);  // Row potentials
  Eigen::VectorXd v = Eigen::VectorXd::Zero(m + 1);  // Column potentials
  std::vector<Eigen::Index> rowOfCol(static_cast<size_t>(m + 1), 0);
  std::vector<Eigen::Index> way(static_cast<size_t>(m + 1), 0);

  for (Eigen::Index i = 1; i <= n; ++i)
  {
    rowOfCol[0] = i;
    Eigen::Index j0 = 0;
    Eigen::VectorXd minv = Eigen::VectorXd::Constant(m + 1, kInf);
    std::vector<bool> used(static_cast<size_t>(m + 1), false);

    // Grow the alternating tree until a free column is reached
    do
    {
      used[static_cast<size_t>(j0)] = true;
      Eigen::Index const i0 = rowOfCol[static_cast<size_t>(j0)];
      double delta = kInf;
      Eigen::Index j1 = 0;

      for (Eigen::Index j = 1; j <= m; ++j)
      {
        if (used[static_cast<size_t>(j)])
        {
          continue;
        }
        double const reduced = cost(i0 - 1, j - 1) - u(i0) - v(j);
        if (reduced < minv(j))
        {
          minv(j) = reduced;
          way[static_cast<size_t>(j)] = j0;
        }
        if (minv(j) < delta)
        {
          delta = minv(j);
          j1 = j;
        }
      }

      for (Eigen::Index j = 0; j <= m; ++j)
      {
        if (used[static_cast<size_t>(j)])
        {
          u(rowOfCol[static_cast<size_t>(j)]) += delta;
          v(j) -= delta;
        }
        else
        {
          minv(j) -= delta;
        }
      }
      j0 = j1;
    } while (rowOfCol[static_cast<size_t>(j0)] != 0);

    // Augment along the recorded path
    do
    {
      Eigen::Index const j1 = way[static_cast<size_t>(j0)];
      rowOfCol[static_cast<size_t>(j0)] = rowOfCol[static_cast<size_t>(j1)];
      j0 = j1;
    } while (j0 != 0);
  }

  Assignment assignment;
  assignment.reserve(static_cast<size_t>(n));
  for (Eigen::Index j = 1; j <= m; ++j)
  {
    Eigen::Index const row = rowOfCol[static_cast<size_t>(j)];
    if (row != 0)
    {
      assignment.emplace_back(row - 1, j - 1);
    }
  }
  return assignment;
}

}  // namespace ili_core
