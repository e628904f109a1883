// Ticket: 0002_dtw_alignment

#include "ili-core/src/Alignment/DTWAligner.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ili_core
{

namespace
{

constexpr double kInf = std::numeric_limits<double>::infinity();

Eigen::VectorXd extractDistances(const std::vector<ReferencePoint>& points)
{
  Eigen::VectorXd distances(static_cast<Eigen::Index>(points.size()));
  for (size_t i = 0; i < points.size(); ++i)
  {
    distances(static_cast<Eigen::Index>(i)) = points[i].distance;
  }
  return distances;
}

}  // anonymous namespace

DTWAligner::DTWAligner() : DTWAligner{Config{}}
{
}

DTWAligner::DTWAligner(const Config& config) : config_{config}
{
  if (!(config_.driftConstraint >= 0.0))
  {
    throw std::invalid_argument{
      "DTWAligner: drift constraint must be non-negative, got " +
      std::to_string(config_.driftConstraint)};
  }
}

// ============================================================================
// Public API
// ============================================================================

AlignmentResult DTWAligner::align(
  const std::vector<ReferencePoint>& sequence1,
  const std::vector<ReferencePoint>& sequence2) const
{
  Alignment const raw = computeAlignment(sequence1, sequence2);

  std::vector<AlignmentResult::PointPair> matchedPoints;
  AlignmentResult::CorrectionParams params;
  matchedPoints.reserve(raw.pairs.size());
  params.sourceDistances.reserve(raw.pairs.size());
  params.targetDistances.reserve(raw.pairs.size());

  for (const auto& pair : raw.pairs)
  {
    matchedPoints.emplace_back(pair.sourceId, pair.targetId);
    params.sourceDistances.push_back(pair.sourceDistance);
    params.targetDistances.push_back(pair.targetDistance);
  }

  spdlog::debug("DTW {} -> {}: {} pairs, match rate {:.1f}%, rmse {:.2f} ft",
                sequence1.front().runId,
                sequence2.front().runId,
                raw.pairs.size(),
                raw.matchRate,
                raw.rmse);

  return AlignmentResult::create(sequence1.front().runId,
                                 sequence2.front().runId,
                                 std::move(matchedPoints),
                                 raw.matchRate,
                                 raw.rmse,
                                 std::move(params),
                                 config_.thresholds);
}

DTWAligner::Alignment DTWAligner::computeAlignment(
  const std::vector<ReferencePoint>& sequence1,
  const std::vector<ReferencePoint>& sequence2) const
{
  if (sequence1.empty() || sequence2.empty())
  {
    throw std::invalid_argument{
      "DTWAligner: cannot align empty reference sequences (" +
      std::to_string(sequence1.size()) + ", " +
      std::to_string(sequence2.size()) + ")"};
  }

  Eigen::VectorXd const d1 = extractDistances(sequence1);
  Eigen::VectorXd const d2 = extractDistances(sequence2);

  Eigen::MatrixXd const distance = computeDistanceMatrix(d1, d2);
  Eigen::MatrixXd const cost = accumulateCost(distance);
  std::vector<Step> const path = backtrack(cost);

  Alignment result;
  result.sourceCount = sequence1.size();
  result.targetCount = sequence2.size();
  result.totalCost = cost(cost.rows() - 1, cost.cols() - 1);
  result.pairs.reserve(path.size());

  double sumSquared = 0.0;
  for (const auto& [i, j] : path)
  {
    auto const si = static_cast<size_t>(i);
    auto const sj = static_cast<size_t>(j);
    result.pairs.push_back(MatchedPair{sequence1[si].id,
                                       sequence2[sj].id,
                                       sequence1[si].distance,
                                       sequence2[sj].distance});
    double const diff = sequence1[si].distance - sequence2[sj].distance;
    sumSquared += diff * diff;
  }

  auto const longest =
    static_cast<double>(std::max(sequence1.size(), sequence2.size()));
  result.matchRate = std::min(
    100.0, static_cast<double>(result.pairs.size()) / longest * 100.0);
  result.rmse = result.pairs.empty()
                  ? 0.0
                  : std::sqrt(sumSquared /
                              static_cast<double>(result.pairs.size()));

  return result;
}

// ============================================================================
// DTW stages
// ============================================================================

Eigen::MatrixXd DTWAligner::computeDistanceMatrix(
  const Eigen::VectorXd& distances1,
  const Eigen::VectorXd& distances2) const
{
  Eigen::MatrixXd matrix(distances1.size(), distances2.size());

  for (Eigen::Index i = 0; i < distances1.size(); ++i)
  {
    for (Eigen::Index j = 0; j < distances2.size(); ++j)
    {
      double const diff = std::abs(distances1(i) - distances2(j));
      double const band =
        config_.driftConstraint * 0.5 * (distances1(i) + distances2(j));
      matrix(i, j) = (diff <= band) ? diff : kInf;
    }
  }

  return matrix;
}

Eigen::MatrixXd DTWAligner::accumulateCost(const Eigen::MatrixXd& distanceMatrix)
{
  Eigen::Index const n = distanceMatrix.rows();
  Eigen::Index const m = distanceMatrix.cols();

  Eigen::MatrixXd cost = Eigen::MatrixXd::Constant(n + 1, m + 1, kInf);
  cost(0, 0) = 0.0;

  for (Eigen::Index i = 1; i <= n; ++i)
  {
    for (Eigen::Index j = 1; j <= m; ++j)
    {
      double const local = distanceMatrix(i - 1, j - 1);
      if (!std::isfinite(local))
      {
        continue;
      }
      double const best =
        std::min({cost(i - 1, j), cost(i, j - 1), cost(i - 1, j - 1)});
      cost(i, j) = local + best;
    }
  }

  return cost;
}

std::vector<DTWAligner::Step> DTWAligner::backtrack(const Eigen::MatrixXd& cost)
{
  Eigen::Index i = cost.rows() - 1;
  Eigen::Index j = cost.cols() - 1;

  std::vector<Step> path;
  if (i <= 0 || j <= 0 || !std::isfinite(cost(i, j)))
  {
    return path;
  }

  while (i > 0 && j > 0)
  {
    path.emplace_back(i - 1, j - 1);

    double const diagonal = cost(i - 1, j - 1);
    double const vertical = cost(i - 1, j);
    double const horizontal = cost(i, j - 1);

    if (diagonal <= vertical && diagonal <= horizontal)
    {
      --i;
      --j;
    }
    else if (vertical <= horizontal)
    {
      --i;
    }
    else
    {
      --j;
    }
  }

  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace ili_core
