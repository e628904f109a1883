// Ticket: 0006_hungarian_matching

#include "ili-core/src/Matching/HungarianMatcher.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "ili-core/src/Matching/LinearAssignmentSolver.hpp"

namespace ili_core
{

HungarianMatcher::HungarianMatcher() : HungarianMatcher{Config{}}
{
}

HungarianMatcher::HungarianMatcher(const Config& config,
                                   SimilarityCalculator calculator)
  : config_{config}, calculator_{std::move(calculator)}
{
  if (!(config_.confidenceThreshold >= 0.0 &&
        config_.confidenceThreshold <= 1.0))
  {
    throw std::invalid_argument{
      "HungarianMatcher: confidence threshold must lie in [0, 1], got " +
      std::to_string(config_.confidenceThreshold)};
  }
}

Eigen::MatrixXd HungarianMatcher::costMatrix(
  const std::vector<AnomalyRecord>& run1,
  const std::vector<AnomalyRecord>& run2) const
{
  Eigen::MatrixXd const similarity = calculator_.similarityMatrix(run1, run2);
  return Eigen::MatrixXd::Ones(similarity.rows(), similarity.cols()) -
         similarity;
}

MatchingResult HungarianMatcher::match(
  const std::vector<AnomalyRecord>& run1,
  const std::vector<AnomalyRecord>& run2) const
{
  MatchingResult result;
  MatchingStatistics& stats = result.statistics;
  stats.totalRun1 = run1.size();
  stats.totalRun2 = run2.size();

  std::vector<bool> matched1(run1.size(), false);
  std::vector<bool> matched2(run2.size(), false);

  if (!run1.empty() && !run2.empty())
  {
    auto const solution = LinearAssignmentSolver::solve(costMatrix(run1, run2));

    for (const auto& [row, col] : solution.assignment)
    {
      auto const i = static_cast<size_t>(row);
      auto const j = static_cast<size_t>(col);
      SimilarityBreakdown const breakdown =
        calculator_.calculate(run1[i], run2[j]);
      if (breakdown.overall < config_.confidenceThreshold)
      {
        continue;
      }

      Match match{run1[i].id(), run2[j].id(), breakdown};
      switch (match.confidence())
      {
        case MatchConfidence::High:
          ++stats.highConfidence;
          break;
        case MatchConfidence::Medium:
          ++stats.mediumConfidence;
          break;
        case MatchConfidence::Low:
          ++stats.lowConfidence;
          break;
      }
      result.matches.push_back(std::move(match));
      matched1[i] = true;
      matched2[j] = true;
    }
  }

  for (size_t i = 0; i < run1.size(); ++i)
  {
    if (!matched1[i])
    {
      result.repairedOrRemoved.push_back(run1[i]);
    }
  }
  for (size_t j = 0; j < run2.size(); ++j)
  {
    if (!matched2[j])
    {
      result.newAnomalies.push_back(run2[j]);
    }
  }

  stats.matched = result.matches.size();
  stats.unmatchedRun1 = result.repairedOrRemoved.size();
  stats.unmatchedRun2 = result.newAnomalies.size();
  size_t const smaller = std::min(run1.size(), run2.size());
  stats.matchRate = smaller > 0 ? static_cast<double>(stats.matched) /
                                    static_cast<double>(smaller)
                                : 0.0;

  spdlog::debug("Matched {} of {}x{} anomalies (high {}, medium {}, low {})",
                stats.matched,
                stats.totalRun1,
                stats.totalRun2,
                stats.highConfidence,
                stats.mediumConfidence,
                stats.lowConfidence);

  return result;
}

}  // namespace ili_core
