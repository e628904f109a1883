// Ticket: 0006_hungarian_matching

#include <benchmark/benchmark.h>
#include <random>
#include <vector>
#include "ili-core/src/Matching/HungarianMatcher.hpp"
#include "ili-core/src/Matching/LinearAssignmentSolver.hpp"
#include "ili-core/src/Utils/SyntheticInspectionGenerator.hpp"

using namespace ili_core;

namespace
{

constexpr unsigned int kRandomSeed = 42;

Eigen::MatrixXd randomCostMatrix(Eigen::Index rows, Eigen::Index cols)
{
  std::mt19937 rng{kRandomSeed};
  std::uniform_real_distribution<double> dist{0.0, 1.0};

  Eigen::MatrixXd cost(rows, cols);
  for (Eigen::Index i = 0; i < rows; ++i)
  {
    for (Eigen::Index j = 0; j < cols; ++j)
    {
      cost(i, j) = dist(rng);
    }
  }
  return cost;
}

std::array<InspectionRun, 3> makeRuns(size_t anomalyCount)
{
  SyntheticInspectionGenerator::Config config;
  config.seed = kRandomSeed;
  config.anomalyCount = anomalyCount;
  return SyntheticInspectionGenerator{config}.generate();
}

}  // namespace

// ============================================================================
// Assignment solver
// ============================================================================

/**
 * @brief Square assignment on uniform random costs, O(n^3).
 */
static void BM_LinearAssignment_Square(benchmark::State& state)
{
  auto const n = static_cast<Eigen::Index>(state.range(0));
  Eigen::MatrixXd const cost = randomCostMatrix(n, n);

  for (auto _ : state)
  {
    auto result = LinearAssignmentSolver::solve(cost);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(n));
}
BENCHMARK(BM_LinearAssignment_Square)
  ->Arg(50)
  ->Arg(100)
  ->Arg(200)
  ->Arg(500)
  ->Complexity(benchmark::oNCubed);

/**
 * @brief Rectangular assignment with 10% more columns than rows.
 */
static void BM_LinearAssignment_Wide(benchmark::State& state)
{
  auto const n = static_cast<Eigen::Index>(state.range(0));
  Eigen::MatrixXd const cost = randomCostMatrix(n, n + n / 10);

  for (auto _ : state)
  {
    auto result = LinearAssignmentSolver::solve(cost);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_LinearAssignment_Wide)->Arg(100)->Arg(500);

// ============================================================================
// Anomaly matching
// ============================================================================

/**
 * @brief Similarity matrix plus assignment between two synthetic runs.
 */
static void BM_HungarianMatcher_Match(benchmark::State& state)
{
  auto const runs = makeRuns(static_cast<size_t>(state.range(0)));
  HungarianMatcher const matcher;

  for (auto _ : state)
  {
    auto result = matcher.match(runs[0].anomalies, runs[1].anomalies);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_HungarianMatcher_Match)
  ->Arg(100)
  ->Arg(200)
  ->Arg(500)
  ->Complexity();

static void BM_SimilarityMatrix(benchmark::State& state)
{
  auto const runs = makeRuns(static_cast<size_t>(state.range(0)));
  SimilarityCalculator const calculator;

  for (auto _ : state)
  {
    auto matrix =
      calculator.similarityMatrix(runs[0].anomalies, runs[1].anomalies);
    benchmark::DoNotOptimize(matrix);
  }
}
BENCHMARK(BM_SimilarityMatrix)->Arg(200)->Arg(1000);
