// Ticket: 0002_dtw_alignment

#include <benchmark/benchmark.h>
#include "ili-core/src/Alignment/DTWAligner.hpp"
#include "ili-core/src/Alignment/DistanceCorrectionFunction.hpp"
#include "ili-core/src/Utils/SyntheticInspectionGenerator.hpp"

using namespace ili_core;

namespace
{

constexpr unsigned int kRandomSeed = 42;
constexpr double kJointLengthFt = 40.0;

/// Runs with range(0) girth welds per run
std::array<InspectionRun, 3> makeRuns(long long weldCount)
{
  SyntheticInspectionGenerator::Config config;
  config.seed = kRandomSeed;
  config.anomalyCount = 500;
  config.jointLengthFt = kJointLengthFt;
  config.pipelineLengthFt = kJointLengthFt * static_cast<double>(weldCount - 1);
  return SyntheticInspectionGenerator{config}.generate();
}

}  // namespace

/**
 * @brief Full DTW (distance matrix, cost table, backtrack) between two runs.
 */
static void BM_DTWAligner_ComputeAlignment(benchmark::State& state)
{
  auto const runs = makeRuns(state.range(0));
  DTWAligner const aligner;

  for (auto _ : state)
  {
    auto alignment = aligner.computeAlignment(runs[0].referencePoints,
                                              runs[1].referencePoints);
    benchmark::DoNotOptimize(alignment);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_DTWAligner_ComputeAlignment)
  ->Arg(100)
  ->Arg(250)
  ->Arg(500)
  ->Arg(1000)
  ->Complexity(benchmark::oNSquared);

/**
 * @brief Piecewise-linear correction of one run's anomalies.
 */
static void BM_DistanceCorrection_CorrectAnomalies(benchmark::State& state)
{
  auto const runs = makeRuns(state.range(0));
  DTWAligner const aligner;
  DistanceCorrectionFunction const correction{
    aligner.align(runs[0].referencePoints, runs[1].referencePoints)};

  for (auto _ : state)
  {
    auto corrected = correction.correctAnomalies(runs[0].anomalies);
    benchmark::DoNotOptimize(corrected);
  }
}
BENCHMARK(BM_DistanceCorrection_CorrectAnomalies)->Arg(100)->Arg(251);
