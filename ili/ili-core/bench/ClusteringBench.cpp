// Ticket: 0007_interaction_zones

#include <benchmark/benchmark.h>
#include "ili-core/src/Analysis/ThreeWayAnalyzer.hpp"
#include "ili-core/src/Clustering/ClusterDetector.hpp"
#include "ili-core/src/Utils/SyntheticInspectionGenerator.hpp"

#include <spdlog/sinks/null_sink.h>

using namespace ili_core;

namespace
{

constexpr unsigned int kRandomSeed = 42;

std::array<InspectionRun, 3> makeRuns(size_t anomalyCount)
{
  SyntheticInspectionGenerator::Config config;
  config.seed = kRandomSeed;
  config.anomalyCount = anomalyCount;
  return SyntheticInspectionGenerator{config}.generate();
}

}  // namespace

/**
 * @brief DBSCAN interaction-zone detection over one run.
 */
static void BM_ClusterDetector_Detect(benchmark::State& state)
{
  auto const runs = makeRuns(static_cast<size_t>(state.range(0)));
  ClusterDetector const detector;

  for (auto _ : state)
  {
    auto result = detector.detect(runs[0].anomalies, runs[0].runId);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_ClusterDetector_Detect)
  ->Arg(100)
  ->Arg(500)
  ->Arg(1000)
  ->Arg(2000)
  ->Complexity(benchmark::oNSquared);

/**
 * @brief Whole three-run pipeline, logging discarded.
 */
static void BM_ThreeWayAnalyzer_Run(benchmark::State& state)
{
  auto const runs = makeRuns(static_cast<size_t>(state.range(0)));
  auto logger = std::make_shared<spdlog::logger>(
    "bench_logger", std::make_shared<spdlog::sinks::null_sink_mt>());
  ThreeWayAnalyzer analyzer{ThreeWayAnalyzer::Config{}, logger};

  for (auto _ : state)
  {
    auto result = analyzer.run(runs[0], runs[1], runs[2]);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_ThreeWayAnalyzer_Run)->Arg(100)->Arg(500)->Unit(benchmark::kMillisecond);
