// Ticket: 0012_synthetic_three_run_scenario

#include "ili-core/src/Utils/SyntheticInspectionGenerator.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

namespace ili_core
{

namespace
{

constexpr double kMaxDepthPct = 95.0;

// Ground truth for one physical defect
struct TrueDefect
{
  double distance;
  double clock;
  double initialDepth;
  double length;
  double width;
  FeatureType type;
  double depthRate;     // [pp / year]
  double acceleration;  // [pp / year^2]
  size_t firstRun;      // Run index where the defect first appears
  size_t lastRun;       // Last run index that still reports it
};

FeatureType drawFeatureType(std::mt19937& rng)
{
  std::discrete_distribution<int> pick{{60.0, 25.0, 8.0, 2.0, 5.0}};
  switch (pick(rng))
  {
    case 0:
      return FeatureType::ExternalCorrosion;
    case 1:
      return FeatureType::InternalCorrosion;
    case 2:
      return FeatureType::Dent;
    case 3:
      return FeatureType::Crack;
    default:
      return FeatureType::Other;
  }
}

TrueDefect drawDefect(std::mt19937& rng,
                      double pipelineLengthFt,
                      size_t firstRun)
{
  std::uniform_real_distribution<double> position{5.0, pipelineLengthFt - 5.0};
  std::uniform_real_distribution<double> clock{1.0, 12.0};
  std::uniform_real_distribution<double> depth{5.0, 35.0};
  std::uniform_real_distribution<double> length{0.5, 6.0};
  std::uniform_real_distribution<double> width{0.5, 4.0};
  std::uniform_real_distribution<double> rate{0.2, 2.0};
  std::bernoulli_distribution accelerates{0.2};
  std::uniform_real_distribution<double> acceleration{0.05, 0.25};

  TrueDefect defect{};
  defect.distance = position(rng);
  defect.clock = clock(rng);
  defect.initialDepth = firstRun == 0 ? depth(rng) : depth(rng) * 0.4;
  defect.length = length(rng);
  defect.width = width(rng);
  defect.type = drawFeatureType(rng);
  defect.depthRate = rate(rng);
  defect.acceleration = accelerates(rng) ? acceleration(rng) : 0.0;
  defect.firstRun = firstRun;
  defect.lastRun = 2;
  return defect;
}

}  // anonymous namespace

SyntheticInspectionGenerator::SyntheticInspectionGenerator()
  : SyntheticInspectionGenerator{Config{}}
{
}

SyntheticInspectionGenerator::SyntheticInspectionGenerator(const Config& config)
  : config_{config}
{
  if (!(config_.pipelineLengthFt > 10.0) || !(config_.jointLengthFt > 0.0))
  {
    throw std::invalid_argument{
      "SyntheticInspectionGenerator: pipeline length must exceed 10 ft and "
      "joint length must be positive"};
  }
  for (const auto& run : config_.runs)
  {
    if (!(run.odometerScale > 0.0))
    {
      throw std::invalid_argument{
        "SyntheticInspectionGenerator: odometer scale must be positive for " +
        run.runId};
    }
  }
}

std::array<InspectionRun, 3> SyntheticInspectionGenerator::generate() const
{
  std::mt19937 rng{config_.seed};

  // ===== Ground truth =====
  std::vector<TrueDefect> defects;
  defects.reserve(config_.anomalyCount * 2);
  for (size_t i = 0; i < config_.anomalyCount; ++i)
  {
    defects.push_back(drawDefect(rng, config_.pipelineLengthFt, 0));
  }

  auto const extra = static_cast<size_t>(
    static_cast<double>(config_.anomalyCount) * config_.newAnomalyFraction);
  for (size_t run = 1; run < 3; ++run)
  {
    for (size_t i = 0; i < extra; ++i)
    {
      defects.push_back(drawDefect(rng, config_.pipelineLengthFt, run));
    }
  }

  // Repairs: a defect reported in run k is gone from run k + 1 onwards
  std::bernoulli_distribution repaired{config_.repairFraction};
  for (auto& defect : defects)
  {
    for (size_t run = defect.firstRun; run < 2; ++run)
    {
      if (repaired(rng))
      {
        defect.lastRun = run;
        break;
      }
    }
  }

  // ===== Observations =====
  std::normal_distribution<double> odometerNoise{0.0, config_.odometerNoiseFt};
  std::normal_distribution<double> clockNoise{0.0, config_.clockNoiseHours};
  std::normal_distribution<double> depthNoise{0.0, config_.depthNoisePct};

  std::array<InspectionRun, 3> runs;
  for (size_t k = 0; k < 3; ++k)
  {
    const RunSpec& spec = config_.runs[k];
    InspectionRun& run = runs[k];
    run.runId = spec.runId;
    run.inspectionDate = spec.date;

    auto observe = [&spec](double trueDistance)
    {
      return std::max(0.0,
                      trueDistance * spec.odometerScale + spec.odometerOffsetFt);
    };

    // Girth welds every joint; the launcher weld at 0 ft is always exact
    size_t weldIndex = 0;
    for (double d = 0.0; d <= config_.pipelineLengthFt;
         d += config_.jointLengthFt, ++weldIndex)
    {
      double const observed =
        weldIndex == 0 ? 0.0 : std::max(0.0, observe(d) + odometerNoise(rng));
      run.referencePoints.emplace_back(
        fmt::format("{}-GW{:04d}", spec.runId, weldIndex),
        spec.runId,
        observed,
        PointType::GirthWeld);
    }

    double const years = yearsBetween(config_.runs[0].date, spec.date);
    size_t anomalyIndex = 0;
    for (const auto& defect : defects)
    {
      if (k < defect.firstRun || k > defect.lastRun)
      {
        continue;
      }
      double const age =
        years - yearsBetween(config_.runs[0].date,
                             config_.runs[defect.firstRun].date);
      double const trueDepth = defect.initialDepth + defect.depthRate * age +
                               0.5 * defect.acceleration * age * age;
      double const depth =
        std::clamp(trueDepth + depthNoise(rng), 0.0, kMaxDepthPct);
      double const clock =
        std::clamp(defect.clock + clockNoise(rng), 1.0, 12.0);
      double const distance =
        std::max(0.0, observe(defect.distance) + odometerNoise(rng));
      double const growthFactor = 1.0 + 0.01 * age;

      run.anomalies.emplace_back(
        fmt::format("{}-A{:05d}", spec.runId, anomalyIndex++),
        spec.runId,
        distance,
        clock,
        depth,
        defect.length * growthFactor,
        defect.width * growthFactor,
        defect.type,
        spec.date);
    }
  }

  return runs;
}

}  // namespace ili_core
