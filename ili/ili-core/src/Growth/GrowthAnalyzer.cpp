// Ticket: 0008_growth_analysis

#include "ili-core/src/Growth/GrowthAnalyzer.hpp"

#include <spdlog/spdlog.h>
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace ili_core
{

namespace
{

void requirePositiveInterval(double timeIntervalYears)
{
  if (!(timeIntervalYears > 0.0))
  {
    throw std::invalid_argument{
      "GrowthAnalyzer: time interval must be positive, got " +
      std::to_string(timeIntervalYears) + " years"};
  }
}

RateStatistics summarize(std::vector<double> values)
{
  RateStatistics stats;
  if (values.empty())
  {
    return stats;
  }

  Eigen::Map<const Eigen::VectorXd> const v{
    values.data(), static_cast<Eigen::Index>(values.size())};
  stats.mean = v.mean();
  stats.min = v.minCoeff();
  stats.max = v.maxCoeff();
  if (values.size() > 1)
  {
    double const ss = (v.array() - stats.mean).square().sum();
    stats.stdDev = std::sqrt(ss / static_cast<double>(values.size() - 1));
  }

  std::sort(values.begin(), values.end());
  size_t const mid = values.size() / 2;
  stats.median = (values.size() % 2 == 0)
                   ? 0.5 * (values[mid - 1] + values[mid])
                   : values[mid];
  return stats;
}

std::unordered_map<std::string, const AnomalyRecord*> indexById(
  const std::vector<AnomalyRecord>& anomalies)
{
  std::unordered_map<std::string, const AnomalyRecord*> index;
  index.reserve(anomalies.size());
  for (const auto& anomaly : anomalies)
  {
    index.emplace(anomaly.id(), &anomaly);
  }
  return index;
}

}  // anonymous namespace

GrowthAnalyzer::GrowthAnalyzer() : GrowthAnalyzer{Config{}}
{
}

GrowthAnalyzer::GrowthAnalyzer(const Config& config) : config_{config}
{
}

double GrowthAnalyzer::growthRate(double initialValue,
                                  double finalValue,
                                  double timeIntervalYears)
{
  requirePositiveInterval(timeIntervalYears);
  return (finalValue - initialValue) / timeIntervalYears;
}

GrowthMetrics GrowthAnalyzer::calculateMatchGrowth(
  const Match& match,
  const AnomalyRecord& anomaly1,
  const AnomalyRecord& anomaly2,
  double timeIntervalYears) const
{
  GrowthMetrics metrics;
  metrics.matchId = match.id();
  metrics.anomaly1Id = anomaly1.id();
  metrics.anomaly2Id = anomaly2.id();
  metrics.timeIntervalYears = timeIntervalYears;
  metrics.depthGrowthRate =
    growthRate(anomaly1.depthPct(), anomaly2.depthPct(), timeIntervalYears);
  metrics.lengthGrowthRate =
    growthRate(anomaly1.length(), anomaly2.length(), timeIntervalYears);
  metrics.widthGrowthRate =
    growthRate(anomaly1.width(), anomaly2.width(), timeIntervalYears);
  metrics.isRapidGrowth = isRapidGrowth(metrics.depthGrowthRate);
  return metrics;
}

GrowthAnalyzer::Analysis GrowthAnalyzer::analyze(
  const std::vector<Match>& matches,
  const std::vector<AnomalyRecord>& run1,
  const std::vector<AnomalyRecord>& run2,
  double timeIntervalYears) const
{
  requirePositiveInterval(timeIntervalYears);

  auto const byId1 = indexById(run1);
  auto const byId2 = indexById(run2);

  Analysis analysis;
  analysis.growthMetrics.reserve(matches.size());

  size_t skipped = 0;
  for (const auto& match : matches)
  {
    auto const it1 = byId1.find(match.anomaly1Id());
    auto const it2 = byId2.find(match.anomaly2Id());
    if (it1 == byId1.end() || it2 == byId2.end())
    {
      ++skipped;
      continue;
    }

    GrowthMetrics metrics =
      calculateMatchGrowth(match, *it1->second, *it2->second, timeIntervalYears);

    if (metrics.isRapidGrowth)
    {
      const AnomalyRecord& current = *it2->second;
      analysis.rapidGrowthAnomalies.push_back(
        RapidGrowthAnomaly{current.id(),
                           metrics.depthGrowthRate,
                           current.depthPct(),
                           current.distance(),
                           current.clockPosition()});
    }
    analysis.growthMetrics.push_back(std::move(metrics));
  }

  if (skipped > 0)
  {
    spdlog::warn("Growth analysis skipped {} matches with unknown anomaly ids",
                 skipped);
  }

  analysis.statistics = computeStatistics(analysis.growthMetrics);
  return analysis;
}

GrowthStatistics GrowthAnalyzer::computeStatistics(
  const std::vector<GrowthMetrics>& metrics)
{
  GrowthStatistics stats;
  stats.totalMatches = metrics.size();
  if (metrics.empty())
  {
    return stats;
  }

  std::vector<double> depth;
  std::vector<double> length;
  std::vector<double> width;
  depth.reserve(metrics.size());
  length.reserve(metrics.size());
  width.reserve(metrics.size());

  for (const auto& m : metrics)
  {
    depth.push_back(m.depthGrowthRate);
    length.push_back(m.lengthGrowthRate);
    width.push_back(m.widthGrowthRate);
    if (m.isRapidGrowth)
    {
      ++stats.rapidGrowthCount;
    }
  }

  stats.rapidGrowthPercentage = static_cast<double>(stats.rapidGrowthCount) /
                                static_cast<double>(metrics.size()) * 100.0;
  stats.depth = summarize(std::move(depth));
  stats.length = summarize(std::move(length));
  stats.width = summarize(std::move(width));
  return stats;
}

std::map<FeatureType, GrowthStatistics> GrowthAnalyzer::distributionByFeatureType(
  const std::vector<GrowthMetrics>& metrics,
  const std::vector<AnomalyRecord>& run2)
{
  auto const byId2 = indexById(run2);

  std::map<FeatureType, std::vector<GrowthMetrics>> grouped;
  for (const auto& m : metrics)
  {
    auto const it = byId2.find(m.anomaly2Id);
    if (it != byId2.end())
    {
      grouped[it->second->featureType()].push_back(m);
    }
  }

  std::map<FeatureType, GrowthStatistics> distribution;
  for (const auto& [type, group] : grouped)
  {
    distribution.emplace(type, computeStatistics(group));
  }
  return distribution;
}

}  // namespace ili_core
