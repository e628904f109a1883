// Ticket: 0007_interaction_zones

#include "ili-core/src/Clustering/ClusterDetector.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <deque>
#include <map>
#include <numbers>
#include <stdexcept>

#include "ili-core/src/DataTypes/ClockPosition.hpp"

namespace ili_core
{

namespace
{

constexpr int kUnvisited = -2;
constexpr double kEpsilon = 1.0;
constexpr double kMinChord = 1e-9;

}  // anonymous namespace

ClusterDetector::ClusterDetector() : ClusterDetector{Config{}}
{
}

ClusterDetector::ClusterDetector(const Config& config) : config_{config}
{
  if (!(config_.axialThresholdFt > 0.0))
  {
    throw std::invalid_argument{
      "ClusterDetector: axial threshold must be positive, got " +
      std::to_string(config_.axialThresholdFt)};
  }
  if (!(config_.clockThreshold > 0.0))
  {
    throw std::invalid_argument{
      "ClusterDetector: clock threshold must be positive, got " +
      std::to_string(config_.clockThreshold)};
  }
  if (config_.minClusterSize < 2)
  {
    throw std::invalid_argument{
      "ClusterDetector: minimum cluster size must be >= 2, got " +
      std::to_string(config_.minClusterSize)};
  }

  // Chord subtended by clockThreshold hours on the unit embedding circle
  double const halfAngle =
    std::numbers::pi * config_.clockThreshold / kClockEmbeddingHours;
  double const chord = (2.0 * halfAngle < std::numbers::pi)
                         ? 2.0 * std::sin(halfAngle)
                         : 2.0;
  chordAtThreshold_ = std::max(chord, kMinChord);
}

// ============================================================================
// Zone detection
// ============================================================================

ClusterDetector::Result ClusterDetector::detect(
  const std::vector<AnomalyRecord>& anomalies,
  const std::string& runId) const
{
  Result result;
  // Zone ids from an earlier pass are replaced, not accumulated
  result.anomalies.reserve(anomalies.size());
  for (const auto& anomaly : anomalies)
  {
    result.anomalies.push_back(anomaly.withoutClusterId());
  }

  if (anomalies.size() < static_cast<size_t>(config_.minClusterSize))
  {
    return result;
  }

  std::vector<int> const labels = dbscan(embed(anomalies));

  // Group member indices by label; std::map keeps labels sorted
  std::map<int, std::vector<size_t>> members;
  for (size_t i = 0; i < labels.size(); ++i)
  {
    if (labels[i] != kNoise)
    {
      members[labels[i]].push_back(i);
    }
  }

  for (const auto& [label, indices] : members)
  {
    InteractionZone zone;
    zone.zoneId = fmt::format("ZONE_{}_{:04d}", runId, label);
    zone.runId = runId;
    zone.anomalyCount = indices.size();

    std::vector<double> clocks;
    clocks.reserve(indices.size());
    double distanceSum = 0.0;
    double minDistance = anomalies[indices.front()].distance();
    double maxDistance = minDistance;

    for (size_t const i : indices)
    {
      const AnomalyRecord& anomaly = anomalies[i];
      zone.anomalyIds.push_back(anomaly.id());
      clocks.push_back(anomaly.clockPosition());
      distanceSum += anomaly.distance();
      minDistance = std::min(minDistance, anomaly.distance());
      maxDistance = std::max(maxDistance, anomaly.distance());
      zone.maxDepthPct = std::max(zone.maxDepthPct, anomaly.depthPct());
      zone.combinedLengthIn += anomaly.length();

      result.anomalies[i] = anomaly.withClusterId(zone.zoneId);
    }

    zone.centroidDistance = distanceSum / static_cast<double>(indices.size());
    zone.spanDistanceFt = maxDistance - minDistance;
    zone.centroidClock = circularMeanClock(clocks);
    zone.spanClock = circularSpanClock(std::move(clocks));

    result.zones.push_back(std::move(zone));
  }

  spdlog::debug("Run {}: {} interaction zones among {} anomalies",
                runId,
                result.zones.size(),
                anomalies.size());

  return result;
}

std::vector<Eigen::Vector3d> ClusterDetector::embed(
  const std::vector<AnomalyRecord>& anomalies) const
{
  std::vector<Eigen::Vector3d> points;
  points.reserve(anomalies.size());
  for (const auto& anomaly : anomalies)
  {
    double const theta = clockToAngle(anomaly.clockPosition());
    points.emplace_back(anomaly.distance() / config_.axialThresholdFt,
                        std::cos(theta) / chordAtThreshold_,
                        std::sin(theta) / chordAtThreshold_);
  }
  return points;
}

// ============================================================================
// DBSCAN
// ============================================================================

std::vector<int> ClusterDetector::dbscan(
  const std::vector<Eigen::Vector3d>& points) const
{
  std::vector<int> labels(points.size(), kUnvisited);
  int clusterId = 0;

  for (size_t i = 0; i < points.size(); ++i)
  {
    if (labels[i] != kUnvisited)
    {
      continue;
    }

    std::vector<size_t> neighbors = regionQuery(i, points);
    if (neighbors.size() < static_cast<size_t>(config_.minClusterSize))
    {
      labels[i] = kNoise;  // May be claimed later as a border point
      continue;
    }

    expandCluster(i, std::move(neighbors), labels, points, clusterId);
    ++clusterId;
  }

  return labels;
}

std::vector<size_t> ClusterDetector::regionQuery(
  size_t index,
  const std::vector<Eigen::Vector3d>& points) const
{
  std::vector<size_t> neighbors;
  for (size_t j = 0; j < points.size(); ++j)
  {
    if ((points[j] - points[index]).norm() <= kEpsilon)
    {
      neighbors.push_back(j);
    }
  }
  return neighbors;
}

void ClusterDetector::expandCluster(size_t index,
                                    std::vector<size_t> neighbors,
                                    std::vector<int>& labels,
                                    const std::vector<Eigen::Vector3d>& points,
                                    int clusterId) const
{
  labels[index] = clusterId;
  std::deque<size_t> frontier(neighbors.begin(), neighbors.end());

  while (!frontier.empty())
  {
    size_t const q = frontier.front();
    frontier.pop_front();

    if (labels[q] == kNoise)
    {
      labels[q] = clusterId;  // Border point
      continue;
    }
    if (labels[q] != kUnvisited)
    {
      continue;
    }

    labels[q] = clusterId;
    std::vector<size_t> const qNeighbors = regionQuery(q, points);
    if (qNeighbors.size() >= static_cast<size_t>(config_.minClusterSize))
    {
      frontier.insert(frontier.end(), qNeighbors.begin(), qNeighbors.end());
    }
  }
}

// ============================================================================
// Circular clock statistics
// ============================================================================

double ClusterDetector::circularMeanClock(const std::vector<double>& clocks)
{
  if (clocks.empty())
  {
    return 0.0;
  }
  double sumSin = 0.0;
  double sumCos = 0.0;
  for (double const clock : clocks)
  {
    double const theta = clockToAngle(clock);
    sumSin += std::sin(theta);
    sumCos += std::cos(theta);
  }
  return angleToClock(std::atan2(sumSin, sumCos));
}

double ClusterDetector::circularSpanClock(std::vector<double> clocks)
{
  if (clocks.size() < 2)
  {
    return 0.0;
  }
  std::sort(clocks.begin(), clocks.end());

  // 1 and 12 coincide on the 11-hour circle, so the wrap gap closes there
  double maxGap = (12.0 - clocks.back()) + (clocks.front() - 1.0);
  for (size_t i = 1; i < clocks.size(); ++i)
  {
    maxGap = std::max(maxGap, clocks[i] - clocks[i - 1]);
  }
  return std::max(kClockEmbeddingHours - maxGap, 0.0);
}

}  // namespace ili_core
