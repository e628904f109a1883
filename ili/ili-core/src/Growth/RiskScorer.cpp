// Ticket: 0009_risk_scoring

#include "ili-core/src/Growth/RiskScorer.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace ili_core
{

namespace
{

double clip01(double value)
{
  return std::clamp(value, 0.0, 1.0);
}

}  // anonymous namespace

RiskScorer::RiskScorer() : RiskScorer{Config{}}
{
}

RiskScorer::RiskScorer(const Config& config) : config_{config}
{
  double const sum =
    config_.depthWeight + config_.growthWeight + config_.locationWeight;
  if (std::abs(sum - 1.0) > kWeightTolerance)
  {
    throw std::invalid_argument{
      "RiskScorer: depth, growth and location weights must sum to 1.0, got " +
      std::to_string(sum)};
  }
  if (config_.depthWeight < 0.0 || config_.growthWeight < 0.0 ||
      config_.locationWeight < 0.0 || config_.clusterBoost < 0.0)
  {
    throw std::invalid_argument{
      "RiskScorer: weights and cluster boost must be non-negative"};
  }
}

double RiskScorer::locationFactor(
  const AnomalyRecord& anomaly,
  const std::vector<ReferencePoint>& referencePoints) const
{
  if (referencePoints.empty())
  {
    return kBaseLocationFactor;
  }

  double nearest = std::numeric_limits<double>::infinity();
  for (const auto& point : referencePoints)
  {
    nearest = std::min(nearest, std::abs(point.distance - anomaly.distance()));
  }

  if (nearest < kNearReferenceFt)
  {
    return 1.0;
  }
  if (nearest < kFarReferenceFt)
  {
    double const fraction =
      (nearest - kNearReferenceFt) / (kFarReferenceFt - kNearReferenceFt);
    return 1.0 - fraction * (1.0 - kBaseLocationFactor);
  }
  return kBaseLocationFactor;
}

double RiskScorer::score(const AnomalyRecord& anomaly,
                         double growthRate,
                         double locationFactor) const
{
  double const base =
    config_.depthWeight * clip01(anomaly.depthPct() / kDepthNormalization) +
    config_.growthWeight * clip01(growthRate / kGrowthNormalization) +
    config_.locationWeight * locationFactor;

  double risk = clip01(base);
  if (anomaly.isClustered())
  {
    risk = std::min(risk + config_.clusterBoost, 1.0);
  }
  return risk;
}

RiskAssessment RiskScorer::assess(
  const AnomalyRecord& anomaly,
  double growthRate,
  const std::vector<ReferencePoint>& referencePoints) const
{
  RiskAssessment assessment;
  assessment.anomalyId = anomaly.id();
  assessment.depthPct = anomaly.depthPct();
  assessment.growthRate = growthRate;
  assessment.locationFactor = locationFactor(anomaly, referencePoints);
  assessment.isClustered = anomaly.isClustered();

  assessment.depthContribution =
    config_.depthWeight * clip01(anomaly.depthPct() / kDepthNormalization);
  assessment.growthContribution =
    config_.growthWeight * clip01(growthRate / kGrowthNormalization);
  assessment.locationContribution =
    config_.locationWeight * assessment.locationFactor;

  assessment.riskScore = score(anomaly, growthRate, assessment.locationFactor);
  double const unboosted =
    clip01(assessment.depthContribution + assessment.growthContribution +
           assessment.locationContribution);
  assessment.clusterContribution = assessment.riskScore - unboosted;
  return assessment;
}

std::vector<RiskAssessment> RiskScorer::scoreAnomalies(
  const std::vector<AnomalyRecord>& anomalies,
  const std::vector<GrowthMetrics>& growthMetrics,
  const std::vector<ReferencePoint>& referencePoints) const
{
  std::unordered_map<std::string, double> growthById;
  for (const auto& metrics : growthMetrics)
  {
    growthById[metrics.anomaly2Id] = metrics.depthGrowthRate;
  }

  std::vector<RiskAssessment> assessments;
  assessments.reserve(anomalies.size());
  for (const auto& anomaly : anomalies)
  {
    auto const it = growthById.find(anomaly.id());
    double const rate = (it != growthById.end()) ? it->second : 0.0;
    assessments.push_back(assess(anomaly, rate, referencePoints));
  }
  return assessments;
}

std::vector<GrowthMetrics> RiskScorer::scoreGrowthMetrics(
  const std::vector<GrowthMetrics>& growthMetrics,
  const std::vector<AnomalyRecord>& run2,
  const std::vector<ReferencePoint>& referencePoints) const
{
  std::unordered_map<std::string, const AnomalyRecord*> byId;
  for (const auto& anomaly : run2)
  {
    byId.emplace(anomaly.id(), &anomaly);
  }

  std::vector<GrowthMetrics> scored = growthMetrics;
  for (auto& metrics : scored)
  {
    auto const it = byId.find(metrics.anomaly2Id);
    if (it == byId.end())
    {
      continue;
    }
    const AnomalyRecord& anomaly = *it->second;
    metrics.riskScore = score(anomaly,
                              metrics.depthGrowthRate,
                              locationFactor(anomaly, referencePoints));
  }
  return scored;
}

std::vector<RiskAssessment> RiskScorer::rankByRisk(
  std::vector<RiskAssessment> assessments,
  std::optional<size_t> topN)
{
  std::stable_sort(assessments.begin(),
                   assessments.end(),
                   [](const RiskAssessment& a, const RiskAssessment& b)
                   { return a.riskScore > b.riskScore; });
  if (topN.has_value() && *topN < assessments.size())
  {
    assessments.resize(*topN);
  }
  return assessments;
}

std::vector<RiskAssessment> RiskScorer::highRiskAnomalies(
  const std::vector<RiskAssessment>& assessments,
  double threshold)
{
  std::vector<RiskAssessment> high;
  std::copy_if(assessments.begin(),
               assessments.end(),
               std::back_inserter(high),
               [threshold](const RiskAssessment& a)
               { return a.riskScore >= threshold; });
  return rankByRisk(std::move(high));
}

}  // namespace ili_core
