// Ticket: 0010_three_way_chains

#include "ili-core/src/Analysis/ThreeWayAnalyzer.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "ili-core/src/Alignment/AlignmentQualityError.hpp"
#include "ili-core/src/Alignment/AlignmentValidator.hpp"

namespace ili_core
{

namespace
{

double clip01(double value)
{
  return std::clamp(value, 0.0, 1.0);
}

size_t countGirthWelds(const std::vector<ReferencePoint>& points)
{
  return static_cast<size_t>(
    std::count_if(points.begin(),
                  points.end(),
                  [](const ReferencePoint& p)
                  { return p.pointType == PointType::GirthWeld; }));
}

std::vector<ReferencePoint> sortedByDistance(std::vector<ReferencePoint> points)
{
  std::stable_sort(points.begin(),
                   points.end(),
                   [](const ReferencePoint& a, const ReferencePoint& b)
                   { return a.distance < b.distance; });
  return points;
}

size_t countClustered(const std::vector<AnomalyRecord>& anomalies)
{
  return static_cast<size_t>(
    std::count_if(anomalies.begin(),
                  anomalies.end(),
                  [](const AnomalyRecord& a) { return a.isClustered(); }));
}

}  // anonymous namespace

std::string_view toString(AnalysisStage stage)
{
  switch (stage)
  {
    case AnalysisStage::Idle:
      return "idle";
    case AnalysisStage::Load:
      return "load";
    case AnalysisStage::Cluster:
      return "cluster";
    case AnalysisStage::ExtractReferencePoints:
      return "extract_reference_points";
    case AnalysisStage::AlignFirstSecond:
      return "align_first_second";
    case AnalysisStage::AlignSecondThird:
      return "align_second_third";
    case AnalysisStage::MatchFirstSecond:
      return "match_first_second";
    case AnalysisStage::MatchSecondThird:
      return "match_second_third";
    case AnalysisStage::BuildChains:
      return "build_chains";
    case AnalysisStage::GrowthAndRisk:
      return "growth_and_risk";
    case AnalysisStage::Explain:
      return "explain";
    case AnalysisStage::Done:
      return "done";
  }
  return "idle";
}

ThreeWayAnalyzer::ThreeWayAnalyzer() : ThreeWayAnalyzer{Config{}}
{
}

ThreeWayAnalyzer::ThreeWayAnalyzer(const Config& config,
                                   std::shared_ptr<spdlog::logger> logger)
  : config_{config},
    logger_{std::move(logger)},
    clusterDetector_{config.clustering},
    aligner_{config.alignment},
    matcher_{config.matching, SimilarityCalculator{config.similarity}},
    growthAnalyzer_{config.growth},
    riskScorer_{config.risk},
    explainer_{config.explanation}
{
  if (!logger_)
  {
    throw std::invalid_argument{"ThreeWayAnalyzer: logger must not be null"};
  }
  if (config_.minReferencePoints < 2)
  {
    throw std::invalid_argument{
      "ThreeWayAnalyzer: at least 2 reference points are required for "
      "alignment"};
  }
}

void ThreeWayAnalyzer::enterStage(AnalysisStage stage)
{
  stage_ = stage;
  logger_->debug("Three-way analysis stage: {}", toString(stage));
}

// ============================================================================
// Pipeline
// ============================================================================

ThreeWayAnalysisResult ThreeWayAnalyzer::run(const InspectionRun& first,
                                             const InspectionRun& second,
                                             const InspectionRun& third)
{
  ThreeWayAnalysisResult result;

  // ===== Load =====
  enterStage(AnalysisStage::Load);
  std::array<const InspectionRun*, 3> const runs{&first, &second, &third};
  for (size_t k = 0; k < runs.size(); ++k)
  {
    if (runs[k]->runId.empty())
    {
      throw std::invalid_argument{"ThreeWayAnalyzer: run id must not be empty"};
    }
    result.runIds[k] = runs[k]->runId;
    result.anomalyCounts[k] = runs[k]->anomalies.size();
  }
  for (size_t k = 0; k < 2; ++k)
  {
    double const years =
      yearsBetween(runs[k]->inspectionDate, runs[k + 1]->inspectionDate);
    if (!(years > 0.0))
    {
      throw std::invalid_argument{fmt::format(
        "ThreeWayAnalyzer: inspection dates must increase ({} -> {})",
        runs[k]->runId,
        runs[k + 1]->runId)};
    }
    result.intervalYears[k] = years;
  }
  logger_->info("Loaded {} + {} + {} anomalies ({} / {} / {})",
                result.anomalyCounts[0],
                result.anomalyCounts[1],
                result.anomalyCounts[2],
                result.runIds[0],
                result.runIds[1],
                result.runIds[2]);

  // ===== Cluster =====
  enterStage(AnalysisStage::Cluster);
  std::array<ClusterDetector::Result, 3> clustered;
  size_t clusteredCount = 0;
  size_t totalAnomalies = 0;
  for (size_t k = 0; k < runs.size(); ++k)
  {
    clustered[k] = clusterDetector_.detect(runs[k]->anomalies, runs[k]->runId);
    result.zones[k] = clustered[k].zones;
    result.totalClusters += clustered[k].zones.size();
    clusteredCount += countClustered(clustered[k].anomalies);
    totalAnomalies += clustered[k].anomalies.size();
  }
  result.clusteredAnomalyPct =
    totalAnomalies > 0 ? static_cast<double>(clusteredCount) /
                           static_cast<double>(totalAnomalies) * 100.0
                       : 0.0;
  logger_->info("Interaction zones: {} total, {}/{} anomalies clustered",
                result.totalClusters,
                clusteredCount,
                totalAnomalies);

  // ===== Reference points =====
  enterStage(AnalysisStage::ExtractReferencePoints);
  for (const auto* run : runs)
  {
    logger_->info("{}: {} reference points ({} girth welds)",
                  run->runId,
                  run->referencePoints.size(),
                  countGirthWelds(run->referencePoints));
  }

  // ===== Alignment =====
  enterStage(AnalysisStage::AlignFirstSecond);
  std::vector<AnomalyRecord> const correctedFirst = alignAndCorrect(
    first, second, clustered[0].anomalies, result.alignments[0]);

  enterStage(AnalysisStage::AlignSecondThird);
  std::vector<AnomalyRecord> const correctedSecond = alignAndCorrect(
    second, third, clustered[1].anomalies, result.alignments[1]);

  // ===== Matching =====
  enterStage(AnalysisStage::MatchFirstSecond);
  MatchingResult const firstSecond =
    matcher_.match(correctedFirst, clustered[1].anomalies);
  result.matching[0] = firstSecond.statistics;

  enterStage(AnalysisStage::MatchSecondThird);
  MatchingResult const secondThird =
    matcher_.match(correctedSecond, clustered[2].anomalies);
  result.matching[1] = secondThird.statistics;

  for (size_t k = 0; k < 2; ++k)
  {
    logger_->info("Matched {} -> {}: {} pairs ({:.1f}% rate)",
                  result.runIds[k],
                  result.runIds[k + 1],
                  result.matching[k].matched,
                  result.matching[k].matchRate * 100.0);
  }

  // ===== Chains =====
  enterStage(AnalysisStage::BuildChains);
  result.chains = buildChains(result.runIds,
                              correctedFirst,
                              clustered[1].anomalies,
                              clustered[2].anomalies,
                              firstSecond.matches,
                              secondThird.matches);
  logger_->info("Found {} complete three-run chains", result.chains.size());

  // ===== Growth and risk =====
  enterStage(AnalysisStage::GrowthAndRisk);
  computeGrowthAndRisk(result.chains, result.intervalYears);

  result.growth[0] = growthAnalyzer_
                       .analyze(firstSecond.matches,
                                correctedFirst,
                                clustered[1].anomalies,
                                result.intervalYears[0])
                       .statistics;
  GrowthAnalyzer::Analysis const latestGrowth =
    growthAnalyzer_.analyze(secondThird.matches,
                            correctedSecond,
                            clustered[2].anomalies,
                            result.intervalYears[1]);
  result.growth[1] = latestGrowth.statistics;
  result.latestRunRisk = RiskScorer::rankByRisk(
    riskScorer_.scoreAnomalies(clustered[2].anomalies,
                               latestGrowth.growthMetrics,
                               third.referencePoints));

  std::stable_sort(result.chains.begin(),
                   result.chains.end(),
                   [](const AnomalyChain& a, const AnomalyChain& b)
                   { return a.riskScore > b.riskScore; });

  double rateSum0 = 0.0;
  double rateSum1 = 0.0;
  for (const auto& chain : result.chains)
  {
    switch (classifyTrend(chain.acceleration))
    {
      case GrowthTrend::Accelerating:
        ++result.acceleratingCount;
        break;
      case GrowthTrend::Stable:
        ++result.stableCount;
        break;
      case GrowthTrend::Decelerating:
        ++result.deceleratingCount;
        break;
    }
    if (chain.depthPct[2] >= kImmediateDepthPct ||
        (chain.yearsTo80Pct.has_value() && *chain.yearsTo80Pct <= 3.0))
    {
      ++result.immediateActionCount;
    }
    rateSum0 += chain.growthRates[0];
    rateSum1 += chain.growthRates[1];
  }
  if (!result.chains.empty())
  {
    auto const n = static_cast<double>(result.chains.size());
    result.meanGrowthRates = {rateSum0 / n, rateSum1 / n};
  }
  logger_->info("Accelerating: {} | Stable: {} | Decelerating: {} | "
                "Immediate action: {}",
                result.acceleratingCount,
                result.stableCount,
                result.deceleratingCount,
                result.immediateActionCount);

  // ===== Explain =====
  if (config_.explainChains)
  {
    enterStage(AnalysisStage::Explain);
    result.explanations =
      explainer_.explainAll(result.chains, config_.topNExplain);
  }

  enterStage(AnalysisStage::Done);
  return result;
}

// ============================================================================
// Alignment
// ============================================================================

ThreeWayAnalyzer::ReferenceSelection ThreeWayAnalyzer::selectReferencePoints(
  const std::vector<ReferencePoint>& source,
  const std::vector<ReferencePoint>& target) const
{
  ReferenceSelection selection;
  if (countGirthWelds(source) >= config_.minGirthWelds &&
      countGirthWelds(target) >= config_.minGirthWelds)
  {
    auto keepWelds = [](const std::vector<ReferencePoint>& points)
    {
      std::vector<ReferencePoint> welds;
      std::copy_if(points.begin(),
                   points.end(),
                   std::back_inserter(welds),
                   [](const ReferencePoint& p)
                   { return p.pointType == PointType::GirthWeld; });
      return welds;
    };
    selection.source = sortedByDistance(keepWelds(source));
    selection.target = sortedByDistance(keepWelds(target));
    selection.girthWeldsOnly = true;
  }
  else
  {
    selection.source = sortedByDistance(source);
    selection.target = sortedByDistance(target);
  }
  return selection;
}

std::vector<AnomalyRecord> ThreeWayAnalyzer::alignAndCorrect(
  const InspectionRun& source,
  const InspectionRun& target,
  const std::vector<AnomalyRecord>& sourceAnomalies,
  IntervalAlignment& outcome) const
{
  outcome.sourceRunId = source.runId;
  outcome.targetRunId = target.runId;

  ReferenceSelection const selection =
    selectReferencePoints(source.referencePoints, target.referencePoints);
  outcome.sourceReferencePoints = selection.source.size();
  outcome.targetReferencePoints = selection.target.size();
  outcome.usedGirthWeldsOnly = selection.girthWeldsOnly;

  if (selection.source.size() < config_.minReferencePoints ||
      selection.target.size() < config_.minReferencePoints)
  {
    outcome.fallbackReason = fmt::format(
      "Insufficient reference points: {} in {}, {} in {} (minimum: {} each)",
      selection.source.size(),
      source.runId,
      selection.target.size(),
      target.runId,
      config_.minReferencePoints);
    logger_->warn("{} -> {}: {}; using uncorrected distances",
                  source.runId,
                  target.runId,
                  *outcome.fallbackReason);
    return sourceAnomalies;
  }

  try
  {
    AlignmentResult const alignment =
      aligner_.align(selection.source, selection.target);
    DistanceCorrectionFunction const correction{alignment};

    outcome.correctionApplied = true;
    outcome.matchRate = alignment.matchRate();
    outcome.rmse = alignment.rmse();
    outcome.matchedPairs = alignment.matchedPoints().size();
    outcome.correction = correction.info();

    logger_->info("{} -> {}: DTW applied, match rate {:.1f}%, RMSE {:.2f} ft, "
                  "mean correction {:+.2f} ft",
                  source.runId,
                  target.runId,
                  outcome.matchRate,
                  outcome.rmse,
                  outcome.correction->meanCorrection);
    return correction.correctAnomalies(sourceAnomalies);
  }
  catch (const AlignmentQualityError& e)
  {
    outcome.matchRate = e.matchRate();
    outcome.rmse = e.rmse();
    outcome.fallbackReason = std::string{"DTW alignment failed: "} + e.what();

    AlignmentValidator const validator{aligner_.getConfig().thresholds};
    AlignmentValidator::Report const report = validator.validate(
      aligner_.computeAlignment(selection.source, selection.target),
      selection.source,
      selection.target);
    outcome.matchedPairs = report.diagnostics.totalPairs;
    outcome.validationWarnings = report.warnings;
    logger_->debug("{}", validator.formatReport(report));
  }
  catch (const std::invalid_argument& e)
  {
    outcome.fallbackReason = std::string{"DTW alignment failed: "} + e.what();
  }

  logger_->warn("{} -> {}: {}; using uncorrected distances",
                source.runId,
                target.runId,
                *outcome.fallbackReason);
  return sourceAnomalies;
}

// ============================================================================
// Chains
// ============================================================================

std::vector<AnomalyChain> ThreeWayAnalyzer::buildChains(
  const std::array<std::string, 3>& runIds,
  const std::vector<AnomalyRecord>& first,
  const std::vector<AnomalyRecord>& second,
  const std::vector<AnomalyRecord>& third,
  const std::vector<Match>& firstSecond,
  const std::vector<Match>& secondThird)
{
  // Both interval indices are keyed by the middle-run anomaly id
  std::unordered_map<std::string, const Match*> bySecondOutgoing;
  for (const auto& match : secondThird)
  {
    bySecondOutgoing.emplace(match.anomaly1Id(), &match);
  }

  auto index = [](const std::vector<AnomalyRecord>& anomalies)
  {
    std::unordered_map<std::string, const AnomalyRecord*> byId;
    for (const auto& anomaly : anomalies)
    {
      byId.emplace(anomaly.id(), &anomaly);
    }
    return byId;
  };
  auto const byId0 = index(first);
  auto const byId1 = index(second);
  auto const byId2 = index(third);

  std::vector<AnomalyChain> chains;
  for (const auto& incoming : firstSecond)
  {
    auto const link = bySecondOutgoing.find(incoming.anomaly2Id());
    if (link == bySecondOutgoing.end())
    {
      continue;
    }
    const Match& outgoing = *link->second;

    auto const a0 = byId0.find(incoming.anomaly1Id());
    auto const a1 = byId1.find(incoming.anomaly2Id());
    auto const a2 = byId2.find(outgoing.anomaly2Id());
    if (a0 == byId0.end() || a1 == byId1.end() || a2 == byId2.end())
    {
      continue;
    }

    AnomalyChain chain;
    chain.chainId = fmt::format("CHAIN_{:04d}", chains.size());
    chain.runIds = runIds;
    chain.anomalyIds = {a0->second->id(), a1->second->id(), a2->second->id()};
    chain.matchSimilarities = {incoming.similarityScore(),
                               outgoing.similarityScore()};
    chain.depthPct = {a0->second->depthPct(),
                      a1->second->depthPct(),
                      a2->second->depthPct()};
    chains.push_back(std::move(chain));
  }
  return chains;
}

void ThreeWayAnalyzer::computeGrowthAndRisk(
  std::vector<AnomalyChain>& chains,
  const std::array<double, 2>& intervalYears)
{
  for (auto& chain : chains)
  {
    chain.intervalYears = intervalYears;
    chain.growthRates = {GrowthAnalyzer::growthRate(
                           chain.depthPct[0], chain.depthPct[1], intervalYears[0]),
                         GrowthAnalyzer::growthRate(
                           chain.depthPct[1], chain.depthPct[2], intervalYears[1])};
    chain.acceleration = chain.growthRates[1] - chain.growthRates[0];
    chain.isAccelerating = chain.acceleration > kAccelerationThreshold;

    double const depthRisk = clip01(chain.depthPct[2] / 100.0) * 0.5;
    double const growthRisk =
      clip01(std::max(chain.growthRates[1], 0.0) / 10.0) * 0.3;
    double const accelerationRisk =
      clip01(std::max(chain.acceleration, 0.0) / 5.0) * 0.2;
    chain.riskScore = depthRisk + growthRisk + accelerationRisk;

    chain.yearsTo80Pct = projectYearsToCritical(
      chain.depthPct[2], chain.growthRates[1], chain.acceleration);
  }
}

}  // namespace ili_core
