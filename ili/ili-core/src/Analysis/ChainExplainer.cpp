// Ticket: 0011_chain_explanation

#include "ili-core/src/Analysis/ChainExplainer.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace ili_core
{

std::string_view toString(GrowthTrend trend)
{
  switch (trend)
  {
    case GrowthTrend::Accelerating:
      return "ACCELERATING";
    case GrowthTrend::Stable:
      return "STABLE";
    case GrowthTrend::Decelerating:
      return "DECELERATING";
  }
  return "STABLE";
}

std::string_view toString(UrgencyLevel urgency)
{
  switch (urgency)
  {
    case UrgencyLevel::Immediate:
      return "IMMEDIATE";
    case UrgencyLevel::NearTerm:
      return "NEAR_TERM";
    case UrgencyLevel::Scheduled:
      return "SCHEDULED";
    case UrgencyLevel::Monitor:
      return "MONITOR";
  }
  return "MONITOR";
}

GrowthTrend classifyTrend(double acceleration)
{
  if (acceleration > kAccelerationThreshold)
  {
    return GrowthTrend::Accelerating;
  }
  if (acceleration < -kAccelerationThreshold)
  {
    return GrowthTrend::Decelerating;
  }
  return GrowthTrend::Stable;
}

std::optional<double> projectYearsToCritical(double currentDepthPct,
                                             double growthRate,
                                             double acceleration)
{
  if (currentDepthPct >= kCriticalDepthPct)
  {
    return 0.0;
  }

  // A positive acceleration is carried forward over a 5-year horizon
  double effectiveRate = growthRate;
  if (acceleration > 0.0)
  {
    effectiveRate = growthRate + 2.5 * acceleration;
  }
  if (effectiveRate <= 0.0)
  {
    return std::nullopt;
  }
  return (kCriticalDepthPct - currentDepthPct) / effectiveRate;
}

UrgencyLevel assessUrgency(std::optional<double> yearsToCritical,
                           double currentDepthPct)
{
  if (currentDepthPct >= kImmediateDepthPct)
  {
    return UrgencyLevel::Immediate;
  }
  if (!yearsToCritical.has_value())
  {
    return UrgencyLevel::Monitor;
  }
  double const years = *yearsToCritical;
  if (years <= 3.0)
  {
    return UrgencyLevel::Immediate;
  }
  if (years <= 7.0)
  {
    return UrgencyLevel::NearTerm;
  }
  if (years <= 15.0)
  {
    return UrgencyLevel::Scheduled;
  }
  return UrgencyLevel::Monitor;
}

// ============================================================================
// ChainExplainer
// ============================================================================

std::string ChainExplainer::severityFor(double acceleration)
{
  switch (classifyTrend(acceleration))
  {
    case GrowthTrend::Accelerating:
      if (acceleration > 1.0)
      {
        return "rapidly accelerating";
      }
      return acceleration > 0.5 ? "moderately accelerating"
                                : "slightly accelerating";
    case GrowthTrend::Decelerating:
      if (acceleration < -1.0)
      {
        return "rapidly decelerating";
      }
      return acceleration < -0.5 ? "moderately decelerating"
                                 : "slightly decelerating";
    case GrowthTrend::Stable:
      break;
  }
  return "stable";
}

ChainExplanation ChainExplainer::explain(const AnomalyChain& chain) const
{
  ChainExplanation out;
  out.chainId = chain.chainId;
  out.riskScore = chain.riskScore;
  out.trend = classifyTrend(chain.acceleration);
  out.severity = severityFor(chain.acceleration);

  double const currentDepth = chain.depthPct[2];
  double const currentRate = chain.growthRates[1];
  out.yearsToCritical =
    projectYearsToCritical(currentDepth, currentRate, chain.acceleration);
  out.urgency = assessUrgency(out.yearsToCritical, currentDepth);

  out.lifecycleNarrative = fmt::format(
    "First detected in {} at {:.1f}% depth. By {} it had grown to {:.1f}% "
    "({:.2f} pp/yr over {:.1f} years). By {} it reached {:.1f}% "
    "({:.2f} pp/yr over {:.1f} years).",
    chain.runIds[0],
    chain.depthPct[0],
    chain.runIds[1],
    chain.depthPct[1],
    chain.growthRates[0],
    chain.intervalYears[0],
    chain.runIds[2],
    chain.depthPct[2],
    chain.growthRates[1],
    chain.intervalYears[1]);

  out.trendAnalysis = fmt::format(
    "Growth rate changed from {:.2f} pp/yr to {:.2f} pp/yr. "
    "Acceleration: {:+.3f} pp/yr. Trend: {} ({}).",
    chain.growthRates[0],
    chain.growthRates[1],
    chain.acceleration,
    out.severity,
    toString(out.trend));

  if (out.yearsToCritical.has_value() && *out.yearsToCritical > 0.0)
  {
    out.projectionAnalysis = fmt::format(
      "At the current growth rate ({:.2f} pp/yr) this anomaly reaches the "
      "80% critical threshold in approximately {:.1f} years.",
      currentRate,
      *out.yearsToCritical);
  }
  else if (out.yearsToCritical.has_value())
  {
    out.projectionAnalysis = fmt::format(
      "Already beyond the 80% critical threshold at {:.1f}% depth.",
      currentDepth);
  }
  else
  {
    out.projectionAnalysis = fmt::format(
      "Growth rate is not positive ({:.2f} pp/yr); stable or shrinking at "
      "{:.1f}% depth.",
      currentRate,
      currentDepth);
  }

  switch (out.urgency)
  {
    case UrgencyLevel::Immediate:
      out.recommendation =
        "Immediate action required. Schedule excavation and direct "
        "assessment.";
      break;
    case UrgencyLevel::NearTerm:
      out.recommendation =
        "Schedule repair within the next inspection cycle (3-7 years) and "
        "increase monitoring frequency.";
      break;
    case UrgencyLevel::Scheduled:
      out.recommendation =
        "Include in the next scheduled maintenance program.";
      break;
    case UrgencyLevel::Monitor:
      out.recommendation =
        "Continue standard monitoring and reassess at the next inspection.";
      break;
  }

  if (out.trend == GrowthTrend::Accelerating)
  {
    out.concerns.push_back(
      fmt::format("Growth is accelerating ({:+.3f} pp/yr)", chain.acceleration));
  }
  if (currentDepth > config_.concernDepthPct)
  {
    out.concerns.push_back(fmt::format("Current depth ({:.1f}%) exceeds {:.0f}%",
                                       currentDepth,
                                       config_.concernDepthPct));
  }
  if (currentRate > config_.rapidGrowthRate)
  {
    out.concerns.push_back(
      fmt::format("Rapid growth rate ({:.2f} pp/yr)", currentRate));
  }
  double const minConfidence =
    std::min(chain.matchSimilarities[0], chain.matchSimilarities[1]);
  if (minConfidence < config_.lowMatchConfidence)
  {
    out.concerns.push_back(fmt::format(
      "Low match confidence ({:.3f}), verify chain linkage", minConfidence));
  }

  return out;
}

std::vector<ChainExplanation> ChainExplainer::explainAll(
  const std::vector<AnomalyChain>& chains,
  size_t topN) const
{
  std::vector<ChainExplanation> explanations;
  size_t const count = std::min(topN, chains.size());
  explanations.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    explanations.push_back(explain(chains[i]));
  }
  return explanations;
}

}  // namespace ili_core
