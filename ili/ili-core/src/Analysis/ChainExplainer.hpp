// Ticket: 0011_chain_explanation

#ifndef ILI_CORE_ANALYSIS_CHAIN_EXPLAINER_HPP
#define ILI_CORE_ANALYSIS_CHAIN_EXPLAINER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ili-core/src/Analysis/AnomalyChain.hpp"

namespace ili_core
{

enum class GrowthTrend : uint8_t
{
  Accelerating,
  Stable,
  Decelerating
};

enum class UrgencyLevel : uint8_t
{
  Immediate,
  NearTerm,
  Scheduled,
  Monitor
};

std::string_view toString(GrowthTrend trend);
std::string_view toString(UrgencyLevel urgency);

// Growth-rate change separating a trend from measurement noise [pp / year]
static constexpr double kAccelerationThreshold = 0.1;

// Depth treated as critical for remaining-life projection [%]
static constexpr double kCriticalDepthPct = 80.0;

// Depth that always warrants immediate action [%]
static constexpr double kImmediateDepthPct = 70.0;

/**
 * @brief Trend of a chain from its acceleration.
 *
 * ACCELERATING above +0.1, DECELERATING below -0.1, otherwise STABLE.
 */
GrowthTrend classifyTrend(double acceleration);

/**
 * @brief Years until @p currentDepthPct reaches 80 %.
 *
 * Returns 0 at or beyond 80 %. A positive @p acceleration is assumed to
 * persist, raising the effective rate to rate + 2.5 * acceleration.
 * Returns nullopt when the effective rate is not positive.
 */
std::optional<double> projectYearsToCritical(double currentDepthPct,
                                             double growthRate,
                                             double acceleration);

/**
 * @brief Urgency from projected remaining life and current depth.
 *
 * IMMEDIATE at depth >= 70 % or <= 3 years; MONITOR without a projection;
 * NEAR_TERM <= 7 years; SCHEDULED <= 15 years; otherwise MONITOR.
 */
UrgencyLevel assessUrgency(std::optional<double> yearsToCritical,
                           double currentDepthPct);

/**
 * @brief Deterministic plain-language account of an anomaly chain.
 */
struct ChainExplanation
{
  std::string chainId;
  GrowthTrend trend{GrowthTrend::Stable};
  std::string severity;  // "slightly accelerating", "stable", ...
  UrgencyLevel urgency{UrgencyLevel::Monitor};
  std::optional<double> yearsToCritical;
  std::string lifecycleNarrative;
  std::string trendAnalysis;
  std::string projectionAnalysis;
  std::string recommendation;
  std::vector<std::string> concerns;
  double riskScore{0.0};
};

/**
 * @brief Rule-based explanation of chains: trend, projection, urgency.
 *
 * @ticket 0011_chain_explanation
 */
class ChainExplainer
{
public:
  struct Config
  {
    double concernDepthPct{60.0};
    double rapidGrowthRate{5.0};          // [pp / year]
    double lowMatchConfidence{0.7};
  };

  ChainExplainer() = default;
  explicit ChainExplainer(const Config& config) : config_{config}
  {
  }

  [[nodiscard]] ChainExplanation explain(const AnomalyChain& chain) const;

  /// Explanations for the first @p topN chains in the given order
  [[nodiscard]] std::vector<ChainExplanation> explainAll(
    const std::vector<AnomalyChain>& chains,
    size_t topN) const;

  /// Wording for the magnitude of an acceleration
  [[nodiscard]] static std::string severityFor(double acceleration);

private:
  Config config_{};
};

}  // namespace ili_core

#endif  // ILI_CORE_ANALYSIS_CHAIN_EXPLAINER_HPP
