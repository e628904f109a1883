// Ticket: 0008_growth_analysis

#ifndef ILI_CORE_GROWTH_GROWTH_METRICS_HPP
#define ILI_CORE_GROWTH_GROWTH_METRICS_HPP

#include <cstddef>
#include <string>

namespace ili_core
{

/**
 * @brief Annualised growth of one matched anomaly between two runs.
 *
 * Rates are signed: negative values indicate measurement noise or repair.
 */
struct GrowthMetrics
{
  std::string matchId;
  std::string anomaly1Id;
  std::string anomaly2Id;
  double timeIntervalYears{0.0};
  double depthGrowthRate{0.0};   // [percentage points / year]
  double lengthGrowthRate{0.0};  // [in / year]
  double widthGrowthRate{0.0};   // [in / year]
  bool isRapidGrowth{false};
  double riskScore{0.0};  // Filled in by RiskScorer
};

/// Five-number-style summary of one growth dimension
struct RateStatistics
{
  double mean{0.0};
  double median{0.0};
  double stdDev{0.0};  // Sample standard deviation, 0 for a single value
  double min{0.0};
  double max{0.0};
};

struct GrowthStatistics
{
  size_t totalMatches{0};
  size_t rapidGrowthCount{0};
  double rapidGrowthPercentage{0.0};  // [%]
  RateStatistics depth;
  RateStatistics length;
  RateStatistics width;
};

struct RapidGrowthAnomaly
{
  std::string anomalyId;  // Run-2 anomaly
  double depthGrowthRate{0.0};
  double currentDepthPct{0.0};
  double distance{0.0};
  double clockPosition{0.0};
};

}  // namespace ili_core

#endif  // ILI_CORE_GROWTH_GROWTH_METRICS_HPP
