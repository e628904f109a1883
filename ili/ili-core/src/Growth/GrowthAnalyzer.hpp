// Ticket: 0008_growth_analysis

#ifndef ILI_CORE_GROWTH_GROWTH_ANALYZER_HPP
#define ILI_CORE_GROWTH_GROWTH_ANALYZER_HPP

#include <map>
#include <vector>

#include "ili-core/src/DataTypes/AnomalyRecord.hpp"
#include "ili-core/src/Growth/GrowthMetrics.hpp"
#include "ili-core/src/Matching/Match.hpp"

namespace ili_core
{

/**
 * @brief Computes annualised growth for matched anomaly pairs.
 *
 * rate = (value_run2 - value_run1) / timeIntervalYears for depth, length and
 * width. A depth rate strictly above rapidGrowthThreshold flags rapid growth.
 *
 * @ticket 0008_growth_analysis
 */
class GrowthAnalyzer
{
public:
  struct Config
  {
    double rapidGrowthThreshold{5.0};  // [percentage points / year]
  };

  struct Analysis
  {
    std::vector<GrowthMetrics> growthMetrics;
    GrowthStatistics statistics;
    std::vector<RapidGrowthAnomaly> rapidGrowthAnomalies;
  };

  GrowthAnalyzer();
  explicit GrowthAnalyzer(const Config& config);

  /**
   * @brief Signed annual rate of change.
   * @throws std::invalid_argument if @p timeIntervalYears <= 0
   */
  [[nodiscard]] static double growthRate(double initialValue,
                                         double finalValue,
                                         double timeIntervalYears);

  [[nodiscard]] bool isRapidGrowth(double depthGrowthRate) const
  {
    return depthGrowthRate > config_.rapidGrowthThreshold;
  }

  /**
   * @brief Growth of a single matched pair.
   * @throws std::invalid_argument if @p timeIntervalYears <= 0
   */
  [[nodiscard]] GrowthMetrics calculateMatchGrowth(
    const Match& match,
    const AnomalyRecord& anomaly1,
    const AnomalyRecord& anomaly2,
    double timeIntervalYears) const;

  /**
   * @brief Growth for every match plus summary statistics.
   *
   * Matches whose anomaly ids are absent from @p run1 or @p run2 are
   * skipped.
   *
   * @throws std::invalid_argument if @p timeIntervalYears <= 0, even when
   *         @p matches is empty
   */
  [[nodiscard]] Analysis analyze(const std::vector<Match>& matches,
                                 const std::vector<AnomalyRecord>& run1,
                                 const std::vector<AnomalyRecord>& run2,
                                 double timeIntervalYears) const;

  /// Summary statistics over a set of growth metrics
  [[nodiscard]] static GrowthStatistics computeStatistics(
    const std::vector<GrowthMetrics>& metrics);

  /**
   * @brief Statistics grouped by the run-2 anomaly's feature type.
   *
   * Metrics whose run-2 anomaly is not in @p run2 are ignored.
   */
  [[nodiscard]] static std::map<FeatureType, GrowthStatistics>
  distributionByFeatureType(const std::vector<GrowthMetrics>& metrics,
                            const std::vector<AnomalyRecord>& run2);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
};

}  // namespace ili_core

#endif  // ILI_CORE_GROWTH_GROWTH_ANALYZER_HPP
