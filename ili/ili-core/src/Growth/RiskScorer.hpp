// Ticket: 0009_risk_scoring

#ifndef ILI_CORE_GROWTH_RISK_SCORER_HPP
#define ILI_CORE_GROWTH_RISK_SCORER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ili-core/src/DataTypes/AnomalyRecord.hpp"
#include "ili-core/src/DataTypes/ReferencePoint.hpp"
#include "ili-core/src/Growth/GrowthMetrics.hpp"

namespace ili_core
{

/**
 * @brief Component breakdown of one anomaly's risk score.
 */
struct RiskAssessment
{
  std::string anomalyId;
  double riskScore{0.0};  // [0, 1]
  double depthPct{0.0};
  double growthRate{0.0};  // [percentage points / year]
  double locationFactor{0.5};
  double depthContribution{0.0};
  double growthContribution{0.0};
  double locationContribution{0.0};
  double clusterContribution{0.0};
  bool isClustered{false};
};

/**
 * @brief Composite [0, 1] risk score for a single anomaly.
 *
 *   risk = wd * clip(depth / 100) + wg * clip(growth / 10) + wl * location
 *
 * clipped to [0, 1]. Clustered anomalies receive an additive clusterBoost,
 * capped at 1. The location factor rises near reference points (welds and
 * fittings concentrate stress): 1.0 within 3 ft, decaying linearly to 0.5
 * at 10 ft, 0.5 beyond or with no reference points.
 *
 * @ticket 0009_risk_scoring
 */
class RiskScorer
{
public:
  struct Config
  {
    double depthWeight{0.6};
    double growthWeight{0.3};
    double locationWeight{0.1};
    double clusterBoost{0.1};
  };

  static constexpr double kDepthNormalization = 100.0;   // [%]
  static constexpr double kGrowthNormalization = 10.0;   // [pp / year]
  static constexpr double kNearReferenceFt = 3.0;
  static constexpr double kFarReferenceFt = 10.0;
  static constexpr double kBaseLocationFactor = 0.5;
  static constexpr double kDefaultHighRiskThreshold = 0.7;
  static constexpr double kWeightTolerance = 1e-6;

  RiskScorer();

  /**
   * @throws std::invalid_argument if the three weights do not sum to 1
   *         within kWeightTolerance, or any weight or boost is negative
   */
  explicit RiskScorer(const Config& config);

  /// Proximity factor of @p anomaly to the nearest reference point
  [[nodiscard]] double locationFactor(
    const AnomalyRecord& anomaly,
    const std::vector<ReferencePoint>& referencePoints) const;

  /// Final risk score in [0, 1]
  [[nodiscard]] double score(const AnomalyRecord& anomaly,
                             double growthRate,
                             double locationFactor) const;

  /// Risk score with its component breakdown
  [[nodiscard]] RiskAssessment assess(
    const AnomalyRecord& anomaly,
    double growthRate,
    const std::vector<ReferencePoint>& referencePoints) const;

  /**
   * @brief Assess every anomaly of a run.
   *
   * Growth rates are looked up by GrowthMetrics::anomaly2Id; anomalies
   * without growth data (new anomalies) use a rate of 0.
   */
  [[nodiscard]] std::vector<RiskAssessment> scoreAnomalies(
    const std::vector<AnomalyRecord>& anomalies,
    const std::vector<GrowthMetrics>& growthMetrics,
    const std::vector<ReferencePoint>& referencePoints) const;

  /**
   * @brief Copies of @p growthMetrics with riskScore filled in.
   *
   * Metrics whose run-2 anomaly is missing from @p run2 keep riskScore = 0.
   */
  [[nodiscard]] std::vector<GrowthMetrics> scoreGrowthMetrics(
    const std::vector<GrowthMetrics>& growthMetrics,
    const std::vector<AnomalyRecord>& run2,
    const std::vector<ReferencePoint>& referencePoints) const;

  /// Sorted by risk descending, optionally truncated to @p topN
  [[nodiscard]] static std::vector<RiskAssessment> rankByRisk(
    std::vector<RiskAssessment> assessments,
    std::optional<size_t> topN = std::nullopt);

  /// Assessments with riskScore >= @p threshold, sorted descending
  [[nodiscard]] static std::vector<RiskAssessment> highRiskAnomalies(
    const std::vector<RiskAssessment>& assessments,
    double threshold = kDefaultHighRiskThreshold);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
};

}  // namespace ili_core

#endif  // ILI_CORE_GROWTH_RISK_SCORER_HPP
