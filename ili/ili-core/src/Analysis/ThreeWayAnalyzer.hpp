// Ticket: 0010_three_way_chains

#ifndef ILI_CORE_ANALYSIS_THREE_WAY_ANALYZER_HPP
#define ILI_CORE_ANALYSIS_THREE_WAY_ANALYZER_HPP

#include <spdlog/spdlog.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ili-core/src/Alignment/DTWAligner.hpp"
#include "ili-core/src/Alignment/DistanceCorrectionFunction.hpp"
#include "ili-core/src/Analysis/AnomalyChain.hpp"
#include "ili-core/src/Analysis/ChainExplainer.hpp"
#include "ili-core/src/Clustering/ClusterDetector.hpp"
#include "ili-core/src/DataTypes/AnomalyRecord.hpp"
#include "ili-core/src/DataTypes/InspectionDate.hpp"
#include "ili-core/src/DataTypes/ReferencePoint.hpp"
#include "ili-core/src/Growth/GrowthAnalyzer.hpp"
#include "ili-core/src/Growth/RiskScorer.hpp"
#include "ili-core/src/Matching/HungarianMatcher.hpp"

namespace ili_core
{

/**
 * @brief All records of one inspection run.
 */
struct InspectionRun
{
  std::string runId;
  InspectionDate inspectionDate;
  std::vector<AnomalyRecord> anomalies;
  std::vector<ReferencePoint> referencePoints;
};

enum class AnalysisStage : uint8_t
{
  Idle,
  Load,
  Cluster,
  ExtractReferencePoints,
  AlignFirstSecond,
  AlignSecondThird,
  MatchFirstSecond,
  MatchSecondThird,
  BuildChains,
  GrowthAndRisk,
  Explain,
  Done
};

std::string_view toString(AnalysisStage stage);

/**
 * @brief Outcome of the drift-correction step for one interval.
 *
 * Either correctionApplied is true and the diagnostics are populated, or a
 * fallbackReason explains why the earlier run kept its raw distances.
 */
struct IntervalAlignment
{
  std::string sourceRunId;
  std::string targetRunId;
  bool correctionApplied{false};
  std::optional<std::string> fallbackReason;
  size_t sourceReferencePoints{0};
  size_t targetReferencePoints{0};
  bool usedGirthWeldsOnly{false};
  double matchRate{0.0};  // [%]
  double rmse{0.0};       // [ft]
  size_t matchedPairs{0};
  std::optional<DistanceCorrectionFunction::CorrectionInfo> correction;
  std::vector<std::string> validationWarnings;  // Populated on rejection
};

struct ThreeWayAnalysisResult
{
  std::array<std::string, 3> runIds;
  std::array<size_t, 3> anomalyCounts{};
  std::array<std::vector<InteractionZone>, 3> zones;
  std::array<IntervalAlignment, 2> alignments;
  std::array<MatchingStatistics, 2> matching{};
  std::array<double, 2> intervalYears{};
  std::array<GrowthStatistics, 2> growth{};

  std::vector<AnomalyChain> chains;  // Sorted by riskScore, descending
  std::vector<ChainExplanation> explanations;
  std::vector<RiskAssessment> latestRunRisk;  // Sorted, descending

  size_t totalClusters{0};
  double clusteredAnomalyPct{0.0};
  size_t acceleratingCount{0};
  size_t stableCount{0};
  size_t deceleratingCount{0};
  size_t immediateActionCount{0};  // depth >= 70 % or <= 3 years to 80 %
  std::array<double, 2> meanGrowthRates{};  // Over chains [pp / year]
};

/**
 * @brief End-to-end analysis of three chronologically ordered runs.
 *
 * Stages: cluster each run, extract reference points, align and correct
 * each interval, match each interval, link matches into three-run chains,
 * compute growth, acceleration and risk, and optionally explain the
 * highest-risk chains.
 *
 * Alignment degrades per interval: insufficient reference points or an
 * alignment that misses the quality gate leave that interval uncorrected
 * with a recorded reason. Malformed input (non-increasing inspection dates)
 * is an error.
 *
 * Not reentrant: stage() reflects the most recent run().
 *
 * @ticket 0010_three_way_chains
 */
class ThreeWayAnalyzer
{
public:
  struct Config
  {
    ClusterDetector::Config clustering{};
    DTWAligner::Config alignment{};
    SimilarityCalculator::Config similarity{};
    HungarianMatcher::Config matching{};
    GrowthAnalyzer::Config growth{};
    RiskScorer::Config risk{};
    ChainExplainer::Config explanation{};
    size_t minGirthWelds{3};
    size_t minReferencePoints{2};
    bool explainChains{true};
    size_t topNExplain{10};
  };

  ThreeWayAnalyzer();

  /**
   * @param config Component configuration
   * @param logger Logger for stage progress; defaults to spdlog's default
   * @throws std::invalid_argument if a component rejects its configuration
   */
  explicit ThreeWayAnalyzer(
    const Config& config,
    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  /**
   * @brief Run the full pipeline.
   *
   * @throws std::invalid_argument if inspection dates are not strictly
   *         increasing or a run id is empty
   */
  [[nodiscard]] ThreeWayAnalysisResult run(const InspectionRun& first,
                                           const InspectionRun& second,
                                           const InspectionRun& third);

  /**
   * @brief Link interval matches through the shared middle-run anomaly.
   *
   * Chains carry ids, match similarities and depths; growth and risk are
   * filled by computeGrowthAndRisk(). Chain ids follow discovery order.
   */
  [[nodiscard]] static std::vector<AnomalyChain> buildChains(
    const std::array<std::string, 3>& runIds,
    const std::vector<AnomalyRecord>& first,
    const std::vector<AnomalyRecord>& second,
    const std::vector<AnomalyRecord>& third,
    const std::vector<Match>& firstSecond,
    const std::vector<Match>& secondThird);

  /**
   * @brief Growth rates, acceleration, chain risk and remaining life.
   *
   * chain risk = 0.5 * clip(depth3 / 100) + 0.3 * clip(max(rate2, 0) / 10)
   *            + 0.2 * clip(max(acceleration, 0) / 5)
   *
   * @throws std::invalid_argument if an interval is not positive
   */
  static void computeGrowthAndRisk(std::vector<AnomalyChain>& chains,
                                   const std::array<double, 2>& intervalYears);

  struct ReferenceSelection
  {
    std::vector<ReferencePoint> source;  // Sorted by distance
    std::vector<ReferencePoint> target;  // Sorted by distance
    bool girthWeldsOnly{false};
  };

  /**
   * @brief Reference points used for aligning two runs.
   *
   * Girth welds alone are used when each run has at least minGirthWelds of
   * them; otherwise every point type is used.
   */
  [[nodiscard]] ReferenceSelection selectReferencePoints(
    const std::vector<ReferencePoint>& source,
    const std::vector<ReferencePoint>& target) const;

  [[nodiscard]] AnalysisStage stage() const
  {
    return stage_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  /// Align one interval and return the (possibly corrected) source anomalies
  std::vector<AnomalyRecord> alignAndCorrect(
    const InspectionRun& source,
    const InspectionRun& target,
    const std::vector<AnomalyRecord>& sourceAnomalies,
    IntervalAlignment& outcome) const;

  void enterStage(AnalysisStage stage);

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  ClusterDetector clusterDetector_;
  DTWAligner aligner_;
  HungarianMatcher matcher_;
  GrowthAnalyzer growthAnalyzer_;
  RiskScorer riskScorer_;
  ChainExplainer explainer_;
  AnalysisStage stage_{AnalysisStage::Idle};
};

}  // namespace ili_core

#endif  // ILI_CORE_ANALYSIS_THREE_WAY_ANALYZER_HPP
