// Ticket: 0006_hungarian_matching

#ifndef ILI_CORE_MATCHING_HUNGARIAN_MATCHER_HPP
#define ILI_CORE_MATCHING_HUNGARIAN_MATCHER_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

#include "ili-core/src/DataTypes/AnomalyRecord.hpp"
#include "ili-core/src/Matching/Match.hpp"
#include "ili-core/src/Matching/SimilarityCalculator.hpp"

namespace ili_core
{

struct MatchingStatistics
{
  size_t totalRun1{0};
  size_t totalRun2{0};
  size_t matched{0};
  size_t unmatchedRun1{0};
  size_t unmatchedRun2{0};
  double matchRate{0.0};  // matched / min(totalRun1, totalRun2), in [0, 1]
  size_t highConfidence{0};
  size_t mediumConfidence{0};
  size_t lowConfidence{0};
};

struct MatchingResult
{
  std::vector<Match> matches;
  std::vector<AnomalyRecord> newAnomalies;       // Unmatched in run 2
  std::vector<AnomalyRecord> repairedOrRemoved;  // Unmatched in run 1
  MatchingStatistics statistics;
};

/**
 * @brief Globally optimal one-to-one anomaly matching between two runs.
 *
 * Pipeline:
 *   1. similarity matrix S (n x m) from SimilarityCalculator
 *   2. cost C = 1 - S
 *   3. optimal rectangular assignment (LinearAssignmentSolver)
 *   4. discard pairs with similarity < confidenceThreshold
 *   5. classify surviving pairs into HIGH / MEDIUM / LOW
 *
 * The result is injective in both directions. Run-1 anomalies left unmatched
 * are reported as repaired or removed; run-2 leftovers as new.
 *
 * Callers wanting drift-corrected matching pass run-1 records already mapped
 * through DistanceCorrectionFunction::correctAnomalies().
 *
 * @ticket 0006_hungarian_matching
 */
class HungarianMatcher
{
public:
  struct Config
  {
    double confidenceThreshold{0.6};  // Minimum similarity to accept a pair
  };

  HungarianMatcher();

  /**
   * @throws std::invalid_argument if confidenceThreshold is outside [0, 1]
   */
  explicit HungarianMatcher(const Config& config,
                            SimilarityCalculator calculator = {});

  /**
   * @brief Match anomalies of two runs.
   *
   * Empty input on either side yields zero matches with every anomaly
   * reported as unmatched.
   */
  [[nodiscard]] MatchingResult match(
    const std::vector<AnomalyRecord>& run1,
    const std::vector<AnomalyRecord>& run2) const;

  /// 1 - similarityMatrix(run1, run2)
  [[nodiscard]] Eigen::MatrixXd costMatrix(
    const std::vector<AnomalyRecord>& run1,
    const std::vector<AnomalyRecord>& run2) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] const SimilarityCalculator& getCalculator() const
  {
    return calculator_;
  }

private:
  Config config_;
  SimilarityCalculator calculator_;
};

}  // namespace ili_core

#endif  // ILI_CORE_MATCHING_HUNGARIAN_MATCHER_HPP
