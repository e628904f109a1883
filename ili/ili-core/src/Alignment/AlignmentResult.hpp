// Ticket: 0002_dtw_alignment

#ifndef ILI_CORE_ALIGNMENT_ALIGNMENT_RESULT_HPP
#define ILI_CORE_ALIGNMENT_ALIGNMENT_RESULT_HPP

#include <string>
#include <utility>
#include <vector>

namespace ili_core
{

/**
 * @brief Validated outcome of aligning two runs' reference points.
 *
 * Only obtainable through create(), which rejects malformed values with
 * std::invalid_argument and under-quality alignments with
 * AlignmentQualityError. A constructed AlignmentResult therefore always
 * satisfies matchRate >= minMatchRate and rmse <= maxRmse.
 *
 * @ticket 0002_dtw_alignment
 */
class AlignmentResult
{
public:
  /// Acceptance thresholds for an alignment
  struct QualityThresholds
  {
    double minMatchRate{95.0};  // [%]
    double maxRmse{10.0};       // [ft]
  };

  /// Matched distance pairs that seed DistanceCorrectionFunction
  struct CorrectionParams
  {
    std::vector<double> sourceDistances;  // Run being corrected [ft]
    std::vector<double> targetDistances;  // Reference frame [ft]
  };

  using PointPair = std::pair<std::string, std::string>;

  /**
   * @brief Validate and build an alignment result.
   *
   * @param run1Id Source run identifier
   * @param run2Id Target run identifier
   * @param matchedPoints Ordered reference-point id pairs (source, target)
   * @param matchRate Percentage of reference points matched [0, 100]
   * @param rmse Root-mean-square distance error of matched pairs [ft]
   * @param correctionParams Matched distances, equal length arrays
   * @param thresholds Quality gate
   * @throws std::invalid_argument on malformed values
   * @throws AlignmentQualityError if matchRate < minMatchRate or
   *         rmse > maxRmse
   */
  static AlignmentResult create(std::string run1Id,
                                std::string run2Id,
                                std::vector<PointPair> matchedPoints,
                                double matchRate,
                                double rmse,
                                CorrectionParams correctionParams,
                                const QualityThresholds& thresholds);

  static AlignmentResult create(std::string run1Id,
                                std::string run2Id,
                                std::vector<PointPair> matchedPoints,
                                double matchRate,
                                double rmse,
                                CorrectionParams correctionParams);

  [[nodiscard]] const std::string& run1Id() const
  {
    return run1Id_;
  }
  [[nodiscard]] const std::string& run2Id() const
  {
    return run2Id_;
  }
  [[nodiscard]] const std::vector<PointPair>& matchedPoints() const
  {
    return matchedPoints_;
  }
  [[nodiscard]] double matchRate() const
  {
    return matchRate_;
  }
  [[nodiscard]] double rmse() const
  {
    return rmse_;
  }
  [[nodiscard]] const CorrectionParams& correctionParams() const
  {
    return correctionParams_;
  }

private:
  AlignmentResult(std::string run1Id,
                  std::string run2Id,
                  std::vector<PointPair> matchedPoints,
                  double matchRate,
                  double rmse,
                  CorrectionParams correctionParams);

  std::string run1Id_;
  std::string run2Id_;
  std::vector<PointPair> matchedPoints_;
  double matchRate_;
  double rmse_;
  CorrectionParams correctionParams_;
};

}  // namespace ili_core

#endif  // ILI_CORE_ALIGNMENT_ALIGNMENT_RESULT_HPP
