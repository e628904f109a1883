// Ticket: 0004_alignment_validation

#ifndef ILI_CORE_ALIGNMENT_ALIGNMENT_VALIDATOR_HPP
#define ILI_CORE_ALIGNMENT_ALIGNMENT_VALIDATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ili-core/src/Alignment/AlignmentResult.hpp"
#include "ili-core/src/Alignment/DTWAligner.hpp"
#include "ili-core/src/DataTypes/ReferencePoint.hpp"

namespace ili_core
{

/**
 * @brief Quality diagnostics for a raw DTW alignment.
 *
 * Unlike AlignmentResult::create(), the validator never throws on a failed
 * gate; it reports which thresholds failed and why individual reference
 * points were left off the warping path.
 *
 * @ticket 0004_alignment_validation
 */
class AlignmentValidator
{
public:
  enum class UnmatchedReason : uint8_t
  {
    NoAlignmentPairs,
    RunStart,
    RunEnd,
    Isolated,      // Neighbour gap > kIsolationGapFt
    NearMatched,   // Within kNearMatchedFt of a matched point
    DataQuality
  };

  struct UnmatchedPoint
  {
    std::string id;
    double distance{0.0};  // [ft]
    UnmatchedReason reason{UnmatchedReason::DataQuality};
    std::string detail;
  };

  struct Diagnostics
  {
    size_t totalPairs{0};
    double avgDistanceError{0.0};  // [ft]
    double maxDistanceError{0.0};  // [ft]
    double stdDistanceError{0.0};  // [ft], population
    double totalCost{0.0};
    size_t boundaryPoints{0};
    size_t isolatedPoints{0};
    size_t dataQualityIssues{0};
    size_t otherUnmatched{0};
  };

  struct Report
  {
    bool isValid{false};
    bool matchRatePassed{false};
    bool rmsePassed{false};
    double matchRate{0.0};  // [%]
    double rmse{0.0};       // [ft]
    std::vector<UnmatchedPoint> unmatchedSource;
    std::vector<UnmatchedPoint> unmatchedTarget;
    std::vector<std::string> warnings;
    Diagnostics diagnostics;
  };

  static constexpr double kIsolationGapFt = 100.0;
  static constexpr double kNearMatchedFt = 20.0;

  AlignmentValidator() = default;
  explicit AlignmentValidator(const AlignmentResult::QualityThresholds& thresholds)
    : thresholds_{thresholds}
  {
  }

  /**
   * @brief Evaluate a raw alignment against the quality thresholds.
   *
   * @param alignment Output of DTWAligner::computeAlignment()
   * @param source Reference points that formed sequence 1, in DTW order
   * @param target Reference points that formed sequence 2, in DTW order
   */
  [[nodiscard]] Report validate(const DTWAligner::Alignment& alignment,
                                const std::vector<ReferencePoint>& source,
                                const std::vector<ReferencePoint>& target) const;

  /// Multi-line human-readable summary of a report
  [[nodiscard]] std::string formatReport(const Report& report) const;

  [[nodiscard]] const AlignmentResult::QualityThresholds& getThresholds() const
  {
    return thresholds_;
  }

private:
  AlignmentResult::QualityThresholds thresholds_{};
};

std::string_view toString(AlignmentValidator::UnmatchedReason reason);

}  // namespace ili_core

#endif  // ILI_CORE_ALIGNMENT_ALIGNMENT_VALIDATOR_HPP
