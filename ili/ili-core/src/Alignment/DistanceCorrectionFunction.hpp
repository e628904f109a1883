// Ticket: 0003_distance_correction

#ifndef ILI_CORE_ALIGNMENT_DISTANCE_CORRECTION_FUNCTION_HPP
#define ILI_CORE_ALIGNMENT_DISTANCE_CORRECTION_FUNCTION_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <utility>
#include <vector>

#include "ili-core/src/Alignment/AlignmentResult.hpp"
#include "ili-core/src/DataTypes/AnomalyRecord.hpp"

namespace ili_core
{

/**
 * @brief Piecewise-linear map from a source run's odometer to a target run's.
 *
 * Knots are the matched reference-point distances of an alignment, sorted by
 * source distance. Inputs between knots are interpolated; inputs outside the
 * knot range are extrapolated along the first or last segment, so a
 * constant offset between runs yields a constant correction everywhere.
 *
 * DTW can emit many-to-one steps, producing repeated source distances.
 * Repeated knots collapse to the mean of their target distances.
 *
 * @ticket 0003_distance_correction
 */
class DistanceCorrectionFunction
{
public:
  /// Summary of the correction applied over the knot set
  struct CorrectionInfo
  {
    size_t numReferencePoints{0};
    std::pair<double, double> sourceRange{0.0, 0.0};  // [ft]
    std::pair<double, double> targetRange{0.0, 0.0};  // [ft]
    double maxCorrection{0.0};   // max |target - source| [ft]
    double meanCorrection{0.0};  // mean (target - source) [ft]
    double stdCorrection{0.0};   // population stddev of (target - source) [ft]
  };

  /**
   * @brief Build from an accepted alignment.
   * @throws std::invalid_argument (see the CorrectionParams constructor)
   */
  explicit DistanceCorrectionFunction(const AlignmentResult& alignment);

  /**
   * @brief Build from matched distance arrays.
   * @throws std::invalid_argument if the arrays are empty, differ in length,
   *         hold fewer than 2 points, or have fewer than 2 distinct source
   *         distances
   */
  explicit DistanceCorrectionFunction(
    const AlignmentResult::CorrectionParams& params);

  /// Map a single source-run distance into the target frame [ft]
  [[nodiscard]] double correct(double distance) const;

  /// Map a batch of source-run distances into the target frame [ft]
  [[nodiscard]] Eigen::VectorXd correct(const Eigen::VectorXd& distances) const;

  /**
   * @brief Copies of @p anomalies with corrected distances.
   *
   * Every other field is preserved; the inputs are untouched.
   */
  [[nodiscard]] std::vector<AnomalyRecord> correctAnomalies(
    const std::vector<AnomalyRecord>& anomalies) const;

  /// True when @p distance lies outside [min, max] source knot distance
  [[nodiscard]] bool isExtrapolating(double distance) const;

  [[nodiscard]] CorrectionInfo info() const;

private:
  Eigen::VectorXd sourceKnots_;
  Eigen::VectorXd targetKnots_;
  AlignmentResult::CorrectionParams params_;
};

}  // namespace ili_core

#endif  // ILI_CORE_ALIGNMENT_DISTANCE_CORRECTION_FUNCTION_HPP
