// Ticket: 0002_dtw_alignment

#ifndef ILI_CORE_ALIGNMENT_DTW_ALIGNER_HPP
#define ILI_CORE_ALIGNMENT_DTW_ALIGNER_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "ili-core/src/Alignment/AlignmentResult.hpp"
#include "ili-core/src/DataTypes/ReferencePoint.hpp"

namespace ili_core
{

/**
 * @brief Aligns two runs' reference-point sequences with constrained DTW.
 *
 * Odometer drift accumulates along a run, so two inspections report the same
 * girth weld at slightly different distances. Dynamic time warping finds the
 * monotone many-to-one pairing of reference points with minimum total
 * distance error, subject to a relative drift band:
 *
 *   |d1 - d2| <= driftConstraint * (d1 + d2) / 2
 *
 * Cells outside the band are +inf and can never lie on the warping path.
 *
 * Tie-break order during backtracking is diagonal, vertical (i-1, j),
 * horizontal (i, j-1); the first minimum wins.
 *
 * @ticket 0002_dtw_alignment
 */
class DTWAligner
{
public:
  struct Config
  {
    double driftConstraint{0.10};  // Max relative drift (0.10 = 10%)
    AlignmentResult::QualityThresholds thresholds{};
  };

  /// One step of the warping path
  struct MatchedPair
  {
    std::string sourceId;
    std::string targetId;
    double sourceDistance{0.0};  // [ft]
    double targetDistance{0.0};  // [ft]
  };

  /// Raw, unvalidated alignment (available even when the quality gate fails)
  struct Alignment
  {
    std::vector<MatchedPair> pairs;
    double matchRate{0.0};  // [%], capped at 100
    double rmse{0.0};       // [ft], 0 when no pairs
    double totalCost{std::numeric_limits<double>::infinity()};
    size_t sourceCount{0};
    size_t targetCount{0};
  };

  using Step = std::pair<Eigen::Index, Eigen::Index>;

  DTWAligner();

  /**
   * @throws std::invalid_argument if driftConstraint is negative
   */
  explicit DTWAligner(const Config& config);

  /**
   * @brief Align two reference-point sequences and validate the result.
   *
   * @param sequence1 Source run reference points (the run being corrected)
   * @param sequence2 Target run reference points (the reference frame)
   * @return AlignmentResult with correction params mapping source -> target
   * @throws std::invalid_argument if either sequence is empty
   * @throws AlignmentQualityError if the alignment misses the quality gate
   */
  [[nodiscard]] AlignmentResult align(
    const std::vector<ReferencePoint>& sequence1,
    const std::vector<ReferencePoint>& sequence2) const;

  /**
   * @brief Run DTW without applying the quality gate.
   * @throws std::invalid_argument if either sequence is empty
   */
  [[nodiscard]] Alignment computeAlignment(
    const std::vector<ReferencePoint>& sequence1,
    const std::vector<ReferencePoint>& sequence2) const;

  /**
   * @brief Pairwise |d1_i - d2_j| with out-of-band cells set to +inf.
   */
  [[nodiscard]] Eigen::MatrixXd computeDistanceMatrix(
    const Eigen::VectorXd& distances1,
    const Eigen::VectorXd& distances2) const;

  /**
   * @brief Accumulated cost table of size (n + 1) x (m + 1).
   *
   * cost(0, 0) = 0, other border cells +inf. Interior cells with an
   * infinite local distance stay +inf.
   */
  [[nodiscard]] static Eigen::MatrixXd accumulateCost(
    const Eigen::MatrixXd& distanceMatrix);

  /**
   * @brief Recover the warping path from an accumulated cost table.
   *
   * @return Zero-based (i, j) steps in increasing order; empty when
   *         cost(n, m) is infinite
   */
  [[nodiscard]] static std::vector<Step> backtrack(
    const Eigen::MatrixXd& cost);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
};

}  // namespace ili_core

#endif  // ILI_CORE_ALIGNMENT_DTW_ALIGNER_HPP
