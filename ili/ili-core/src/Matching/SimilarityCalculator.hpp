// Ticket: 0005_anomaly_similarity

#ifndef ILI_CORE_MATCHING_SIMILARITY_CALCULATOR_HPP
#define ILI_CORE_MATCHING_SIMILARITY_CALCULATOR_HPP

#include <Eigen/Dense>
#include <optional>
#include <vector>

#include "ili-core/src/DataTypes/AnomalyRecord.hpp"

namespace ili_core
{

/**
 * @brief Per-component similarity between two anomalies, each in [0, 1].
 */
struct SimilarityBreakdown
{
  double overall{0.0};
  double distance{0.0};
  double clock{0.0};
  double type{0.0};
  double depth{0.0};
  double length{0.0};
  double width{0.0};
};

/**
 * @brief Weighted multi-criteria similarity between two anomaly records.
 *
 * Each component is a Gaussian kernel exp(-(delta / sigma)^2):
 * - distance: sigma = distanceSigma [ft]
 * - clock: circular hour distance, sigma = clockSigma [hours]
 * - type: 1 for identical feature types, else 0
 * - depth, length, width: sigma = dimensionSigma when set, otherwise the
 *   relative form exp(-(|a - b| / (a + b + 1e-6))^2)
 *
 * overall = sum(weight_k * component_k).
 *
 * @ticket 0005_anomaly_similarity
 */
class SimilarityCalculator
{
public:
  struct Weights
  {
    double distance{0.35};
    double clock{0.20};
    double type{0.15};
    double depth{0.15};
    double length{0.075};
    double width{0.075};

    [[nodiscard]] double sum() const
    {
      return distance + clock + type + depth + length + width;
    }
  };

  struct Config
  {
    double distanceSigma{5.0};  // [ft]
    double clockSigma{1.0};     // [hours]
    std::optional<double> dimensionSigma{};
    Weights weights{};
  };

  static constexpr double kWeightTolerance = 1e-6;

  SimilarityCalculator();

  /**
   * @throws std::invalid_argument if the weights do not sum to 1 within
   *         kWeightTolerance, any weight is negative, or any sigma is not
   *         strictly positive
   */
  explicit SimilarityCalculator(const Config& config);

  [[nodiscard]] double distanceSimilarity(double distance1,
                                          double distance2) const;
  [[nodiscard]] double clockSimilarity(double clock1, double clock2) const;
  [[nodiscard]] static double typeSimilarity(FeatureType type1,
                                             FeatureType type2);
  [[nodiscard]] double dimensionSimilarity(double value1, double value2) const;

  /// Full component breakdown for one anomaly pair
  [[nodiscard]] SimilarityBreakdown calculate(const AnomalyRecord& anomaly1,
                                              const AnomalyRecord& anomaly2) const;

  /// Overall similarity only
  [[nodiscard]] double similarity(const AnomalyRecord& anomaly1,
                                  const AnomalyRecord& anomaly2) const;

  /**
   * @brief Overall similarity for every (run1, run2) pair.
   * @return Matrix of size run1.size() x run2.size()
   */
  [[nodiscard]] Eigen::MatrixXd similarityMatrix(
    const std::vector<AnomalyRecord>& run1,
    const std::vector<AnomalyRecord>& run2) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
};

}  // namespace ili_core

#endif  // ILI_CORE_MATCHING_SIMILARITY_CALCULATOR_HPP
