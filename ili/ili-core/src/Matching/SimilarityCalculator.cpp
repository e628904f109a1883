// Ticket: 0005_anomaly_similarity

#include "ili-core/src/Matching/SimilarityCalculator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "ili-core/src/DataTypes/ClockPosition.hpp"

namespace ili_core
{

namespace
{

// Guards the relative dimension kernel against two zero-size features
constexpr double kRelativeEpsilon = 1e-6;

double gaussian(double delta, double sigma)
{
  double const ratio = delta / sigma;
  return std::exp(-(ratio * ratio));
}

}  // anonymous namespace

SimilarityCalculator::SimilarityCalculator() : SimilarityCalculator{Config{}}
{
}

SimilarityCalculator::SimilarityCalculator(const Config& config)
  : config_{config}
{
  const Weights& w = config_.weights;
  double const sum = w.sum();
  if (std::abs(sum - 1.0) > kWeightTolerance)
  {
    throw std::invalid_argument{
      "SimilarityCalculator: weights must sum to 1.0, got " +
      std::to_string(sum)};
  }
  if (std::min({w.distance, w.clock, w.type, w.depth, w.length, w.width}) <
      0.0)
  {
    throw std::invalid_argument{
      "SimilarityCalculator: weights must be non-negative"};
  }
  if (!(config_.distanceSigma > 0.0) || !(config_.clockSigma > 0.0))
  {
    throw std::invalid_argument{
      "SimilarityCalculator: distance and clock sigma must be positive"};
  }
  if (config_.dimensionSigma.has_value() && !(*config_.dimensionSigma > 0.0))
  {
    throw std::invalid_argument{
      "SimilarityCalculator: dimension sigma must be positive"};
  }
}

double SimilarityCalculator::distanceSimilarity(double distance1,
                                                double distance2) const
{
  return gaussian(std::abs(distance1 - distance2), config_.distanceSigma);
}

double SimilarityCalculator::clockSimilarity(double clock1, double clock2) const
{
  return gaussian(circularClockDistance(clock1, clock2), config_.clockSigma);
}

double SimilarityCalculator::typeSimilarity(FeatureType type1,
                                            FeatureType type2)
{
  return type1 == type2 ? 1.0 : 0.0;
}

double SimilarityCalculator::dimensionSimilarity(double value1,
                                                 double value2) const
{
  double const delta = std::abs(value1 - value2);
  if (config_.dimensionSigma.has_value())
  {
    return gaussian(delta, *config_.dimensionSigma);
  }
  return gaussian(delta, value1 + value2 + kRelativeEpsilon);
}

SimilarityBreakdown SimilarityCalculator::calculate(
  const AnomalyRecord& anomaly1,
  const AnomalyRecord& anomaly2) const
{
  SimilarityBreakdown b;
  b.distance = distanceSimilarity(anomaly1.distance(), anomaly2.distance());
  b.clock = clockSimilarity(anomaly1.clockPosition(), anomaly2.clockPosition());
  b.type = typeSimilarity(anomaly1.featureType(), anomaly2.featureType());
  b.depth = dimensionSimilarity(anomaly1.depthPct(), anomaly2.depthPct());
  b.length = dimensionSimilarity(anomaly1.length(), anomaly2.length());
  b.width = dimensionSimilarity(anomaly1.width(), anomaly2.width());

  const Weights& w = config_.weights;
  double const overall = w.distance * b.distance + w.clock * b.clock +
                         w.type * b.type + w.depth * b.depth +
                         w.length * b.length + w.width * b.width;
  b.overall = std::clamp(overall, 0.0, 1.0);
  return b;
}

double SimilarityCalculator::similarity(const AnomalyRecord& anomaly1,
                                        const AnomalyRecord& anomaly2) const
{
  return calculate(anomaly1, anomaly2).overall;
}

Eigen::MatrixXd SimilarityCalculator::similarityMatrix(
  const std::vector<AnomalyRecord>& run1,
  const std::vector<AnomalyRecord>& run2) const
{
  Eigen::MatrixXd matrix(static_cast<Eigen::Index>(run1.size()),
                         static_cast<Eigen::Index>(run2.size()));
  for (size_t i = 0; i < run1.size(); ++i)
  {
    for (size_t j = 0; j < run2.size(); ++j)
    {
      matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
        similarity(run1[i], run2[j]);
    }
  }
  return matrix;
}

}  // namespace ili_core
