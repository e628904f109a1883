// Ticket: 0003_distance_correction

#include "ili-core/src/Alignment/DistanceCorrectionFunction.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace ili_core
{

DistanceCorrectionFunction::DistanceCorrectionFunction(
  const AlignmentResult& alignment)
  : DistanceCorrectionFunction{alignment.correctionParams()}
{
}

DistanceCorrectionFunction::DistanceCorrectionFunction(
  const AlignmentResult::CorrectionParams& params)
  : params_{params}
{
  auto const& source = params.sourceDistances;
  auto const& target = params.targetDistances;

  if (source.empty() || target.empty())
  {
    throw std::invalid_argument{
      "DistanceCorrectionFunction: correction params are empty"};
  }
  if (source.size() != target.size())
  {
    throw std::invalid_argument{
      "DistanceCorrectionFunction: mismatched array lengths (" +
      std::to_string(source.size()) + " vs " + std::to_string(target.size()) +
      ")"};
  }
  if (source.size() < 2)
  {
    throw std::invalid_argument{
      "DistanceCorrectionFunction: need at least 2 reference points, got " +
      std::to_string(source.size())};
  }

  // Sort knots by source distance
  std::vector<size_t> order(source.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(),
                   order.end(),
                   [&source](size_t a, size_t b)
                   { return source[a] < source[b]; });

  // Collapse repeated source distances onto their mean target
  std::vector<double> xs;
  std::vector<double> ys;
  xs.reserve(order.size());
  ys.reserve(order.size());

  size_t k = 0;
  while (k < order.size())
  {
    double const x = source[order[k]];
    double sum = 0.0;
    size_t count = 0;
    while (k < order.size() && source[order[k]] == x)
    {
      sum += target[order[k]];
      ++count;
      ++k;
    }
    xs.push_back(x);
    ys.push_back(sum / static_cast<double>(count));
  }

  if (xs.size() < 2)
  {
    throw std::invalid_argument{
      "DistanceCorrectionFunction: need at least 2 distinct source "
      "distances"};
  }

  sourceKnots_ = Eigen::Map<const Eigen::VectorXd>(
    xs.data(), static_cast<Eigen::Index>(xs.size()));
  targetKnots_ = Eigen::Map<const Eigen::VectorXd>(
    ys.data(), static_cast<Eigen::Index>(ys.size()));
}

double DistanceCorrectionFunction::correct(double distance) const
{
  Eigen::Index const n = sourceKnots_.size();

  // Locate the segment [k, k + 1]; clamp to the end segments to extrapolate
  auto const* begin = sourceKnots_.data();
  auto const* end = begin + n;
  auto const upper = std::upper_bound(begin, end, distance);
  Eigen::Index k = static_cast<Eigen::Index>(upper - begin) - 1;
  k = std::clamp<Eigen::Index>(k, 0, n - 2);

  double const x0 = sourceKnots_(k);
  double const x1 = sourceKnots_(k + 1);
  double const y0 = targetKnots_(k);
  double const y1 = targetKnots_(k + 1);

  double const slope = (y1 - y0) / (x1 - x0);
  return y0 + slope * (distance - x0);
}

Eigen::VectorXd DistanceCorrectionFunction::correct(
  const Eigen::VectorXd& distances) const
{
  Eigen::VectorXd corrected(distances.size());
  for (Eigen::Index i = 0; i < distances.size(); ++i)
  {
    corrected(i) = correct(distances(i));
  }
  return corrected;
}

std::vector<AnomalyRecord> DistanceCorrectionFunction::correctAnomalies(
  const std::vector<AnomalyRecord>& anomalies) const
{
  std::vector<AnomalyRecord> corrected;
  corrected.reserve(anomalies.size());

  size_t extrapolated = 0;
  for (const auto& anomaly : anomalies)
  {
    if (isExtrapolating(anomaly.distance()))
    {
      ++extrapolated;
    }
    // Extrapolating below the first knot can land short of the launcher
    double const distance = std::max(0.0, correct(anomaly.distance()));
    corrected.push_back(anomaly.withDistance(distance));
  }

  if (extrapolated > 0)
  {
    spdlog::debug("Distance correction extrapolated {} of {} anomalies",
                  extrapolated,
                  anomalies.size());
  }

  return corrected;
}

bool DistanceCorrectionFunction::isExtrapolating(double distance) const
{
  return distance < sourceKnots_(0) ||
         distance > sourceKnots_(sourceKnots_.size() - 1);
}

DistanceCorrectionFunction::CorrectionInfo DistanceCorrectionFunction::info()
  const
{
  auto const& source = params_.sourceDistances;
  auto const& target = params_.targetDistances;
  auto const n = static_cast<Eigen::Index>(source.size());

  Eigen::Map<const Eigen::VectorXd> const src{source.data(), n};
  Eigen::Map<const Eigen::VectorXd> const tgt{target.data(), n};
  Eigen::VectorXd const corrections = tgt - src;

  CorrectionInfo info;
  info.numReferencePoints = source.size();
  info.sourceRange = {src.minCoeff(), src.maxCoeff()};
  info.targetRange = {tgt.minCoeff(), tgt.maxCoeff()};
  info.maxCorrection = corrections.cwiseAbs().maxCoeff();
  info.meanCorrection = corrections.mean();
  info.stdCorrection = std::sqrt(
    (corrections.array() - info.meanCorrection).square().mean());
  return info;
}

}  // namespace ili_core
