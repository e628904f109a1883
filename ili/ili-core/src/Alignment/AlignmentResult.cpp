// Ticket: 0002_dtw_alignment

#include "ili-core/src/Alignment/AlignmentResult.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "ili-core/src/Alignment/AlignmentQualityError.hpp"

namespace ili_core
{

AlignmentResult::AlignmentResult(std::string run1Id,
                                 std::string run2Id,
                                 std::vector<PointPair> matchedPoints,
                                 double matchRate,
                                 double rmse,
                                 CorrectionParams correctionParams)
  : run1Id_{std::move(run1Id)},
    run2Id_{std::move(run2Id)},
    matchedPoints_{std::move(matchedPoints)},
    matchRate_{matchRate},
    rmse_{rmse},
    correctionParams_{std::move(correctionParams)}
{
}

AlignmentResult AlignmentResult::create(std::string run1Id,
                                        std::string run2Id,
                                        std::vector<PointPair> matchedPoints,
                                        double matchRate,
                                        double rmse,
                                        CorrectionParams correctionParams)
{
  return create(std::move(run1Id),
                std::move(run2Id),
                std::move(matchedPoints),
                matchRate,
                rmse,
                std::move(correctionParams),
                QualityThresholds{});
}

AlignmentResult AlignmentResult::create(std::string run1Id,
                                        std::string run2Id,
                                        std::vector<PointPair> matchedPoints,
                                        double matchRate,
                                        double rmse,
                                        CorrectionParams correctionParams,
                                        const QualityThresholds& thresholds)
{
  // ===== Structural checks =====
  if (!(matchRate >= 0.0 && matchRate <= 100.0))
  {
    throw std::invalid_argument{"AlignmentResult: match rate " +
                                std::to_string(matchRate) +
                                " is outside [0, 100]"};
  }
  if (!(rmse >= 0.0) || !std::isfinite(rmse))
  {
    throw std::invalid_argument{"AlignmentResult: rmse must be finite and "
                                "non-negative, got " +
                                std::to_string(rmse)};
  }
  if (correctionParams.sourceDistances.size() !=
      correctionParams.targetDistances.size())
  {
    throw std::invalid_argument{
      "AlignmentResult: correction params have mismatched lengths (" +
      std::to_string(correctionParams.sourceDistances.size()) + " vs " +
      std::to_string(correctionParams.targetDistances.size()) + ")"};
  }

  // ===== Quality gate =====
  if (matchRate < thresholds.minMatchRate)
  {
    std::ostringstream oss;
    oss << "Alignment " << run1Id << " -> " << run2Id << " rejected: match rate "
        << matchRate << "% is below " << thresholds.minMatchRate << "%";
    throw AlignmentQualityError{oss.str(), matchRate, rmse};
  }
  if (rmse > thresholds.maxRmse)
  {
    std::ostringstream oss;
    oss << "Alignment " << run1Id << " -> " << run2Id << " rejected: RMSE "
        << rmse << " ft exceeds " << thresholds.maxRmse << " ft";
    throw AlignmentQualityError{oss.str(), matchRate, rmse};
  }

  return AlignmentResult{std::move(run1Id),
                         std::move(run2Id),
                         std::move(matchedPoints),
                         matchRate,
                         rmse,
                         std::move(correctionParams)};
}

}  // namespace ili_core
