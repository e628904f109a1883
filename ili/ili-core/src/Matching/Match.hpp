// Ticket: 0006_hungarian_matching

#ifndef ILI_CORE_MATCHING_MATCH_HPP
#define ILI_CORE_MATCHING_MATCH_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "ili-core/src/Matching/SimilarityCalculator.hpp"

namespace ili_core
{

enum class MatchConfidence : uint8_t
{
  High,    // similarity >= 0.8
  Medium,  // similarity >= 0.6
  Low
};

static constexpr double kHighConfidenceThreshold = 0.8;
static constexpr double kMediumConfidenceThreshold = 0.6;

/**
 * @brief Confidence tier of a similarity score.
 */
inline MatchConfidence classifyConfidence(double similarityScore)
{
  if (similarityScore >= kHighConfidenceThreshold)
  {
    return MatchConfidence::High;
  }
  if (similarityScore >= kMediumConfidenceThreshold)
  {
    return MatchConfidence::Medium;
  }
  return MatchConfidence::Low;
}

inline std::string_view toString(MatchConfidence confidence)
{
  switch (confidence)
  {
    case MatchConfidence::High:
      return "HIGH";
    case MatchConfidence::Medium:
      return "MEDIUM";
    case MatchConfidence::Low:
      return "LOW";
  }
  return "LOW";
}

class HungarianMatcher;

/**
 * @brief A pairing of the same physical anomaly across two runs.
 *
 * Immutable. Only HungarianMatcher creates matches, so every Match is the
 * product of an optimal assignment that passed the confidence filter.
 */
class Match
{
public:
  Match(const Match&) = default;
  Match(Match&&) noexcept = default;
  Match& operator=(const Match&) = default;
  Match& operator=(Match&&) noexcept = default;
  ~Match() = default;

  /// "<anomaly1Id>_<anomaly2Id>"
  [[nodiscard]] const std::string& id() const
  {
    return id_;
  }
  [[nodiscard]] const std::string& anomaly1Id() const
  {
    return anomaly1Id_;
  }
  [[nodiscard]] const std::string& anomaly2Id() const
  {
    return anomaly2Id_;
  }
  [[nodiscard]] double similarityScore() const
  {
    return similarity_.overall;
  }
  [[nodiscard]] const SimilarityBreakdown& similarity() const
  {
    return similarity_;
  }
  [[nodiscard]] MatchConfidence confidence() const
  {
    return confidence_;
  }

private:
  friend class HungarianMatcher;

  Match(std::string anomaly1Id,
        std::string anomaly2Id,
        const SimilarityBreakdown& similarity)
    : id_{anomaly1Id + "_" + anomaly2Id},
      anomaly1Id_{std::move(anomaly1Id)},
      anomaly2Id_{std::move(anomaly2Id)},
      similarity_{similarity},
      confidence_{classifyConfidence(similarity.overall)}
  {
  }

  std::string id_;
  std::string anomaly1Id_;
  std::string anomaly2Id_;
  SimilarityBreakdown similarity_;
  MatchConfidence confidence_;
};

}  // namespace ili_core

#endif  // ILI_CORE_MATCHING_MATCH_HPP
