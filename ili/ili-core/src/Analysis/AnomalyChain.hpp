// Ticket: 0010_three_way_chains

#ifndef ILI_CORE_ANALYSIS_ANOMALY_CHAIN_HPP
#define ILI_CORE_ANALYSIS_ANOMALY_CHAIN_HPP

#include <array>
#include <optional>
#include <string>

namespace ili_core
{

/**
 * @brief One physical anomaly tracked through three consecutive runs.
 *
 * Index 0 is the earliest run. Interval k spans runs k and k + 1.
 */
struct AnomalyChain
{
  std::string chainId;  // "CHAIN_<idx:04d>"
  std::array<std::string, 3> runIds;
  std::array<std::string, 3> anomalyIds;
  std::array<double, 2> matchSimilarities{};  // Per interval, [0, 1]
  std::array<double, 3> depthPct{};
  std::array<double, 2> intervalYears{};
  std::array<double, 2> growthRates{};  // Depth rate per interval [pp / year]
  double acceleration{0.0};  // growthRates[1] - growthRates[0]
  bool isAccelerating{false};
  double riskScore{0.0};
  std::optional<double> yearsTo80Pct;
};

}  // namespace ili_core

#endif  // ILI_CORE_ANALYSIS_ANOMALY_CHAIN_HPP
