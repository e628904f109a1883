// Ticket: 0007_interaction_zones

#ifndef ILI_CORE_CLUSTERING_INTERACTION_ZONE_HPP
#define ILI_CORE_CLUSTERING_INTERACTION_ZONE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace ili_core
{

/**
 * @brief A group of anomalies close enough to interact structurally.
 *
 * Zones reference their members by anomaly id only; members carry the zone
 * id in AnomalyRecord::clusterId().
 */
struct InteractionZone
{
  std::string zoneId;  // "ZONE_<runId>_<label:04d>"
  std::string runId;
  std::vector<std::string> anomalyIds;
  size_t anomalyCount{0};
  double centroidDistance{0.0};  // Mean member distance [ft]
  double centroidClock{0.0};     // Circular mean clock [hours]
  double spanDistanceFt{0.0};    // max - min distance [ft]
  double spanClock{0.0};         // Smallest arc covering all members [hours]
  double maxDepthPct{0.0};
  double combinedLengthIn{0.0};  // Sum of member lengths [in]
};

}  // namespace ili_core

#endif  // ILI_CORE_CLUSTERING_INTERACTION_ZONE_HPP
