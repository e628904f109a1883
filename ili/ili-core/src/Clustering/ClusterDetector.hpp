// Ticket: 0007_interaction_zones

#ifndef ILI_CORE_CLUSTERING_CLUSTER_DETECTOR_HPP
#define ILI_CORE_CLUSTERING_CLUSTER_DETECTOR_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

#include "ili-core/src/Clustering/InteractionZone.hpp"
#include "ili-core/src/DataTypes/AnomalyRecord.hpp"

namespace ili_core
{

/**
 * @brief Groups nearby anomalies of one run into interaction zones.
 *
 * Anomalies are embedded as
 *
 *   (distance / axialThresholdFt, cos(theta) / chord, sin(theta) / chord)
 *
 * with theta = (clock - 1) / 11 * 2pi and chord the unit-circle chord length
 * subtended by clockThreshold hours. In this space both proximity limits map
 * to a Euclidean radius of 1, so DBSCAN runs with eps = 1 and
 * minPoints = minClusterSize (a point counts towards its own neighbourhood).
 * The embedding is circular, so 11:30 and 12:30 are neighbours.
 *
 * Noise points keep clusterId = nullopt.
 *
 * @ticket 0007_interaction_zones
 */
class ClusterDetector
{
public:
  struct Config
  {
    double axialThresholdFt{1.0};
    double clockThreshold{1.5};  // [hours]
    int minClusterSize{2};
    double wallThicknessIn{0.25};  // Informational, not used by the metric
  };

  struct Result
  {
    std::vector<AnomalyRecord> anomalies;  // Input order, clusterId stamped
    std::vector<InteractionZone> zones;    // Sorted by label
  };

  static constexpr int kNoise = -1;

  ClusterDetector();

  /**
   * @throws std::invalid_argument if a threshold is not strictly positive or
   *         minClusterSize < 2
   */
  explicit ClusterDetector(const Config& config);

  /**
   * @brief Detect interaction zones among one run's anomalies.
   *
   * @param anomalies Records of a single run
   * @param runId Run identifier used in zone ids
   * @return Copies of @p anomalies (member ones tagged, the rest with any
   *         previous zone id cleared) plus the zones.
   *         Fewer than minClusterSize inputs form no zones.
   */
  [[nodiscard]] Result detect(const std::vector<AnomalyRecord>& anomalies,
                              const std::string& runId) const;

  /// Feature-space embedding of each anomaly
  [[nodiscard]] std::vector<Eigen::Vector3d> embed(
    const std::vector<AnomalyRecord>& anomalies) const;

  /**
   * @brief DBSCAN labels (kNoise or 0, 1, ...) for embedded points.
   *
   * Labels are assigned in order of the first core point of each cluster.
   */
  [[nodiscard]] std::vector<int> dbscan(
    const std::vector<Eigen::Vector3d>& points) const;

  /// Circular mean of clock positions on the 11-hour embedding circle
  [[nodiscard]] static double circularMeanClock(
    const std::vector<double>& clocks);

  /// 11 - largest circular gap between sorted clock positions
  [[nodiscard]] static double circularSpanClock(std::vector<double> clocks);

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  std::vector<size_t> regionQuery(
    size_t index,
    const std::vector<Eigen::Vector3d>& points) const;

  void expandCluster(size_t index,
                     std::vector<size_t> neighbors,
                     std::vector<int>& labels,
                     const std::vector<Eigen::Vector3d>& points,
                     int clusterId) const;

  Config config_;
  double chordAtThreshold_;
};

}  // namespace ili_core

#endif  // ILI_CORE_CLUSTERING_CLUSTER_DETECTOR_HPP
