// Ticket: 0001_inspection_data_types

#ifndef ILI_CORE_DATATYPES_ANOMALY_RECORD_HPP
#define ILI_CORE_DATATYPES_ANOMALY_RECORD_HPP

#include <optional>
#include <string>

#include "ili-core/src/DataTypes/FeatureType.hpp"
#include "ili-core/src/DataTypes/InspectionDate.hpp"

namespace ili_core
{

/**
 * @brief A single defect reported by one inspection run.
 *
 * Immutable value type. All field ranges are checked on construction;
 * modified copies are produced through withDistance() and withClusterId().
 *
 * Units: distance [ft] along the pipe, clock position [hours, 1..12],
 * depth [% of wall thickness], length and width [in].
 *
 * @ticket 0001_inspection_data_types
 */
class AnomalyRecord
{
public:
  /**
   * @brief Construct a validated anomaly record.
   *
   * @throws std::invalid_argument if id or runId is empty, distance < 0,
   *         clockPosition outside [1, 12], depthPct outside [0, 100], or
   *         length/width not strictly positive
   */
  AnomalyRecord(std::string id,
                std::string runId,
                double distance,
                double clockPosition,
                double depthPct,
                double length,
                double width,
                FeatureType featureType,
                InspectionDate inspectionDate,
                std::optional<std::string> clusterId = std::nullopt);

  AnomalyRecord(const AnomalyRecord&) = default;
  AnomalyRecord(AnomalyRecord&&) noexcept = default;
  AnomalyRecord& operator=(const AnomalyRecord&) = default;
  AnomalyRecord& operator=(AnomalyRecord&&) noexcept = default;
  ~AnomalyRecord() = default;

  [[nodiscard]] const std::string& id() const
  {
    return id_;
  }
  [[nodiscard]] const std::string& runId() const
  {
    return runId_;
  }
  [[nodiscard]] double distance() const
  {
    return distance_;
  }
  [[nodiscard]] double clockPosition() const
  {
    return clockPosition_;
  }
  [[nodiscard]] double depthPct() const
  {
    return depthPct_;
  }
  [[nodiscard]] double length() const
  {
    return length_;
  }
  [[nodiscard]] double width() const
  {
    return width_;
  }
  [[nodiscard]] FeatureType featureType() const
  {
    return featureType_;
  }
  [[nodiscard]] InspectionDate inspectionDate() const
  {
    return inspectionDate_;
  }
  [[nodiscard]] const std::optional<std::string>& clusterId() const
  {
    return clusterId_;
  }
  [[nodiscard]] bool isClustered() const
  {
    return clusterId_.has_value();
  }

  /**
   * @brief Copy of this record with the distance replaced.
   * @throws std::invalid_argument if @p distance is negative or not finite
   */
  [[nodiscard]] AnomalyRecord withDistance(double distance) const;

  /**
   * @brief Copy of this record tagged with an interaction-zone id.
   */
  [[nodiscard]] AnomalyRecord withClusterId(std::string clusterId) const;

  /// Copy of this record with any interaction-zone id removed
  [[nodiscard]] AnomalyRecord withoutClusterId() const;

  bool operator==(const AnomalyRecord&) const = default;

private:
  std::string id_;
  std::string runId_;
  double distance_;
  double clockPosition_;
  double depthPct_;
  double length_;
  double width_;
  FeatureType featureType_;
  InspectionDate inspectionDate_;
  std::optional<std::string> clusterId_;
};

}  // namespace ili_core

#endif  // ILI_CORE_DATATYPES_ANOMALY_RECORD_HPP
