// Ticket: 0001_inspection_data_types

#ifndef ILI_CORE_DATATYPES_REFERENCE_POINT_HPP
#define ILI_CORE_DATATYPES_REFERENCE_POINT_HPP

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "ili-core/src/DataTypes/FeatureType.hpp"

namespace ili_core
{

/**
 * @brief A fixed landmark (girth weld, valve, tee) seen by an inspection run.
 *
 * Reference points exist in every run and are the anchors for odometer
 * alignment. They never participate in anomaly matching.
 */
struct ReferencePoint
{
  std::string id;
  std::string runId;
  double distance{0.0};  // Odometer distance [ft]
  PointType pointType{PointType::GirthWeld};
  std::optional<std::string> description;

  ReferencePoint(std::string pointId,
                 std::string run,
                 double dist,
                 PointType type,
                 std::optional<std::string> desc = std::nullopt)
    : id{std::move(pointId)},
      runId{std::move(run)},
      distance{dist},
      pointType{type},
      description{std::move(desc)}
  {
    if (id.empty() || runId.empty())
    {
      throw std::invalid_argument{
        "ReferencePoint: id and runId must not be empty"};
    }
    if (!(distance >= 0.0) || !std::isfinite(distance))
    {
      throw std::invalid_argument{
        "ReferencePoint: distance must be finite and >= 0, got " +
        std::to_string(distance)};
    }
  }

  ReferencePoint(const ReferencePoint&) = default;
  ReferencePoint(ReferencePoint&&) noexcept = default;
  ReferencePoint& operator=(const ReferencePoint&) = default;
  ReferencePoint& operator=(ReferencePoint&&) noexcept = default;
  ~ReferencePoint() = default;
};

}  // namespace ili_core

#endif  // ILI_CORE_DATATYPES_REFERENCE_POINT_HPP
