// Ticket: 0001_inspection_data_types

#include "ili-core/src/DataTypes/AnomalyRecord.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace ili_core
{

namespace
{

void requireNonEmpty(const std::string& value, const char* field)
{
  if (value.empty())
  {
    throw std::invalid_argument{std::string{"AnomalyRecord: "} + field +
                                " must not be empty"};
  }
}

void requireRange(double value, double lo, double hi, const char* field)
{
  if (!(value >= lo && value <= hi))
  {
    throw std::invalid_argument{std::string{"AnomalyRecord: "} + field +
                                " = " + std::to_string(value) +
                                " is outside [" + std::to_string(lo) + ", " +
                                std::to_string(hi) + "]"};
  }
}

void requirePositive(double value, const char* field)
{
  if (!(value > 0.0) || !std::isfinite(value))
  {
    throw std::invalid_argument{std::string{"AnomalyRecord: "} + field +
                                " must be finite and positive, got " +
                                std::to_string(value)};
  }
}

}  // anonymous namespace

AnomalyRecord::AnomalyRecord(std::string id,
                             std::string runId,
                             double distance,
                             double clockPosition,
                             double depthPct,
                             double length,
                             double width,
                             FeatureType featureType,
                             InspectionDate inspectionDate,
                             std::optional<std::string> clusterId)
  : id_{std::move(id)},
    runId_{std::move(runId)},
    distance_{distance},
    clockPosition_{clockPosition},
    depthPct_{depthPct},
    length_{length},
    width_{width},
    featureType_{featureType},
    inspectionDate_{inspectionDate},
    clusterId_{std::move(clusterId)}
{
  requireNonEmpty(id_, "id");
  requireNonEmpty(runId_, "runId");
  if (!(distance_ >= 0.0) || !std::isfinite(distance_))
  {
    throw std::invalid_argument{
      "AnomalyRecord: distance must be finite and >= 0, got " +
      std::to_string(distance_)};
  }
  requireRange(clockPosition_, 1.0, 12.0, "clockPosition");
  requireRange(depthPct_, 0.0, 100.0, "depthPct");
  requirePositive(length_, "length");
  requirePositive(width_, "width");
}

AnomalyRecord AnomalyRecord::withDistance(double distance) const
{
  return AnomalyRecord{id_,
                       runId_,
                       distance,
                       clockPosition_,
                       depthPct_,
                       length_,
                       width_,
                       featureType_,
                       inspectionDate_,
                       clusterId_};
}

AnomalyRecord AnomalyRecord::withClusterId(std::string clusterId) const
{
  AnomalyRecord copy{*this};
  copy.clusterId_ = std::move(clusterId);
  return copy;
}

AnomalyRecord AnomalyRecord::withoutClusterId() const
{
  AnomalyRecord copy{*this};
  copy.clusterId_.reset();
  return copy;
}

}  // namespace ili_core
