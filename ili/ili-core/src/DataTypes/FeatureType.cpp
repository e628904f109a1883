// Ticket: 0001_inspection_data_types

#include "ili-core/src/DataTypes/FeatureType.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace ili_core
{

namespace
{

constexpr std::array<std::pair<FeatureType, std::string_view>, 5>
  kFeatureLabels{{{FeatureType::ExternalCorrosion, "external_corrosion"},
                  {FeatureType::InternalCorrosion, "internal_corrosion"},
                  {FeatureType::Dent, "dent"},
                  {FeatureType::Crack, "crack"},
                  {FeatureType::Other, "other"}}};

constexpr std::array<std::pair<PointType, std::string_view>, 4> kPointLabels{
  {{PointType::GirthWeld, "girth_weld"},
   {PointType::Valve, "valve"},
   {PointType::Tee, "tee"},
   {PointType::Other, "other"}}};

}  // anonymous namespace

std::string_view toString(FeatureType type)
{
  for (const auto& [value, label] : kFeatureLabels)
  {
    if (value == type)
    {
      return label;
    }
  }
  return "other";
}

std::string_view toString(PointType type)
{
  for (const auto& [value, label] : kPointLabels)
  {
    if (value == type)
    {
      return label;
    }
  }
  return "other";
}

FeatureType featureTypeFromString(std::string_view label)
{
  for (const auto& [value, name] : kFeatureLabels)
  {
    if (name == label)
    {
      return value;
    }
  }
  throw std::invalid_argument{"Unknown feature type: " + std::string{label}};
}

PointType pointTypeFromString(std::string_view label)
{
  for (const auto& [value, name] : kPointLabels)
  {
    if (name == label)
    {
      return value;
    }
  }
  throw std::invalid_argument{"Unknown reference point type: " +
                              std::string{label}};
}

}  // namespace ili_core
