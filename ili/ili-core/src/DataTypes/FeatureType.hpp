// Ticket: 0001_inspection_data_types

#ifndef ILI_CORE_DATATYPES_FEATURE_TYPE_HPP
#define ILI_CORE_DATATYPES_FEATURE_TYPE_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace ili_core
{

/**
 * @brief Classification of a reported pipe-wall feature.
 *
 * Ingestion maps vendor-specific labels onto this closed set.
 */
enum class FeatureType : uint8_t
{
  ExternalCorrosion,
  InternalCorrosion,
  Dent,
  Crack,
  Other
};

/**
 * @brief Category of a fixed pipeline landmark.
 */
enum class PointType : uint8_t
{
  GirthWeld,
  Valve,
  Tee,
  Other
};

/// Canonical snake_case label ("external_corrosion", ...)
std::string_view toString(FeatureType type);

/// Canonical snake_case label ("girth_weld", ...)
std::string_view toString(PointType type);

/**
 * @brief Parse a canonical feature-type label.
 * @throws std::invalid_argument if the label is not recognised
 */
FeatureType featureTypeFromString(std::string_view label);

/**
 * @brief Parse a canonical reference-point label.
 * @throws std::invalid_argument if the label is not recognised
 */
PointType pointTypeFromString(std::string_view label);

}  // namespace ili_core

#endif  // ILI_CORE_DATATYPES_FEATURE_TYPE_HPP
