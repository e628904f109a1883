// Ticket: 0001_inspection_data_types

#ifndef ILI_CORE_DATATYPES_INSPECTION_DATE_HPP
#define ILI_CORE_DATATYPES_INSPECTION_DATE_HPP

#include <chrono>

namespace ili_core
{

using InspectionDate = std::chrono::sys_days;

static constexpr double kDaysPerYear = 365.25;

/**
 * @brief Construct an inspection date from calendar fields
 */
inline InspectionDate makeInspectionDate(int year, unsigned month, unsigned day)
{
  return std::chrono::sys_days{std::chrono::year{year} /
                               std::chrono::month{month} /
                               std::chrono::day{day}};
}

/**
 * @brief Signed interval between two inspections in years (days / 365.25)
 *
 * Positive when @p later is after @p earlier.
 */
inline double yearsBetween(InspectionDate earlier, InspectionDate later)
{
  auto const days = (later - earlier).count();
  return static_cast<double>(days) / kDaysPerYear;
}

}  // namespace ili_core

#endif  // ILI_CORE_DATATYPES_INSPECTION_DATE_HPP
