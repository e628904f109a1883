// Ticket: 0001_inspection_data_types

#ifndef ILI_CORE_DATATYPES_CLOCK_POSITION_HPP
#define ILI_CORE_DATATYPES_CLOCK_POSITION_HPP

#include <algorithm>
#include <cmath>
#include <numbers>

namespace ili_core
{

// Clock positions are reported in hours on a 12-hour dial (1..12)
static constexpr double kClockHours = 12.0;

// Span of the dial used for angular embedding: 1 and 12 both land on 0 rad
static constexpr double kClockEmbeddingHours = 11.0;

/**
 * @brief Shortest circular distance between two clock positions [hours]
 *
 * The raw difference is reduced modulo 12 before folding, so 12 and 0
 * describe the same orientation. Result lies in [0, 6].
 */
inline double circularClockDistance(double clock1, double clock2)
{
  double const diff = std::fmod(std::abs(clock1 - clock2), kClockHours);
  return std::min(diff, kClockHours - diff);
}

/**
 * @brief Angle of a clock position on the 11-hour embedding circle [rad]
 *
 * theta = (clock - 1) / 11 * 2pi
 */
inline double clockToAngle(double clock)
{
  return (clock - 1.0) / kClockEmbeddingHours * 2.0 * std::numbers::pi;
}

/**
 * @brief Inverse of clockToAngle(), with the angle wrapped into [0, 2pi)
 */
inline double angleToClock(double angle)
{
  double constexpr twoPi = 2.0 * std::numbers::pi;
  double wrapped = std::fmod(angle, twoPi);
  if (wrapped < 0.0)
  {
    wrapped += twoPi;
  }
  return wrapped / twoPi * kClockEmbeddingHours + 1.0;
}

}  // namespace ili_core

#endif  // ILI_CORE_DATATYPES_CLOCK_POSITION_HPP
