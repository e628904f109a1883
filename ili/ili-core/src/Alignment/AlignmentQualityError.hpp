// Ticket: 0002_dtw_alignment

#ifndef ILI_CORE_ALIGNMENT_ALIGNMENT_QUALITY_ERROR_HPP
#define ILI_CORE_ALIGNMENT_ALIGNMENT_QUALITY_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ili_core
{

/**
 * @brief Raised when an alignment is well formed but fails a quality gate.
 *
 * Distinct from std::invalid_argument (malformed input) so callers can
 * degrade to uncorrected distances on quality failures only.
 */
class AlignmentQualityError final : public std::runtime_error
{
public:
  AlignmentQualityError(const std::string& message,
                        double matchRate,
                        double rmse)
    : std::runtime_error{message}, matchRate_{matchRate}, rmse_{rmse}
  {
  }

  /// Match rate of the rejected alignment [%]
  [[nodiscard]] double matchRate() const noexcept
  {
    return matchRate_;
  }

  /// RMSE of the rejected alignment [ft]
  [[nodiscard]] double rmse() const noexcept
  {
    return rmse_;
  }

private:
  double matchRate_;
  double rmse_;
};

}  // namespace ili_core

#endif  // ILI_CORE_ALIGNMENT_ALIGNMENT_QUALITY_ERROR_HPP
