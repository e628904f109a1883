// Ticket: 0012_synthetic_three_run_scenario
//
// Seeded three-run inspection scenario shared by the demo executable,
// benchmarks and end-to-end tests.

#ifndef ILI_CORE_UTILS_SYNTHETIC_INSPECTION_GENERATOR_HPP
#define ILI_CORE_UTILS_SYNTHETIC_INSPECTION_GENERATOR_HPP

#include <array>
#include <cstddef>
#include <string>

#include "ili-core/src/Analysis/ThreeWayAnalyzer.hpp"
#include "ili-core/src/DataTypes/InspectionDate.hpp"

namespace ili_core
{

/**
 * @brief Generates three inspection runs over one simulated pipeline.
 *
 * Each true defect has a fixed position and a depth growth rate; roughly one
 * in five accelerates. Each run observes the defects through its own
 * odometer (distance * scale + offset + noise) and adds measurement noise to
 * clock and depth. Later runs add new defects; some defects are repaired
 * and disappear. Girth welds are placed every jointLengthFt.
 *
 * Output is fully determined by Config::seed.
 */
class SyntheticInspectionGenerator
{
public:
  struct RunSpec
  {
    std::string runId;
    InspectionDate date;
    double odometerScale{1.0};
    double odometerOffsetFt{0.0};
  };

  struct Config
  {
    unsigned int seed{42};
    size_t anomalyCount{200};
    double pipelineLengthFt{10000.0};
    double jointLengthFt{40.0};
    double odometerNoiseFt{0.3};
    double clockNoiseHours{0.1};
    double depthNoisePct{0.5};
    double newAnomalyFraction{0.05};  // Per later run, relative to count
    double repairFraction{0.03};      // Per interval
    std::array<RunSpec, 3> runs{
      RunSpec{"RUN_2007", makeInspectionDate(2007, 1, 1), 1.0, 0.0},
      RunSpec{"RUN_2015", makeInspectionDate(2015, 1, 1), 1.0004, 2.0},
      RunSpec{"RUN_2022", makeInspectionDate(2022, 1, 1), 0.9997, -1.5}};
  };

  SyntheticInspectionGenerator();

  /**
   * @throws std::invalid_argument if the pipeline or joint length is not
   *         positive, or a run's odometer scale is not positive
   */
  explicit SyntheticInspectionGenerator(const Config& config);

  [[nodiscard]] std::array<InspectionRun, 3> generate() const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  Config config_;
};

}  // namespace ili_core

#endif  // ILI_CORE_UTILS_SYNTHETIC_INSPECTION_GENERATOR_HPP
