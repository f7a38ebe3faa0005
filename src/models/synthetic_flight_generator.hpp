#ifndef SYNTHETIC_FLIGHT_GENERATOR_HPP
#define SYNTHETIC_FLIGHT_GENERATOR_HPP

#include "aircraft/aircraft_profile.hpp"
#include "telemetry/flight_log.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

struct TrainingSet {
  // Rows in profile feature order
  std::vector<std::vector<double>> features;
  // 1 = anomalous, 0 = normal
  std::vector<int> labels;
};

class ITrainingDataGenerator {
public:
  virtual ~ITrainingDataGenerator() = default;

  // Deterministic for a given seed.
  virtual TrainingSet generate_training_set(const AircraftProfile &profile,
                                            size_t samples,
                                            double anomaly_fraction,
                                            uint64_t seed) const = 0;
};

// Labelled telemetry drawn from per-type nominal distributions. Anomalous
// rows are normal rows with one injected failure mode (battery, motor, GPS,
// vibration, thermal, attitude or airspeed).
class SyntheticFlightGenerator : public ITrainingDataGenerator {
public:
  TrainingSet generate_training_set(const AircraftProfile &profile,
                                    size_t samples, double anomaly_fraction,
                                    uint64_t seed) const override;

  // A coherent normal flight sampled at 10 Hz
  FlightLog synthesize_flight(AircraftType type, size_t rows,
                              uint64_t seed) const;
};

#endif // SYNTHETIC_FLIGHT_GENERATOR_HPP
