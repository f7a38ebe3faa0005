#ifndef FLIGHT_PHASE_ANALYZER_HPP
#define FLIGHT_PHASE_ANALYZER_HPP

#include "aircraft/aircraft_type.hpp"
#include "telemetry/flight_log.hpp"

#include <map>
#include <optional>
#include <string>

struct FlightPhases {
  // Phase name -> time spent in it, in seconds
  std::map<std::string, double> durations_s;
  double total_flight_time_s = 0.0;
};

struct PerformanceMetrics {
  std::map<std::string, double> values;
  // "normal" / "below_normal", fixed-wing logs with an engine RPM column only
  std::optional<std::string> engine_state;
};

// Per-type flight phase durations and performance figures. Phases are
// counted in rows and converted to seconds with the log's mean sample
// interval.
class FlightPhaseAnalyzer {
public:
  static constexpr double DEFAULT_SAMPLE_INTERVAL_S = 0.1;

  FlightPhases analyze_phases(const FlightLog &log, AircraftType type) const;
  PerformanceMetrics compute_performance(const FlightLog &log,
                                         AircraftType type) const;

private:
  FlightPhases fixed_wing_phases(const FlightLog &log, double interval) const;
  FlightPhases multirotor_phases(const FlightLog &log, double interval) const;

  void fixed_wing_performance(const FlightLog &log,
                              PerformanceMetrics &metrics) const;
  void multirotor_performance(const FlightLog &log,
                              PerformanceMetrics &metrics) const;
};

#endif // FLIGHT_PHASE_ANALYZER_HPP
