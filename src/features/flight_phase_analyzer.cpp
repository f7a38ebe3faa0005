#include "features/flight_phase_analyzer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace {

constexpr size_t FW_CRUISE_WINDOW_ROWS = 20;
constexpr double FW_CRUISE_MAX_ALTITUDE_STDDEV_M = 3.0;
constexpr double FW_CRUISE_MIN_AIRSPEED = 20.0;
constexpr double FW_TAKEOFF_MIN_CLIMB_M = 1.0;
constexpr double FW_TAKEOFF_MIN_AIRSPEED = 15.0;
constexpr double FW_APPROACH_MIN_DESCENT_M = 1.0;
constexpr double FW_APPROACH_MAX_AIRSPEED = 30.0;
constexpr double FW_ENGINE_NORMAL_RPM = 1000.0;

constexpr double MR_HOVER_MAX_SPEED = 2.0;
constexpr double MR_HOVER_MAX_ALTITUDE_STEP_M = 2.0;
constexpr double MR_FORWARD_MIN_SPEED = 5.0;
constexpr double MR_AGGRESSIVE_MIN_ATTITUDE_DEG = 15.0;

size_t count_transition_rows(const FlightLog &log) {
  const auto mode = log.column_or_zero("transition_mode");
  return static_cast<size_t>(
      std::count_if(mode.begin(), mode.end(), [](double m) { return m == 1.0; }));
}

} // namespace

FlightPhases FlightPhaseAnalyzer::analyze_phases(const FlightLog &log,
                                                 AircraftType type) const {
  if (log.empty())
    return FlightPhases{};

  const double interval = log.mean_sample_interval(DEFAULT_SAMPLE_INTERVAL_S);
  FlightPhases phases;
  switch (type) {
  case AircraftType::FIXED_WING:
    phases = fixed_wing_phases(log, interval);
    break;
  case AircraftType::MULTIROTOR:
    phases = multirotor_phases(log, interval);
    break;
  case AircraftType::VTOL:
    phases = multirotor_phases(log, interval);
    if (log.has_column("transition_mode"))
      phases.durations_s["transition"] = count_transition_rows(log) * interval;
    break;
  }
  phases.total_flight_time_s = log.row_count() * interval;
  return phases;
}

FlightPhases FlightPhaseAnalyzer::fixed_wing_phases(const FlightLog &log,
                                                    double interval) const {
  FlightPhases phases;
  phases.durations_s = {{"takeoff", 0.0}, {"cruise", 0.0}, {"approach", 0.0}};
  if (!log.has_column("altitude") || !log.has_column("airspeed"))
    return phases;

  const auto altitude = log.column_or_zero("altitude");
  const auto airspeed = log.column_or_zero("airspeed");

  size_t takeoff = 0, cruise = 0, approach = 0;
  for (size_t i = 0; i < altitude.size(); ++i) {
    if (i > 0) {
      const double climb = altitude[i] - altitude[i - 1];
      if (climb > FW_TAKEOFF_MIN_CLIMB_M && airspeed[i] > FW_TAKEOFF_MIN_AIRSPEED)
        ++takeoff;
      if (climb < -FW_APPROACH_MIN_DESCENT_M &&
          airspeed[i] < FW_APPROACH_MAX_AIRSPEED)
        ++approach;
    }
    if (i + 1 >= FW_CRUISE_WINDOW_ROWS && airspeed[i] > FW_CRUISE_MIN_AIRSPEED) {
      std::vector<double> window(altitude.begin() + (i + 1 - FW_CRUISE_WINDOW_ROWS),
                                 altitude.begin() + (i + 1));
      if (Utils::sample_stddev(window) < FW_CRUISE_MAX_ALTITUDE_STDDEV_M)
        ++cruise;
    }
  }

  phases.durations_s["takeoff"] = takeoff * interval;
  phases.durations_s["cruise"] = cruise * interval;
  phases.durations_s["approach"] = approach * interval;
  return phases;
}

FlightPhases FlightPhaseAnalyzer::multirotor_phases(const FlightLog &log,
                                                    double interval) const {
  FlightPhases phases;
  phases.durations_s = {
      {"hover", 0.0}, {"forward_flight", 0.0}, {"aggressive_maneuvers", 0.0}};
  if (!log.has_column("speed") || !log.has_column("altitude"))
    return phases;

  const auto speed = log.column_or_zero("speed");
  const auto altitude = log.column_or_zero("altitude");
  const bool has_attitude =
      log.has_column("pitch_angle") && log.has_column("roll_angle");
  const auto pitch = log.column_or_zero("pitch_angle");
  const auto roll = log.column_or_zero("roll_angle");

  size_t hover = 0, forward = 0, aggressive = 0;
  for (size_t i = 0; i < speed.size(); ++i) {
    if (i > 0 && speed[i] < MR_HOVER_MAX_SPEED &&
        std::abs(altitude[i] - altitude[i - 1]) < MR_HOVER_MAX_ALTITUDE_STEP_M)
      ++hover;
    if (speed[i] > MR_FORWARD_MIN_SPEED)
      ++forward;
    if (has_attitude && (std::abs(pitch[i]) > MR_AGGRESSIVE_MIN_ATTITUDE_DEG ||
                         std::abs(roll[i]) > MR_AGGRESSIVE_MIN_ATTITUDE_DEG))
      ++aggressive;
  }

  phases.durations_s["hover"] = hover * interval;
  phases.durations_s["forward_flight"] = forward * interval;
  phases.durations_s["aggressive_maneuvers"] = aggressive * interval;
  return phases;
}

PerformanceMetrics
FlightPhaseAnalyzer::compute_performance(const FlightLog &log,
                                         AircraftType type) const {
  PerformanceMetrics metrics;
  if (log.empty())
    return metrics;

  switch (type) {
  case AircraftType::FIXED_WING:
    fixed_wing_performance(log, metrics);
    break;
  case AircraftType::MULTIROTOR:
    multirotor_performance(log, metrics);
    break;
  case AircraftType::VTOL:
    multirotor_performance(log, metrics);
    if (log.has_column("transition_mode")) {
      metrics.values["transition_time_s"] =
          count_transition_rows(log) *
          log.mean_sample_interval(DEFAULT_SAMPLE_INTERVAL_S);
    }
    break;
  }
  return metrics;
}

void FlightPhaseAnalyzer::fixed_wing_performance(
    const FlightLog &log, PerformanceMetrics &metrics) const {
  if (log.has_column("airspeed")) {
    const auto airspeed = log.column_or_zero("airspeed");
    metrics.values["average_airspeed_mps"] = Utils::mean(airspeed);
    metrics.values["max_airspeed_mps"] =
        *std::max_element(airspeed.begin(), airspeed.end());
  }
  if (log.has_column("motor_rpm")) {
    metrics.engine_state =
        Utils::mean(log.column_or_zero("motor_rpm")) > FW_ENGINE_NORMAL_RPM
            ? "normal"
            : "below_normal";
  }
  if (log.has_column("throttle_position"))
    metrics.values["average_throttle_pct"] =
        Utils::mean(log.column_or_zero("throttle_position"));
  if (log.has_column("battery_voltage") && log.row_count() > 1) {
    const auto voltage = log.column_or_zero("battery_voltage");
    metrics.values["battery_consumption_v"] = voltage.front() - voltage.back();
  }
}

void FlightPhaseAnalyzer::multirotor_performance(
    const FlightLog &log, PerformanceMetrics &metrics) const {
  std::vector<double> motor_means;
  for (const auto &name : log.column_names()) {
    if (Utils::contains_substring(name, "motor") &&
        Utils::contains_substring(name, "rpm"))
      motor_means.push_back(Utils::mean(log.column_or_zero(name)));
  }
  if (!motor_means.empty())
    metrics.values["motor_spread_rpm"] = Utils::population_stddev(motor_means);

  if (log.has_column("battery_voltage") && log.row_count() > 1) {
    const auto voltage = log.column_or_zero("battery_voltage");
    metrics.values["battery_consumption_v"] = voltage.front() - voltage.back();
  }

  const char *axes[] = {"vibration_x", "vibration_y", "vibration_z",
                        "vibration_w"};
  if (std::all_of(std::begin(axes), std::end(axes),
                  [&log](const char *axis) { return log.has_column(axis); })) {
    std::vector<double> axis_means;
    for (const char *axis : axes) {
      auto values = log.column_or_zero(axis);
      for (auto &v : values)
        v = std::abs(v);
      axis_means.push_back(Utils::mean(values));
    }
    metrics.values["average_vibration"] = Utils::mean(axis_means);
  }
}
