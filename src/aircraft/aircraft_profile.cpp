#include "aircraft/aircraft_profile.hpp"
#include "utils/utils.hpp"

#include <numeric>
#include <stdexcept>

double NominalRange::deviation(double value) const {
  const double width = high > low ? high - low : 1.0;
  if (value < low)
    return (low - value) / width;
  if (value > high)
    return (value - high) / width;
  return 0.0;
}

AircraftProfile::AircraftProfile(AircraftType type,
                                 std::vector<std::string> feature_names,
                                 std::vector<ScoringRule> rules,
                                 std::vector<NominalRange> nominal_ranges,
                                 std::vector<std::string> lift_motor_columns,
                                 size_t min_active_lift_motors)
    : type_(type), feature_names_(std::move(feature_names)),
      rules_(std::move(rules)), nominal_ranges_(std::move(nominal_ranges)),
      lift_motor_columns_(std::move(lift_motor_columns)),
      min_active_lift_motors_(min_active_lift_motors) {
  max_raw_score_ = std::accumulate(
      rules_.begin(), rules_.end(), 0.0,
      [](double acc, const ScoringRule &rule) { return acc + rule.weight; });
}

double AircraftProfile::score(const SummaryStats &stats) const {
  if (stats.is_degenerate() || max_raw_score_ <= 0.0)
    return 0.0;

  double raw = 0.0;
  for (const auto &rule : rules_) {
    if (rule.predicate(stats))
      raw += rule.weight;
  }
  return Utils::round_to(raw / max_raw_score_, 6);
}

std::vector<std::string>
AircraftProfile::matched_rules(const SummaryStats &stats) const {
  std::vector<std::string> matched;
  if (stats.is_degenerate())
    return matched;
  for (const auto &rule : rules_) {
    if (rule.predicate(stats))
      matched.push_back(rule.description);
  }
  return matched;
}

namespace {

NominalRange make_range(const std::string &feature, double low, double high,
                        const std::string &low_issue,
                        const std::string &high_issue) {
  return NominalRange{feature, low, high, low_issue, high_issue};
}

std::vector<NominalRange> vibration_ranges() {
  std::vector<NominalRange> ranges;
  for (const char *axis : {"x", "y", "z", "w"}) {
    std::string feature = std::string("vibration_") + axis;
    ranges.push_back(make_range(feature, -8.0, 8.0,
                                "Excessive vibration on axis " +
                                    std::string(axis),
                                "Excessive vibration on axis " +
                                    std::string(axis)));
  }
  return ranges;
}

std::vector<NominalRange> lift_motor_ranges(size_t count, double low,
                                            double high) {
  std::vector<NominalRange> ranges;
  for (size_t i = 1; i <= count; ++i) {
    const std::string index = std::to_string(i);
    ranges.push_back(make_range("motor_" + index + "_rpm", low, high,
                                "Motor " + index + " underperforming",
                                "Motor " + index + " overspeed"));
  }
  return ranges;
}

AircraftProfile build_fixed_wing(const Config::ClassifierConfig &cfg) {
  std::vector<std::string> features = {
      "altitude",          "battery_voltage",   "motor_rpm",
      "airspeed",          "ground_speed",      "throttle_position",
      "elevator_position", "rudder_position",   "aileron_position",
      "pitch_angle",       "roll_angle",        "yaw_rate",
      "gps_hdop",          "temperature",       "wind_speed",
      "angle_of_attack"};

  std::vector<ScoringRule> rules = {
      {"single active motor", 0.3,
       [](const SummaryStats &s) { return s.active_motor_count == 1; }},
      {"control surfaces active", 0.2,
       [](const SummaryStats &s) { return s.has_control_surfaces; }},
      {"sustained cruise", 0.2,
       [min = cfg.fixed_wing_min_cruise_ratio](const SummaryStats &s) {
         return s.cruise_ratio > min;
       }},
      {"high average speed", 0.2,
       [min = cfg.fast_speed_mps](const SummaryStats &s) {
         return s.average_speed > min;
       }},
      {"few vertical reversals", 0.1,
       [max = cfg.fixed_wing_max_vertical_transition_ratio](
           const SummaryStats &s) {
         return s.vertical_transition_ratio < max;
       }}};

  std::vector<NominalRange> ranges = {
      make_range("altitude", 10.0, 550.0, "Altitude critically low",
                 "Altitude above operating ceiling"),
      make_range("battery_voltage", 10.0, 12.6,
                 "Battery voltage critically low", "Battery over-voltage"),
      make_range("motor_rpm", 1000.0, 8000.0, "Engine failure or shutdown",
                 "Engine overspeed"),
      make_range("airspeed", 12.0, 45.0, "Airspeed below stall speed",
                 "Airspeed exceeds safe limits"),
      make_range("elevator_position", -25.0, 25.0,
                 "Extreme elevator deflection", "Extreme elevator deflection"),
      make_range("aileron_position", -25.0, 25.0, "Extreme aileron deflection",
                 "Extreme aileron deflection"),
      make_range("rudder_position", -25.0, 25.0, "Extreme rudder deflection",
                 "Extreme rudder deflection"),
      make_range("pitch_angle", -20.0, 25.0, "Steep nose-down attitude",
                 "Steep nose-up attitude"),
      make_range("roll_angle", -35.0, 35.0, "Excessive bank angle",
                 "Excessive bank angle"),
      make_range("yaw_rate", -12.0, 12.0, "Excessive yaw rate",
                 "Excessive yaw rate"),
      make_range("gps_hdop", 0.0, 4.0, "GPS quality degraded",
                 "GPS quality degraded"),
      make_range("temperature", -5.0, 50.0, "Temperature below operating range",
                 "Temperature above operating range"),
      make_range("wind_speed", 0.0, 20.0, "Wind speed reading invalid",
                 "Wind speed above operating limit"),
      make_range("angle_of_attack", -5.0, 20.0, "Negative angle of attack",
                 "High angle of attack - stall risk")};

  return AircraftProfile(AircraftType::FIXED_WING, std::move(features),
                         std::move(rules), std::move(ranges), {"motor_rpm"},
                         1);
}

AircraftProfile build_multirotor(const Config::ClassifierConfig &cfg) {
  std::vector<std::string> features = {
      "altitude",    "battery_voltage", "motor_1_rpm", "motor_2_rpm",
      "motor_3_rpm", "motor_4_rpm",     "vibration_x", "vibration_y",
      "vibration_z", "vibration_w",     "pitch_angle", "roll_angle",
      "speed",       "temperature",     "gps_hdop"};

  std::vector<ScoringRule> rules = {
      {"four or more active motors", 0.3,
       [](const SummaryStats &s) { return s.active_motor_count >= 4; }},
      {"frequent hovering", 0.2,
       [min = cfg.multirotor_min_hover_ratio](const SummaryStats &s) {
         return s.hover_ratio > min;
       }},
      {"frequent vertical reversals", 0.2,
       [min = cfg.multirotor_min_vertical_transition_ratio](
           const SummaryStats &s) {
         return s.vertical_transition_ratio > min;
       }},
      {"low average speed", 0.1,
       [max = cfg.fast_speed_mps](const SummaryStats &s) {
         return s.average_speed < max;
       }},
      {"symmetric motor load", 0.2,
       [min = cfg.multirotor_min_motor_symmetry](const SummaryStats &s) {
         return s.motor_symmetry > min;
       }}};

  std::vector<NominalRange> ranges = {
      make_range("altitude", 0.0, 130.0, "Altitude reading invalid",
                 "Altitude above operating ceiling"),
      make_range("battery_voltage", 10.5, 12.4,
                 "Battery voltage critically low", "Battery over-voltage")};
  for (auto &range : lift_motor_ranges(4, 1500.0, 5000.0))
    ranges.push_back(std::move(range));
  for (auto &range : vibration_ranges())
    ranges.push_back(std::move(range));
  ranges.push_back(make_range("pitch_angle", -30.0, 30.0, "Extreme pitch attitude",
                              "Extreme pitch attitude"));
  ranges.push_back(make_range("roll_angle", -30.0, 30.0, "Extreme roll attitude",
                              "Extreme roll attitude"));
  ranges.push_back(make_range("speed", 0.0, 20.0, "Speed reading invalid",
                              "Speed exceeds safe limits"));
  ranges.push_back(make_range("temperature", 0.0, 45.0,
                              "Temperature below operating range",
                              "Temperature above operating range"));
  ranges.push_back(make_range("gps_hdop", 0.0, 5.0, "GPS quality degraded",
                              "GPS quality degraded"));

  return AircraftProfile(AircraftType::MULTIROTOR, std::move(features),
                         std::move(rules), std::move(ranges),
                         {"motor_1_rpm", "motor_2_rpm", "motor_3_rpm",
                          "motor_4_rpm"},
                         4);
}

AircraftProfile build_vtol(const Config::ClassifierConfig &cfg) {
  std::vector<std::string> features = {
      "altitude",          "battery_voltage",  "motor_1_rpm", "motor_2_rpm",
      "motor_3_rpm",       "motor_4_rpm",      "motor_5_rpm", "airspeed",
      "elevator_position", "aileron_position", "gps_hdop",    "vibration_x",
      "vibration_y",       "vibration_z",      "vibration_w", "temperature",
      "transition_mode",   "pitch_angle",      "roll_angle"};

  std::vector<ScoringRule> rules = {
      {"five or more active motors", 0.2,
       [](const SummaryStats &s) { return s.active_motor_count >= 5; }},
      {"both hover and cruise phases", 0.3,
       [hover = cfg.vtol_min_hover_ratio,
        cruise = cfg.vtol_min_cruise_ratio](const SummaryStats &s) {
         return s.hover_ratio > hover && s.cruise_ratio > cruise;
       }},
      {"control surfaces with multiple motors", 0.2,
       [](const SummaryStats &s) {
         return s.has_control_surfaces && s.active_motor_count >= 2;
       }},
      {"hover to forward flight transitions", 0.3,
       [](const SummaryStats &s) { return s.transition_events > 0; }}};

  std::vector<NominalRange> ranges = {
      make_range("altitude", 0.0, 350.0, "Altitude reading invalid",
                 "Altitude above operating ceiling"),
      make_range("battery_voltage", 19.5, 24.5,
                 "Battery voltage critically low", "Battery over-voltage")};
  for (auto &range : lift_motor_ranges(4, 1500.0, 5000.0))
    ranges.push_back(std::move(range));
  ranges.push_back(make_range("motor_5_rpm", 2500.0, 7500.0,
                              "Forward motor failure",
                              "Forward motor overspeed"));
  ranges.push_back(make_range("airspeed", 0.0, 35.0, "Airspeed reading invalid",
                              "Airspeed exceeds transition-safe limit"));
  ranges.push_back(make_range("elevator_position", -20.0, 20.0,
                              "Extreme elevator deflection",
                              "Extreme elevator deflection"));
  ranges.push_back(make_range("aileron_position", -20.0, 20.0,
                              "Extreme aileron deflection",
                              "Extreme aileron deflection"));
  ranges.push_back(make_range("gps_hdop", 0.0, 4.0, "GPS quality degraded",
                              "GPS quality degraded"));
  for (auto &range : vibration_ranges())
    ranges.push_back(std::move(range));
  ranges.push_back(make_range("temperature", -5.0, 50.0,
                              "Temperature below operating range",
                              "Temperature above operating range"));
  ranges.push_back(make_range("pitch_angle", -25.0, 25.0,
                              "Extreme pitch attitude",
                              "Extreme pitch attitude"));
  ranges.push_back(make_range("roll_angle", -25.0, 25.0,
                              "Extreme roll attitude", "Extreme roll attitude"));

  return AircraftProfile(AircraftType::VTOL, std::move(features),
                         std::move(rules), std::move(ranges),
                         {"motor_1_rpm", "motor_2_rpm", "motor_3_rpm",
                          "motor_4_rpm"},
                         4);
}

} // namespace

ProfileCatalog::ProfileCatalog(const Config::ClassifierConfig &config) {
  profiles_.push_back(build_fixed_wing(config));
  profiles_.push_back(build_multirotor(config));
  profiles_.push_back(build_vtol(config));
}

const AircraftProfile &ProfileCatalog::profile(AircraftType type) const {
  for (const auto &p : profiles_) {
    if (p.type() == type)
      return p;
  }
  throw std::out_of_range("No profile for aircraft type " +
                          aircraft_type_to_string(type));
}
