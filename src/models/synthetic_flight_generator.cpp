#include "models/synthetic_flight_generator.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <random>
#include <stdexcept>
#include <string>

namespace {

using Rng = std::mt19937_64;
using Sampler = std::function<double(Rng &)>;

constexpr double SAMPLE_INTERVAL_S = 0.1;
constexpr size_t TRANSITION_ROWS = 20;

Sampler normal(double mean, double stddev) {
  return [mean, stddev](Rng &rng) {
    return std::normal_distribution<double>(mean, stddev)(rng);
  };
}

Sampler uniform(double low, double high) {
  return [low, high](Rng &rng) {
    return std::uniform_real_distribution<double>(low, high)(rng);
  };
}

Sampler gamma(double shape, double scale) {
  return [shape, scale](Rng &rng) {
    return std::gamma_distribution<double>(shape, scale)(rng);
  };
}

Sampler bernoulli(double p) {
  return [p](Rng &rng) {
    return std::bernoulli_distribution(p)(rng) ? 1.0 : 0.0;
  };
}

double draw(Rng &rng, double low, double high) {
  return std::uniform_real_distribution<double>(low, high)(rng);
}

// Uniform over one of two disjoint intervals, chosen with equal odds
double draw_either(Rng &rng, double low_a, double high_a, double low_b,
                   double high_b) {
  return std::bernoulli_distribution(0.5)(rng) ? draw(rng, low_a, high_a)
                                               : draw(rng, low_b, high_b);
}

double signed_draw(Rng &rng, double low, double high) {
  const double magnitude = draw(rng, low, high);
  return std::bernoulli_distribution(0.5)(rng) ? magnitude : -magnitude;
}

size_t pick(Rng &rng, size_t count) {
  return std::uniform_int_distribution<size_t>(0, count - 1)(rng);
}

// Write access to a feature row by name; features the profile does not carry
// are ignored.
class FeatureRow {
public:
  FeatureRow(std::vector<double> &values,
             const std::map<std::string, size_t> &index)
      : values_(values), index_(index) {}

  void set(const std::string &name, double value) {
    auto it = index_.find(name);
    if (it != index_.end())
      values_[it->second] = value;
  }

private:
  std::vector<double> &values_;
  const std::map<std::string, size_t> &index_;
};

struct FailureMode {
  std::string name;
  unsigned weight;
  std::function<void(FeatureRow &, Rng &)> apply;
};

std::map<std::string, Sampler> nominal_samplers(AircraftType type) {
  switch (type) {
  case AircraftType::FIXED_WING:
    return {{"altitude", uniform(50.0, 500.0)},
            {"battery_voltage", normal(11.1, 0.2)},
            {"motor_rpm", normal(5000.0, 300.0)},
            {"airspeed", normal(25.0, 3.0)},
            {"ground_speed", normal(23.0, 4.0)},
            {"throttle_position", normal(75.0, 10.0)},
            {"elevator_position", normal(0.0, 2.0)},
            {"rudder_position", normal(0.0, 2.0)},
            {"aileron_position", normal(0.0, 3.0)},
            {"pitch_angle", normal(5.0, 3.0)},
            {"roll_angle", normal(0.0, 5.0)},
            {"yaw_rate", normal(0.0, 2.0)},
            {"gps_hdop", gamma(2.0, 0.5)},
            {"temperature", normal(25.0, 8.0)},
            {"wind_speed", gamma(2.0, 2.0)},
            {"angle_of_attack", normal(5.0, 2.0)}};
  case AircraftType::MULTIROTOR:
    return {{"altitude", uniform(5.0, 120.0)},
            {"battery_voltage", normal(11.1, 0.2)},
            {"motor_1_rpm", normal(3000.0, 200.0)},
            {"motor_2_rpm", normal(3000.0, 200.0)},
            {"motor_3_rpm", normal(3000.0, 200.0)},
            {"motor_4_rpm", normal(3000.0, 200.0)},
            {"vibration_x", normal(0.0, 2.0)},
            {"vibration_y", normal(0.0, 2.0)},
            {"vibration_z", normal(0.0, 2.0)},
            {"vibration_w", normal(0.0, 2.0)},
            {"pitch_angle", normal(0.0, 8.0)},
            {"roll_angle", normal(0.0, 8.0)},
            {"speed", uniform(0.0, 12.0)},
            {"temperature", normal(25.0, 5.0)},
            {"gps_hdop", gamma(2.0, 0.7)}};
  case AircraftType::VTOL:
    return {{"altitude", uniform(10.0, 300.0)},
            {"battery_voltage", normal(22.0, 0.6)},
            {"motor_1_rpm", normal(3000.0, 200.0)},
            {"motor_2_rpm", normal(3000.0, 200.0)},
            {"motor_3_rpm", normal(3000.0, 200.0)},
            {"motor_4_rpm", normal(3000.0, 200.0)},
            {"motor_5_rpm", normal(5000.0, 300.0)},
            {"airspeed", uniform(0.0, 30.0)},
            {"elevator_position", normal(0.0, 2.0)},
            {"aileron_position", normal(0.0, 3.0)},
            {"gps_hdop", gamma(2.0, 0.5)},
            {"vibration_x", normal(0.0, 2.0)},
            {"vibration_y", normal(0.0, 2.0)},
            {"vibration_z", normal(0.0, 2.0)},
            {"vibration_w", normal(0.0, 2.0)},
            {"temperature", normal(25.0, 8.0)},
            {"transition_mode", bernoulli(0.2)},
            {"pitch_angle", normal(0.0, 6.0)},
            {"roll_angle", normal(0.0, 6.0)}};
  }
  return {};
}

FailureMode vibration_failure() {
  return {"excess_vibration", 1, [](FeatureRow &row, Rng &rng) {
            const char *axes[] = {"vibration_x", "vibration_y", "vibration_z",
                                  "vibration_w"};
            for (const char *axis : axes)
              row.set(axis, normal(0.0, 6.0)(rng));
            row.set(axes[pick(rng, 4)], signed_draw(rng, 9.0, 25.0));
          }};
}

FailureMode lift_motor_dropout(unsigned weight, double max_rpm) {
  return {"motor_dropout", weight, [max_rpm](FeatureRow &row, Rng &rng) {
            const std::string motor =
                "motor_" + std::to_string(pick(rng, 4) + 1) + "_rpm";
            row.set(motor, draw(rng, 0.0, max_rpm));
          }};
}

std::vector<FailureMode> failure_modes(AircraftType type) {
  switch (type) {
  case AircraftType::FIXED_WING:
    return {
        {"altitude_excursion", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("altitude", draw_either(rng, -10.0, 5.0, 600.0, 1000.0));
         }},
        {"battery_undervoltage", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("battery_voltage", draw(rng, 8.0, 9.8));
         }},
        {"battery_overvoltage", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("battery_voltage", draw(rng, 12.8, 15.0));
         }},
        {"engine_failure", 2,
         [](FeatureRow &row, Rng &rng) {
           row.set("motor_rpm", draw(rng, 0.0, 900.0));
           row.set("throttle_position", draw(rng, 0.0, 100.0));
         }},
        {"engine_overspeed", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("motor_rpm", draw(rng, 8200.0, 12000.0));
         }},
        {"stall", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("airspeed", draw(rng, 0.0, 11.0));
           row.set("angle_of_attack", draw(rng, 20.0, 45.0));
         }},
        {"airspeed_excursion", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("airspeed", draw(rng, 48.0, 80.0));
         }},
        {"control_saturation", 1,
         [](FeatureRow &row, Rng &rng) {
           const char *surfaces[] = {"elevator_position", "rudder_position",
                                     "aileron_position"};
           row.set(surfaces[pick(rng, 3)], signed_draw(rng, 26.0, 30.0));
         }},
        {"attitude_upset", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("pitch_angle", draw_either(rng, -30.0, -21.0, 26.0, 30.0));
           row.set("roll_angle", signed_draw(rng, 36.0, 45.0));
           row.set("yaw_rate", signed_draw(rng, 13.0, 20.0));
         }},
        {"gps_degradation", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("gps_hdop", 4.5 + gamma(5.0, 1.0)(rng));
         }},
        {"thermal", 1,
         [](FeatureRow &row, Rng &rng) {
           row.set("temperature", draw_either(rng, -20.0, -6.0, 51.0, 70.0));
         }},
        {"wind_shear", 1, [](FeatureRow &row, Rng &rng) {
           row.set("wind_speed", 21.0 + gamma(5.0, 3.0)(rng));
         }}};
  case AircraftType::MULTIROTOR:
    return {{"battery_undervoltage", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("battery_voltage", draw(rng, 9.0, 10.4));
             }},
            {"battery_overvoltage", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("battery_voltage", draw(rng, 12.5, 14.0));
             }},
            lift_motor_dropout(3, 500.0),
            {"motor_overspeed", 1,
             [](FeatureRow &row, Rng &rng) {
               const std::string motor =
                   "motor_" + std::to_string(pick(rng, 4) + 1) + "_rpm";
               row.set(motor, draw(rng, 5500.0, 8000.0));
             }},
            vibration_failure(),
            {"attitude_upset", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set(pick(rng, 2) == 0 ? "pitch_angle" : "roll_angle",
                       signed_draw(rng, 31.0, 45.0));
             }},
            {"gps_degradation", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("gps_hdop", draw(rng, 5.5, 20.0));
             }},
            {"thermal", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("temperature", draw_either(rng, -10.0, -1.0, 46.0, 60.0));
             }},
            {"speed_excursion", 1, [](FeatureRow &row, Rng &rng) {
               row.set("speed", draw(rng, 21.0, 30.0));
             }}};
  case AircraftType::VTOL:
    return {{"battery_undervoltage", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("battery_voltage", draw(rng, 18.0, 19.4));
             }},
            {"battery_overvoltage", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("battery_voltage", draw(rng, 24.6, 28.0));
             }},
            lift_motor_dropout(3, 900.0),
            {"forward_motor_failure", 2,
             [](FeatureRow &row, Rng &rng) {
               row.set("motor_5_rpm", draw(rng, 0.0, 1500.0));
             }},
            {"airspeed_excursion", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("airspeed", draw(rng, 36.0, 50.0));
             }},
            vibration_failure(),
            {"gps_degradation", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("gps_hdop", 4.5 + gamma(5.0, 1.0)(rng));
             }},
            {"thermal", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set("temperature", draw_either(rng, -20.0, -6.0, 51.0, 70.0));
             }},
            {"attitude_upset", 1,
             [](FeatureRow &row, Rng &rng) {
               row.set(pick(rng, 2) == 0 ? "pitch_angle" : "roll_angle",
                       signed_draw(rng, 26.0, 40.0));
             }},
            {"control_saturation", 1, [](FeatureRow &row, Rng &rng) {
               row.set(pick(rng, 2) == 0 ? "elevator_position"
                                         : "aileron_position",
                       signed_draw(rng, 21.0, 25.0));
             }}};
  }
  return {};
}

} // namespace

TrainingSet SyntheticFlightGenerator::generate_training_set(
    const AircraftProfile &profile, size_t samples, double anomaly_fraction,
    uint64_t seed) const {
  if (samples < 2)
    throw std::invalid_argument("at least two training samples are required");
  if (!(anomaly_fraction > 0.0 && anomaly_fraction < 1.0))
    throw std::invalid_argument("anomaly fraction must be within (0, 1)");

  const auto samplers = nominal_samplers(profile.type());
  const auto modes = failure_modes(profile.type());

  std::map<std::string, size_t> index;
  std::vector<const Sampler *> row_samplers;
  for (size_t f = 0; f < profile.feature_count(); ++f) {
    const auto &name = profile.feature_names()[f];
    index[name] = f;
    auto it = samplers.find(name);
    if (it == samplers.end())
      throw std::logic_error("no nominal distribution for feature " + name);
    row_samplers.push_back(&it->second);
  }

  std::vector<double> weights;
  for (const auto &mode : modes)
    weights.push_back(static_cast<double>(mode.weight));

  Rng rng(seed);
  std::discrete_distribution<size_t> mode_dist(weights.begin(), weights.end());

  const size_t n_anomalies = std::clamp<size_t>(
      static_cast<size_t>(std::llround(samples * anomaly_fraction)), 1,
      samples - 1);

  TrainingSet set;
  set.labels.assign(samples, 0);
  std::fill(set.labels.begin(), set.labels.begin() + n_anomalies, 1);
  std::shuffle(set.labels.begin(), set.labels.end(), rng);

  set.features.reserve(samples);
  for (size_t i = 0; i < samples; ++i) {
    std::vector<double> values(profile.feature_count(), 0.0);
    for (size_t f = 0; f < values.size(); ++f)
      values[f] = (*row_samplers[f])(rng);

    if (set.labels[i] == 1) {
      FeatureRow row(values, index);
      modes[mode_dist(rng)].apply(row, rng);
    }
    set.features.push_back(std::move(values));
  }

  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Generated " << samples << " " << profile.name() << " samples ("
                   << n_anomalies << " anomalous) with seed " << seed);
  return set;
}

FlightLog SyntheticFlightGenerator::synthesize_flight(AircraftType type,
                                                      size_t rows,
                                                      uint64_t seed) const {
  Rng rng(seed);
  std::vector<double> timestamps(rows);
  for (size_t i = 0; i < rows; ++i)
    timestamps[i] = i * SAMPLE_INTERVAL_S;
  FlightLog log(std::move(timestamps));

  auto series = [&](const Sampler &sampler) {
    std::vector<double> values(rows);
    for (auto &v : values)
      v = sampler(rng);
    return values;
  };

  log.set_column("battery_voltage",
                 series(type == AircraftType::VTOL ? normal(22.0, 0.1)
                                                   : normal(11.1, 0.05)));
  log.set_column("temperature", series(normal(25.0, 2.0)));
  log.set_column("gps_hdop", series(gamma(2.0, 0.5)));

  if (type == AircraftType::FIXED_WING) {
    // Level cruise: altitude noise stays inside the level band
    std::vector<double> altitude(rows);
    for (size_t i = 0; i < rows; ++i)
      altitude[i] = 150.0 + 0.2 * std::sin(i * 0.05) + normal(0.0, 0.05)(rng);
    log.set_column("altitude", std::move(altitude));
    log.set_column("motor_rpm", series(normal(5000.0, 150.0)));
    log.set_column("airspeed", series(normal(25.0, 1.0)));
    log.set_column("ground_speed", series(normal(23.0, 1.5)));
    log.set_column("throttle_position", series(normal(75.0, 5.0)));
    log.set_column("elevator_position", series(normal(0.0, 2.0)));
    log.set_column("rudder_position", series(normal(0.0, 2.0)));
    log.set_column("aileron_position", series(normal(0.0, 3.0)));
    log.set_column("pitch_angle", series(normal(5.0, 1.0)));
    log.set_column("roll_angle", series(normal(0.0, 3.0)));
    log.set_column("yaw_rate", series(normal(0.0, 1.0)));
    log.set_column("wind_speed", series(gamma(2.0, 2.0)));
    log.set_column("angle_of_attack", series(normal(5.0, 1.0)));
    return log;
  }

  for (int m = 1; m <= 4; ++m)
    log.set_column("motor_" + std::to_string(m) + "_rpm",
                   series(normal(3000.0, 100.0)));
  for (const char *axis :
       {"vibration_x", "vibration_y", "vibration_z", "vibration_w"})
    log.set_column(axis, series(normal(0.0, 1.0)));
  log.set_column("pitch_angle", series(normal(0.0, 4.0)));
  log.set_column("roll_angle", series(normal(0.0, 4.0)));

  if (type == AircraftType::MULTIROTOR) {
    // Station keeping with a gentle bob
    std::vector<double> altitude(rows);
    for (size_t i = 0; i < rows; ++i)
      altitude[i] = 50.0 + 1.5 * std::sin(i * 0.3);
    log.set_column("altitude", std::move(altitude));
    log.set_column("speed", series(uniform(0.0, 4.0)));
    return log;
  }

  // VTOL: hover climb, transition to wing-borne flight, then cruise
  const size_t hover_end = rows * 3 / 10;
  const size_t transition_end = hover_end + TRANSITION_ROWS;
  std::vector<double> altitude(rows);
  std::vector<double> airspeed(rows);
  std::vector<double> transition_mode(rows, 0.0);
  double alt = 30.0;
  for (size_t i = 0; i < rows; ++i) {
    if (i < hover_end) {
      alt += 0.3;
      airspeed[i] = std::max(0.0, normal(1.0, 0.3)(rng));
    } else if (i < transition_end) {
      alt += 5.0;
      const double progress =
          static_cast<double>(i - hover_end) / (transition_end - hover_end);
      airspeed[i] = 1.0 + 24.0 * progress;
      transition_mode[i] = 1.0;
    } else {
      airspeed[i] = normal(25.0, 0.5)(rng);
    }
    altitude[i] = alt;
  }
  log.set_column("altitude", std::move(altitude));
  log.set_column("airspeed", std::move(airspeed));
  log.set_column("transition_mode", std::move(transition_mode));
  log.set_column("motor_5_rpm", series(normal(5000.0, 150.0)));
  log.set_column("elevator_position", series(normal(0.0, 2.0)));
  log.set_column("aileron_position", series(normal(0.0, 3.0)));
  return log;
}
