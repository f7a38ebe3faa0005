#include "features/feature_extractor.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

constexpr double SURFACE_EPSILON = 1e-6;

bool is_motor_column(const std::string &name) {
  return Utils::contains_substring(name, "motor") &&
         Utils::contains_substring(name, "rpm");
}

bool is_control_surface_column(const std::string &name) {
  return Utils::contains_substring(name, "elevator") ||
         Utils::contains_substring(name, "aileron") ||
         Utils::contains_substring(name, "rudder");
}

// A plain "speed" column wins, then ground speed, then airspeed
std::vector<double> speed_column(const FlightLog &log) {
  for (const char *candidate : {"speed", "ground_speed", "airspeed"}) {
    if (log.has_column(candidate))
      return log.column_or_zero(candidate);
  }
  return std::vector<double>(log.row_count(), 0.0);
}

int rate_sign(double rate, double level_band) {
  if (std::abs(rate) <= level_band)
    return 0;
  return rate > 0.0 ? 1 : -1;
}

} // namespace

FeatureExtractor::FeatureExtractor(
    const Config::FeatureExtractionConfig &config)
    : config_(config) {}

FeatureExtraction
FeatureExtractor::extract(const FlightLog &log,
                          const ProfileCatalog &catalog) const {
  FeatureExtraction extraction;
  extraction.summary = summarize(log);
  for (const auto &profile : catalog.profiles())
    extraction.matrices.emplace(profile.type(), build_matrix(log, profile));
  return extraction;
}

SummaryStats FeatureExtractor::summarize(const FlightLog &log) const {
  SummaryStats stats;
  stats.row_count = log.row_count();
  if (stats.row_count == 0) {
    LOG(LogLevel::DEBUG, LogComponent::FEATURES,
        "Empty flight log, returning zeroed summary statistics.");
    return stats;
  }

  for (const auto &name : log.column_names()) {
    const auto values = log.column_or_zero(name);
    if (std::any_of(values.begin(), values.end(),
                    [](double v) { return v != 0.0; })) {
      stats.has_signal = true;
    }
    if (!stats.has_control_surfaces && is_control_surface_column(name) &&
        std::any_of(values.begin(), values.end(), [](double v) {
          return std::abs(v) > SURFACE_EPSILON;
        })) {
      stats.has_control_surfaces = true;
    }
  }

  compute_motor_stats(log, stats);
  compute_motion_stats(log.column_or_zero("altitude"), speed_column(log),
                       stats);

  LOG(LogLevel::DEBUG, LogComponent::FEATURES,
      "Summary: rows=" << stats.row_count
                       << " active_motors=" << stats.active_motor_count
                       << " symmetry=" << stats.motor_symmetry
                       << " hover=" << stats.hover_ratio
                       << " cruise=" << stats.cruise_ratio
                       << " avg_speed=" << stats.average_speed
                       << " vertical=" << stats.vertical_transition_ratio
                       << " transitions=" << stats.transition_events);
  return stats;
}

void FeatureExtractor::compute_motor_stats(const FlightLog &log,
                                           SummaryStats &stats) const {
  std::vector<double> active_means;
  for (const auto &name : log.column_names()) {
    if (!is_motor_column(name))
      continue;
    ++stats.motor_channel_count;

    const auto values = log.column_or_zero(name);
    const double peak = *std::max_element(values.begin(), values.end());
    if (peak > config_.active_rpm_threshold) {
      ++stats.active_motor_count;
      active_means.push_back(Utils::mean(values));
    }
  }

  if (active_means.size() < 2)
    return;

  const double mu = Utils::mean(active_means);
  if (mu <= 0.0)
    return;
  const double sigma = Utils::population_stddev(active_means);
  stats.motor_symmetry = std::max(0.0, 1.0 - sigma / mu);
}

void FeatureExtractor::compute_motion_stats(const std::vector<double> &altitude,
                                            const std::vector<double> &speed,
                                            SummaryStats &stats) const {
  const size_t n = altitude.size();

  stats.average_speed = Utils::mean(speed);
  stats.max_speed = *std::max_element(speed.begin(), speed.end());

  size_t hover_rows = 0;
  for (size_t i = 1; i < n; ++i) {
    if (speed[i] < config_.hover_max_speed_mps &&
        std::abs(altitude[i] - altitude[i - 1]) <
            config_.hover_max_altitude_step_m) {
      ++hover_rows;
    }
  }
  stats.hover_ratio = static_cast<double>(hover_rows) / n;

  // Only rows with a full trailing window can count as cruise
  const size_t window = std::max<size_t>(config_.cruise_window_rows, 1);
  size_t cruise_rows = 0;
  for (size_t i = window - 1; i < n; ++i) {
    if (speed[i] <= config_.cruise_min_speed_mps)
      continue;
    std::vector<double> trailing(altitude.begin() + (i + 1 - window),
                                 altitude.begin() + (i + 1));
    if (Utils::sample_stddev(trailing) <
        config_.cruise_max_altitude_stddev_m) {
      ++cruise_rows;
    }
  }
  stats.cruise_ratio = static_cast<double>(cruise_rows) / n;

  stats.vertical_transition_ratio = vertical_transition_ratio(altitude);

  const size_t lookahead = config_.transition_lookahead_rows;
  for (size_t i = config_.transition_warmup_rows; i + lookahead < n; ++i) {
    if (std::abs(altitude[i + lookahead] - altitude[i]) >
            config_.transition_min_altitude_change_m &&
        std::abs(speed[i + lookahead] - speed[i]) >
            config_.transition_min_speed_change_mps) {
      ++stats.transition_events;
    }
  }
}

double FeatureExtractor::vertical_transition_ratio(
    const std::vector<double> &altitude) const {
  if (altitude.size() < 3)
    return 0.0;

  const size_t rate_pairs = altitude.size() - 2;
  size_t sign_changes = 0;
  int previous_sign = 0;
  for (size_t i = 1; i < altitude.size(); ++i) {
    const int sign =
        rate_sign(altitude[i] - altitude[i - 1], config_.level_altitude_band_m);
    if (sign == 0)
      continue;
    if (previous_sign != 0 && sign != previous_sign)
      ++sign_changes;
    previous_sign = sign;
  }
  return static_cast<double>(sign_changes) / rate_pairs;
}

FeatureMatrix
FeatureExtractor::build_matrix(const FlightLog &log,
                               const AircraftProfile &profile) const {
  const size_t rows = log.row_count();
  const size_t cols = profile.feature_count();
  FeatureMatrix matrix(rows, std::vector<double>(cols, 0.0));

  size_t missing = 0;
  for (size_t c = 0; c < cols; ++c) {
    const auto &feature = profile.feature_names()[c];
    if (!log.has_column(feature)) {
      ++missing;
      continue;
    }
    const auto values = log.column_or_zero(feature);
    for (size_t r = 0; r < rows; ++r)
      matrix[r][c] = values[r];
  }

  if (missing > 0) {
    LOG(LogLevel::DEBUG, LogComponent::FEATURES,
        missing << " of " << cols << " " << profile.name()
                << " features absent from log; zero-filled.");
  }
  return matrix;
}
