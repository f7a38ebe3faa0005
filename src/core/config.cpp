#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"features", LogComponent::FEATURES},
    {"classifier", LogComponent::CLASSIFIER},
    {"explain", LogComponent::EXPLAIN},
    {"aggregate", LogComponent::AGGREGATE},
    {"ml.training", LogComponent::ML_TRAINING},
    {"ml.inference", LogComponent::ML_INFERENCE},
    {"ml.registry", LogComponent::ML_REGISTRY}};

LoggingConfig::LoggingConfig()
    : log_levels{{LogComponent::CORE, LogLevel::INFO},
                 {LogComponent::CONFIG, LogLevel::WARN},
                 {LogComponent::FEATURES, LogLevel::WARN},
                 {LogComponent::CLASSIFIER, LogLevel::WARN},
                 {LogComponent::EXPLAIN, LogLevel::WARN},
                 {LogComponent::AGGREGATE, LogLevel::WARN},
                 {LogComponent::ML_TRAINING, LogLevel::WARN},
                 {LogComponent::ML_INFERENCE, LogLevel::WARN},
                 {LogComponent::ML_REGISTRY, LogLevel::WARN}} {}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

namespace {

bool in_unit_interval(double value) { return value >= 0.0 && value <= 1.0; }

} // namespace

bool validate_feature_extraction_config(const FeatureExtractionConfig &config,
                                        std::vector<std::string> &errors) {
  bool valid = true;

  if (config.active_rpm_threshold <= 0.0) {
    errors.push_back("Feature extraction active RPM threshold must be positive");
    valid = false;
  }

  if (config.hover_max_speed_mps <= 0.0 ||
      config.hover_max_altitude_step_m <= 0.0) {
    errors.push_back(
        "Feature extraction hover speed and altitude step must be positive");
    valid = false;
  }

  if (config.cruise_min_speed_mps <= config.hover_max_speed_mps) {
    errors.push_back("Feature extraction cruise speed must exceed the hover "
                     "speed ceiling");
    valid = false;
  }

  if (config.cruise_window_rows < 2 || config.cruise_window_rows > 1000) {
    errors.push_back(
        "Feature extraction cruise window must be between 2 and 1000 rows");
    valid = false;
  }

  if (config.level_altitude_band_m < 0.0) {
    errors.push_back(
        "Feature extraction level altitude band cannot be negative");
    valid = false;
  }

  if (config.transition_lookahead_rows < 1) {
    errors.push_back(
        "Feature extraction transition lookahead must be at least 1 row");
    valid = false;
  }

  return valid;
}

bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  const std::string tie_break = Utils::to_lower_copy(config.tie_break_type);
  if (tie_break != "fixed_wing" && tie_break != "multirotor" &&
      tie_break != "vtol") {
    errors.push_back("Classifier tie break type must be one of fixed_wing, "
                     "multirotor or vtol");
    valid = false;
  }

  if (!in_unit_interval(config.min_confident_score)) {
    errors.push_back("Classifier minimum confident score must be between 0.0 "
                     "and 1.0");
    valid = false;
  }

  const double ratios[] = {config.fixed_wing_min_cruise_ratio,
                           config.fixed_wing_max_vertical_transition_ratio,
                           config.multirotor_min_hover_ratio,
                           config.multirotor_min_vertical_transition_ratio,
                           config.multirotor_min_motor_symmetry,
                           config.vtol_min_hover_ratio,
                           config.vtol_min_cruise_ratio};
  for (double ratio : ratios) {
    if (!in_unit_interval(ratio)) {
      errors.push_back("Classifier rule ratios must be between 0.0 and 1.0");
      valid = false;
      break;
    }
  }

  if (config.fast_speed_mps <= 0.0) {
    errors.push_back("Classifier fast speed threshold must be positive");
    valid = false;
  }

  return valid;
}

bool validate_training_config(const TrainingConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.training_samples < 100 || config.training_samples > 1000000) {
    errors.push_back(
        "Training sample count must be between 100 and 1000000");
    valid = false;
  }

  if (config.anomaly_fraction <= 0.0 || config.anomaly_fraction >= 1.0) {
    errors.push_back("Training anomaly fraction must be in (0.0, 1.0)");
    valid = false;
  }

  if (config.n_estimators < 1 || config.n_estimators > 5000) {
    errors.push_back("Training estimator count must be between 1 and 5000");
    valid = false;
  }

  if (config.max_depth < 1 || config.max_depth > 12) {
    errors.push_back("Training max depth must be between 1 and 12");
    valid = false;
  }

  if (config.learning_rate <= 0.0 || config.learning_rate > 1.0) {
    errors.push_back("Training learning rate must be in (0.0, 1.0]");
    valid = false;
  }

  if (config.min_samples_leaf < 1) {
    errors.push_back("Training min samples per leaf must be at least 1");
    valid = false;
  }

  if (config.max_bins < 2 || config.max_bins > 1024) {
    errors.push_back("Training histogram bins must be between 2 and 1024");
    valid = false;
  }

  if (!in_unit_interval(config.fallback_probability)) {
    errors.push_back(
        "Training fallback probability must be between 0.0 and 1.0");
    valid = false;
  }

  return valid;
}

bool validate_detection_config(const DetectionConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (!in_unit_interval(config.anomaly_threshold) ||
      !in_unit_interval(config.critical_threshold)) {
    errors.push_back(
        "Detection anomaly and critical thresholds must be between 0.0 and 1.0");
    valid = false;
  }

  if (config.critical_threshold < config.anomaly_threshold) {
    errors.push_back("Detection critical threshold cannot be below the "
                     "anomaly threshold");
    valid = false;
  }

  if (!in_unit_interval(config.medium_risk_threshold) ||
      !in_unit_interval(config.high_risk_threshold) ||
      config.medium_risk_threshold >= config.high_risk_threshold) {
    errors.push_back("Detection risk level thresholds must satisfy 0 <= "
                     "medium < high <= 1");
    valid = false;
  }

  return valid;
}

bool validate_explainability_config(const ExplainabilityConfig &config,
                                    std::vector<std::string> &errors) {
  bool valid = true;

  if (config.sample_size < 1 || config.sample_size > 100000) {
    errors.push_back(
        "Explainability sample size must be between 1 and 100000 rows");
    valid = false;
  }

  if (config.top_n < 1) {
    errors.push_back("Explainability top N must be at least 1");
    valid = false;
  }

  if (config.summary_features > config.top_n) {
    errors.push_back(
        "Explainability summary features cannot exceed top N");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_feature_extraction_config(config.feature_extraction, errors))
    valid = false;

  if (!validate_classifier_config(config.classifier, errors))
    valid = false;

  if (!validate_training_config(config.training, errors))
    valid = false;

  if (!validate_detection_config(config.detection, errors))
    valid = false;

  if (!validate_explainability_config(config.explainability, errors))
    valid = false;

  // Cross-component validation
  if (!config.training.lazy_training_enabled &&
      !config.training.train_on_startup) {
    errors.push_back("Either lazy training or training on startup must be "
                     "enabled, otherwise no model can ever become available");
    valid = false;
  }

  return valid;
}

namespace {

template <typename T>
void assign_number(const std::string &value, T &target) {
  target = Utils::string_to_number<T>(value).value_or(target);
}

} // namespace

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      if (current_section.empty()) {
        config.custom_settings[key] = value;

      } else if (current_section == "FeatureExtraction") {
        auto &fe = config.feature_extraction;
        if (key == Keys::FE_ACTIVE_RPM_THRESHOLD)
          assign_number(value, fe.active_rpm_threshold);
        else if (key == Keys::FE_HOVER_MAX_SPEED_MPS)
          assign_number(value, fe.hover_max_speed_mps);
        else if (key == Keys::FE_HOVER_MAX_ALTITUDE_STEP_M)
          assign_number(value, fe.hover_max_altitude_step_m);
        else if (key == Keys::FE_CRUISE_MIN_SPEED_MPS)
          assign_number(value, fe.cruise_min_speed_mps);
        else if (key == Keys::FE_CRUISE_MAX_ALTITUDE_STDDEV_M)
          assign_number(value, fe.cruise_max_altitude_stddev_m);
        else if (key == Keys::FE_CRUISE_WINDOW_ROWS)
          assign_number(value, fe.cruise_window_rows);
        else if (key == Keys::FE_LEVEL_ALTITUDE_BAND_M)
          assign_number(value, fe.level_altitude_band_m);
        else if (key == Keys::FE_TRANSITION_WARMUP_ROWS)
          assign_number(value, fe.transition_warmup_rows);
        else if (key == Keys::FE_TRANSITION_LOOKAHEAD_ROWS)
          assign_number(value, fe.transition_lookahead_rows);
        else if (key == Keys::FE_TRANSITION_MIN_ALTITUDE_CHANGE_M)
          assign_number(value, fe.transition_min_altitude_change_m);
        else if (key == Keys::FE_TRANSITION_MIN_SPEED_CHANGE_MPS)
          assign_number(value, fe.transition_min_speed_change_mps);

      } else if (current_section == "Classifier") {
        auto &cl = config.classifier;
        if (key == Keys::CL_TIE_BREAK_TYPE)
          cl.tie_break_type = Utils::to_lower_copy(value);
        else if (key == Keys::CL_MIN_CONFIDENT_SCORE)
          assign_number(value, cl.min_confident_score);
        else if (key == Keys::CL_FW_CRUISE_RATIO)
          assign_number(value, cl.fixed_wing_min_cruise_ratio);
        else if (key == Keys::CL_FAST_SPEED_MPS)
          assign_number(value, cl.fast_speed_mps);
        else if (key == Keys::CL_FW_MAX_VERTICAL_RATIO)
          assign_number(value, cl.fixed_wing_max_vertical_transition_ratio);
        else if (key == Keys::CL_MR_HOVER_RATIO)
          assign_number(value, cl.multirotor_min_hover_ratio);
        else if (key == Keys::CL_MR_MIN_VERTICAL_RATIO)
          assign_number(value, cl.multirotor_min_vertical_transition_ratio);
        else if (key == Keys::CL_MR_MIN_SYMMETRY)
          assign_number(value, cl.multirotor_min_motor_symmetry);
        else if (key == Keys::CL_VTOL_HOVER_RATIO)
          assign_number(value, cl.vtol_min_hover_ratio);
        else if (key == Keys::CL_VTOL_CRUISE_RATIO)
          assign_number(value, cl.vtol_min_cruise_ratio);

      } else if (current_section == "Training") {
        auto &tr = config.training;
        if (key == Keys::TR_LAZY_TRAINING_ENABLED)
          tr.lazy_training_enabled = string_to_bool(value);
        else if (key == Keys::TR_TRAIN_ON_STARTUP)
          tr.train_on_startup = string_to_bool(value);
        else if (key == Keys::TR_SEED)
          assign_number(value, tr.seed);
        else if (key == Keys::TR_TRAINING_SAMPLES)
          assign_number(value, tr.training_samples);
        else if (key == Keys::TR_ANOMALY_FRACTION)
          assign_number(value, tr.anomaly_fraction);
        else if (key == Keys::TR_N_ESTIMATORS)
          assign_number(value, tr.n_estimators);
        else if (key == Keys::TR_MAX_DEPTH)
          assign_number(value, tr.max_depth);
        else if (key == Keys::TR_LEARNING_RATE)
          assign_number(value, tr.learning_rate);
        else if (key == Keys::TR_MIN_SAMPLES_LEAF)
          assign_number(value, tr.min_samples_leaf);
        else if (key == Keys::TR_MAX_BINS)
          assign_number(value, tr.max_bins);
        else if (key == Keys::TR_FALLBACK_PROBABILITY)
          assign_number(value, tr.fallback_probability);

      } else if (current_section == "Detection") {
        auto &de = config.detection;
        if (key == Keys::DE_ANOMALY_THRESHOLD)
          assign_number(value, de.anomaly_threshold);
        else if (key == Keys::DE_CRITICAL_THRESHOLD)
          assign_number(value, de.critical_threshold);
        else if (key == Keys::DE_MEDIUM_RISK_THRESHOLD)
          assign_number(value, de.medium_risk_threshold);
        else if (key == Keys::DE_HIGH_RISK_THRESHOLD)
          assign_number(value, de.high_risk_threshold);
        else if (key == Keys::DE_MAX_DESCRIBED_FEATURES)
          assign_number(value, de.max_described_features);

      } else if (current_section == "Explainability") {
        auto &ex = config.explainability;
        if (key == Keys::EX_SAMPLE_SIZE)
          assign_number(value, ex.sample_size);
        else if (key == Keys::EX_TOP_N)
          assign_number(value, ex.top_n);
        else if (key == Keys::EX_SUMMARY_FEATURES)
          assign_number(value, ex.summary_features);
        else if (key == Keys::EX_SIGNIFICANT_IMPORTANCE)
          assign_number(value, ex.significant_importance);

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "ml.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }

      } else if (current_section == "Metrics") {
        if (key == Keys::METRICS_ENABLED)
          config.metrics.enabled = string_to_bool(value);
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
