#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// FeatureExtraction Settings
constexpr const char *FE_ACTIVE_RPM_THRESHOLD = "active_rpm_threshold";
constexpr const char *FE_HOVER_MAX_SPEED_MPS = "hover_max_speed_mps";
constexpr const char *FE_HOVER_MAX_ALTITUDE_STEP_M =
    "hover_max_altitude_step_m";
constexpr const char *FE_CRUISE_MIN_SPEED_MPS = "cruise_min_speed_mps";
constexpr const char *FE_CRUISE_MAX_ALTITUDE_STDDEV_M =
    "cruise_max_altitude_stddev_m";
constexpr const char *FE_CRUISE_WINDOW_ROWS = "cruise_window_rows";
constexpr const char *FE_LEVEL_ALTITUDE_BAND_M = "level_altitude_band_m";
constexpr const char *FE_TRANSITION_WARMUP_ROWS = "transition_warmup_rows";
constexpr const char *FE_TRANSITION_LOOKAHEAD_ROWS =
    "transition_lookahead_rows";
constexpr const char *FE_TRANSITION_MIN_ALTITUDE_CHANGE_M =
    "transition_min_altitude_change_m";
constexpr const char *FE_TRANSITION_MIN_SPEED_CHANGE_MPS =
    "transition_min_speed_change_mps";

// Classifier Settings
constexpr const char *CL_TIE_BREAK_TYPE = "tie_break_type";
constexpr const char *CL_MIN_CONFIDENT_SCORE = "min_confident_score";
constexpr const char *CL_FW_CRUISE_RATIO = "fixed_wing_min_cruise_ratio";
constexpr const char *CL_FAST_SPEED_MPS = "fast_speed_mps";
constexpr const char *CL_FW_MAX_VERTICAL_RATIO =
    "fixed_wing_max_vertical_transition_ratio";
constexpr const char *CL_MR_HOVER_RATIO = "multirotor_min_hover_ratio";
constexpr const char *CL_MR_MIN_VERTICAL_RATIO =
    "multirotor_min_vertical_transition_ratio";
constexpr const char *CL_MR_MIN_SYMMETRY = "multirotor_min_motor_symmetry";
constexpr const char *CL_VTOL_HOVER_RATIO = "vtol_min_hover_ratio";
constexpr const char *CL_VTOL_CRUISE_RATIO = "vtol_min_cruise_ratio";

// Training Settings
constexpr const char *TR_LAZY_TRAINING_ENABLED = "lazy_training_enabled";
constexpr const char *TR_TRAIN_ON_STARTUP = "train_on_startup";
constexpr const char *TR_SEED = "seed";
constexpr const char *TR_TRAINING_SAMPLES = "training_samples";
constexpr const char *TR_ANOMALY_FRACTION = "anomaly_fraction";
constexpr const char *TR_N_ESTIMATORS = "n_estimators";
constexpr const char *TR_MAX_DEPTH = "max_depth";
constexpr const char *TR_LEARNING_RATE = "learning_rate";
constexpr const char *TR_MIN_SAMPLES_LEAF = "min_samples_leaf";
constexpr const char *TR_MAX_BINS = "max_bins";
constexpr const char *TR_FALLBACK_PROBABILITY = "fallback_probability";

// Detection Settings
constexpr const char *DE_ANOMALY_THRESHOLD = "anomaly_threshold";
constexpr const char *DE_CRITICAL_THRESHOLD = "critical_threshold";
constexpr const char *DE_MEDIUM_RISK_THRESHOLD = "medium_risk_threshold";
constexpr const char *DE_HIGH_RISK_THRESHOLD = "high_risk_threshold";
constexpr const char *DE_MAX_DESCRIBED_FEATURES = "max_described_features";

// Explainability Settings
constexpr const char *EX_SAMPLE_SIZE = "sample_size";
constexpr const char *EX_TOP_N = "top_n";
constexpr const char *EX_SUMMARY_FEATURES = "summary_features";
constexpr const char *EX_SIGNIFICANT_IMPORTANCE = "significant_importance";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Metrics Settings
constexpr const char *METRICS_ENABLED = "enabled";
} // namespace Keys

struct LoggingConfig {
  // Every component at WARN except core, which logs INFO
  LoggingConfig();
  std::map<LogComponent, LogLevel> log_levels;
};

struct FeatureExtractionConfig {
  double active_rpm_threshold = 500.0;
  double hover_max_speed_mps = 2.0;
  double hover_max_altitude_step_m = 2.0;
  double cruise_min_speed_mps = 10.0;
  double cruise_max_altitude_stddev_m = 5.0;
  size_t cruise_window_rows = 10;
  // Altitude steps at or below this are treated as level flight
  double level_altitude_band_m = 2.0;
  size_t transition_warmup_rows = 10;
  size_t transition_lookahead_rows = 5;
  double transition_min_altitude_change_m = 20.0;
  double transition_min_speed_change_mps = 5.0;
};

struct ClassifierConfig {
  std::string tie_break_type = "multirotor";
  double min_confident_score = 0.8;

  double fixed_wing_min_cruise_ratio = 0.6;
  double fast_speed_mps = 15.0;
  double fixed_wing_max_vertical_transition_ratio = 0.2;

  double multirotor_min_hover_ratio = 0.3;
  double multirotor_min_vertical_transition_ratio = 0.4;
  double multirotor_min_motor_symmetry = 0.7;

  double vtol_min_hover_ratio = 0.2;
  double vtol_min_cruise_ratio = 0.3;
};

struct TrainingConfig {
  bool lazy_training_enabled = true;
  bool train_on_startup = false;
  uint64_t seed = 42;
  size_t training_samples = 4000;
  double anomaly_fraction = 0.2;
  size_t n_estimators = 100;
  size_t max_depth = 4;
  double learning_rate = 0.1;
  size_t min_samples_leaf = 5;
  size_t max_bins = 64;
  double fallback_probability = 0.0;
};

struct DetectionConfig {
  double anomaly_threshold = 0.7;
  double critical_threshold = 0.9;
  double medium_risk_threshold = 0.3;
  double high_risk_threshold = 0.7;
  size_t max_described_features = 3;
};

struct ExplainabilityConfig {
  size_t sample_size = 100;
  size_t top_n = 5;
  size_t summary_features = 3;
  double significant_importance = 0.1;
};

struct MetricsConfig {
  bool enabled = true;
};

struct AppConfig {
  FeatureExtractionConfig feature_extraction;
  ClassifierConfig classifier;
  TrainingConfig training;
  DetectionConfig detection;
  ExplainabilityConfig explainability;
  LoggingConfig logging;
  MetricsConfig metrics;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str);
bool string_to_bool(const std::string &val_str);

// Validation functions for configuration parameters
bool validate_feature_extraction_config(const FeatureExtractionConfig &config,
                                        std::vector<std::string> &errors);
bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors);
bool validate_training_config(const TrainingConfig &config,
                              std::vector<std::string> &errors);
bool validate_detection_config(const DetectionConfig &config,
                               std::vector<std::string> &errors);
bool validate_explainability_config(const ExplainabilityConfig &config,
                                    std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
