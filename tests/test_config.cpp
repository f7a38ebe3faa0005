#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "flight_config_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string create_test_config_file(const std::string &content) {
    auto config_path = test_dir / "test_config.ini";
    std::ofstream file(config_path);
    file << content;
    file.close();
    return config_path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsAreValid) {
  Config::AppConfig config;
  std::vector<std::string> errors;
  EXPECT_TRUE(Config::validate_app_config(config, errors));
  EXPECT_TRUE(errors.empty());

  EXPECT_DOUBLE_EQ(config.detection.anomaly_threshold, 0.7);
  EXPECT_DOUBLE_EQ(config.detection.critical_threshold, 0.9);
  EXPECT_EQ(config.explainability.sample_size, 100u);
  EXPECT_EQ(config.classifier.tie_break_type, "multirotor");
}

TEST_F(ConfigTest, ParsesAllSections) {
  std::string config_content = R"(
# Flight analysis settings
[FeatureExtraction]
active_rpm_threshold = 750
cruise_window_rows = 12

[Classifier]
tie_break_type = VTOL
min_confident_score = 0.75

[Training]
seed = 7
training_samples = 2500
n_estimators = 80
max_depth = 5
learning_rate = 0.2
train_on_startup = yes

[Detection]
anomaly_threshold = 0.6
critical_threshold = 0.95

[Explainability]
sample_size = 50
top_n = 4

[Metrics]
enabled = false
)";

  std::string config_file = create_test_config_file(config_content);
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(config_file));

  auto config = manager.get_config();
  EXPECT_DOUBLE_EQ(config->feature_extraction.active_rpm_threshold, 750.0);
  EXPECT_EQ(config->feature_extraction.cruise_window_rows, 12u);
  EXPECT_EQ(config->classifier.tie_break_type, "vtol");
  EXPECT_DOUBLE_EQ(config->classifier.min_confident_score, 0.75);
  EXPECT_EQ(config->training.seed, 7u);
  EXPECT_EQ(config->training.training_samples, 2500u);
  EXPECT_EQ(config->training.n_estimators, 80u);
  EXPECT_EQ(config->training.max_depth, 5u);
  EXPECT_DOUBLE_EQ(config->training.learning_rate, 0.2);
  EXPECT_TRUE(config->training.train_on_startup);
  EXPECT_DOUBLE_EQ(config->detection.anomaly_threshold, 0.6);
  EXPECT_DOUBLE_EQ(config->detection.critical_threshold, 0.95);
  EXPECT_EQ(config->explainability.sample_size, 50u);
  EXPECT_EQ(config->explainability.top_n, 4u);
  EXPECT_FALSE(config->metrics.enabled);
}

TEST_F(ConfigTest, UnparseableNumberKeepsDefault) {
  std::string config_content = R"(
[Detection]
anomaly_threshold = not_a_number
)";

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(create_test_config_file(config_content)));
  EXPECT_DOUBLE_EQ(manager.get_config()->detection.anomaly_threshold, 0.7);
}

TEST_F(ConfigTest, InvalidConfigurationKeepsPreviousSettings) {
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(create_test_config_file(R"(
[Detection]
anomaly_threshold = 0.65
)")));
  EXPECT_DOUBLE_EQ(manager.get_config()->detection.anomaly_threshold, 0.65);

  // Critical below the anomaly threshold fails validation
  EXPECT_FALSE(manager.load_configuration(create_test_config_file(R"(
[Detection]
anomaly_threshold = 0.8
critical_threshold = 0.5
)")));
  EXPECT_DOUBLE_EQ(manager.get_config()->detection.anomaly_threshold, 0.65);
  EXPECT_DOUBLE_EQ(manager.get_config()->detection.critical_threshold, 0.9);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
  Config::ConfigManager manager;
  EXPECT_FALSE(
      manager.load_configuration((test_dir / "does_not_exist.ini").string()));
  EXPECT_DOUBLE_EQ(manager.get_config()->detection.anomaly_threshold, 0.7);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
  std::vector<std::string> errors;

  Config::ClassifierConfig classifier;
  classifier.tie_break_type = "helicopter";
  EXPECT_FALSE(Config::validate_classifier_config(classifier, errors));

  Config::TrainingConfig training;
  training.anomaly_fraction = 1.0;
  EXPECT_FALSE(Config::validate_training_config(training, errors));

  Config::DetectionConfig detection;
  detection.medium_risk_threshold = 0.8;
  detection.high_risk_threshold = 0.7;
  EXPECT_FALSE(Config::validate_detection_config(detection, errors));

  Config::ExplainabilityConfig explainability;
  explainability.sample_size = 0;
  EXPECT_FALSE(Config::validate_explainability_config(explainability, errors));

  EXPECT_EQ(errors.size(), 4u);
}

TEST_F(ConfigTest, RequiresSomeWayToTrainModels) {
  Config::AppConfig config;
  config.training.lazy_training_enabled = false;
  config.training.train_on_startup = false;
  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_app_config(config, errors));
  ASSERT_EQ(errors.size(), 1u);
}

TEST(LoggingConfigTest, DefaultsEnableWarningsForEveryComponent) {
  Config::LoggingConfig logging;
  EXPECT_EQ(logging.log_levels.size(), 9u);
  EXPECT_EQ(logging.log_levels.at(LogComponent::CORE), LogLevel::INFO);
  EXPECT_EQ(logging.log_levels.at(LogComponent::CLASSIFIER), LogLevel::WARN);
  EXPECT_EQ(logging.log_levels.at(LogComponent::ML_TRAINING), LogLevel::WARN);

  // An empty [Logging] section keeps the defaults
  Config::AppConfig config;
  EXPECT_EQ(config.logging.log_levels, logging.log_levels);
}

TEST_F(ConfigTest, LoggingLevelsAndWildcards) {
  std::string config_content = R"(
[Logging]
default_level = ERROR
ml.* = DEBUG
classifier = trace
)";

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(create_test_config_file(config_content)));
  const auto &levels = manager.get_config()->logging.log_levels;

  EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
  EXPECT_EQ(levels.at(LogComponent::FEATURES), LogLevel::ERROR);
  EXPECT_EQ(levels.at(LogComponent::ML_TRAINING), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::ML_INFERENCE), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::ML_REGISTRY), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::CLASSIFIER), LogLevel::TRACE);
}

TEST_F(ConfigTest, TopLevelKeysBecomeCustomSettings) {
  std::string config_content = R"(
site_name = test_range
malformed line without equals
[Detection]
)";

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(create_test_config_file(config_content)));
  const auto &custom = manager.get_config()->custom_settings;
  ASSERT_EQ(custom.count("site_name"), 1u);
  EXPECT_EQ(custom.at("site_name"), "test_range");
}

TEST(ConfigHelpersTest, StringConversions) {
  EXPECT_TRUE(Config::string_to_bool(" On "));
  EXPECT_TRUE(Config::string_to_bool("1"));
  EXPECT_FALSE(Config::string_to_bool("off"));
  EXPECT_EQ(Config::string_to_log_level("warn"), LogLevel::WARN);
  EXPECT_EQ(Config::string_to_log_level("bogus"), LogLevel::INFO);
}
