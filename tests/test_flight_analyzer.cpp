#include "analysis/flight_analyzer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "models/fallback_model.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <prometheus/metric_family.h>
#include <stdexcept>
#include <thread>

namespace {

constexpr size_t MOTOR_4_COLUMN = 5;

class ThrowingGenerator : public ITrainingDataGenerator {
public:
  TrainingSet generate_training_set(const AircraftProfile &, size_t, double,
                                    uint64_t) const override {
    throw std::runtime_error("no telemetry archive");
  }
};

double counter_value(MetricsRegistry &registry, const std::string &name) {
  for (const auto &family : registry.get_registry()->Collect()) {
    if (family.name == name && !family.metric.empty())
      return family.metric.front().counter.value;
  }
  return -1.0;
}

// Everything except timing metadata
void expect_same_result(const AnalysisResult &a, const AnalysisResult &b) {
  EXPECT_EQ(a.aircraft_type, b.aircraft_type);
  EXPECT_DOUBLE_EQ(a.aircraft_confidence, b.aircraft_confidence);
  EXPECT_EQ(a.type_distribution, b.type_distribution);
  EXPECT_DOUBLE_EQ(a.risk_score, b.risk_score);
  EXPECT_EQ(a.risk_level, b.risk_level);
  ASSERT_EQ(a.anomalies.size(), b.anomalies.size());
  for (size_t i = 0; i < a.anomalies.size(); ++i) {
    EXPECT_EQ(a.anomalies[i].row_index, b.anomalies[i].row_index);
    EXPECT_DOUBLE_EQ(a.anomalies[i].probability, b.anomalies[i].probability);
    EXPECT_EQ(a.anomalies[i].description, b.anomalies[i].description);
  }
  EXPECT_EQ(a.explanation.summary, b.explanation.summary);
  EXPECT_EQ(a.explanation.ranking.size(), b.explanation.ranking.size());
  EXPECT_EQ(a.flight_phases.durations_s, b.flight_phases.durations_s);
  EXPECT_EQ(a.performance.values, b.performance.values);
  EXPECT_EQ(a.model_degraded, b.model_degraded);
}

} // namespace

class FlightAnalyzerTest : public ::testing::Test {
protected:
  FlightAnalyzerTest() {
    config.metrics.enabled = false;
    config.training.lazy_training_enabled = false;
    config.training.train_on_startup = false;
  }

  std::shared_ptr<ModelRegistry> stubbed_registry(bool degraded = false) {
    auto registry = std::make_shared<ModelRegistry>(
        ProfileCatalog(config.classifier), config.training);
    const auto &profile = registry->catalog().profile(AircraftType::MULTIROTOR);
    registry->install(
        AircraftType::MULTIROTOR,
        TestModels::wrap(AircraftType::MULTIROTOR, profile.feature_names(),
                         std::make_shared<TestModels::ThresholdStubModel>(
                             MOTOR_4_COLUMN, 500.0, 0.95, 0.05),
                         degraded));
    return registry;
  }

  Config::AppConfig config;
};

TEST_F(FlightAnalyzerTest, RejectsStructurallyInvalidLogs) {
  FlightAnalyzer analyzer(config, stubbed_registry());
  EXPECT_THROW(analyzer.analyze(FlightLog()), InvalidInput);

  FlightLog ragged(TestData::timestamps(10));
  ragged.set_column("altitude", TestData::constant(9, 5.0));
  EXPECT_THROW(analyzer.analyze(ragged), InvalidInput);

  FlightLog backwards({0.0, 0.2, 0.1});
  backwards.set_column("altitude", {1.0, 2.0, 3.0});
  EXPECT_THROW(analyzer.analyze(backwards), InvalidInput);
}

TEST_F(FlightAnalyzerTest, AllZeroLogSkipsDetection) {
  // No model is installed for any type; detection must not be attempted
  auto registry = std::make_shared<ModelRegistry>(
      ProfileCatalog(config.classifier), config.training);
  FlightAnalyzer analyzer(config, registry);

  auto result = analyzer.analyze(TestData::all_zero_log());
  EXPECT_TRUE(result.classification_undetected);
  EXPECT_TRUE(result.detection_skipped);
  EXPECT_DOUBLE_EQ(result.aircraft_confidence, 0.0);
  EXPECT_DOUBLE_EQ(result.risk_score, 0.0);
  EXPECT_EQ(result.risk_level, RiskLevel::LOW);
  EXPECT_TRUE(result.anomalies.empty());
  EXPECT_EQ(result.explanation.status, ExplanationStatus::DEGENERATE);
  EXPECT_EQ(result.explanation.summary, "No significant features found");
  EXPECT_EQ(result.row_count, 50u);
  EXPECT_EQ(registry->find_model(AircraftType::MULTIROTOR), nullptr);
}

TEST_F(FlightAnalyzerTest, MotorDropoutWithStubModel) {
  FlightAnalyzer analyzer(config, stubbed_registry());
  auto result =
      analyzer.analyze(TestData::multirotor_with_motor_dropout(200, 80, 120));

  EXPECT_EQ(result.aircraft_type, AircraftType::MULTIROTOR);
  EXPECT_DOUBLE_EQ(result.aircraft_confidence, 0.8);
  EXPECT_FALSE(result.detection_skipped);
  EXPECT_FALSE(result.model_degraded);
  ASSERT_EQ(result.anomalies.size(), 40u);
  EXPECT_EQ(result.anomalies.front().row_index, 80u);
  EXPECT_EQ(result.anomalies.front().severity, Severity::CRITICAL);
  EXPECT_NE(result.anomalies.front().description.find(
                "Insufficient motors operational (3 of 4)"),
            std::string::npos);
  // (40 * 0.95 + 160 * 0.05) / 200
  EXPECT_NEAR(result.risk_score, 0.23, 1e-12);
  EXPECT_EQ(result.risk_level, RiskLevel::LOW);
  EXPECT_EQ(result.row_count, 200u);
  EXPECT_FALSE(result.analyzed_at.empty());
  EXPECT_GE(result.processing_time_ms, 0.0);
  EXPECT_EQ(result.flight_phases.durations_s.count("hover"), 1u);
}

TEST_F(FlightAnalyzerTest, ResultInvariants) {
  FlightAnalyzer analyzer(config, stubbed_registry());
  auto result =
      analyzer.analyze(TestData::multirotor_with_motor_dropout(150, 10, 70));

  EXPECT_GE(result.risk_score, 0.0);
  EXPECT_LE(result.risk_score, 1.0);
  EXPECT_GE(result.aircraft_confidence, 0.0);
  EXPECT_LE(result.aircraft_confidence, 1.0);
  for (const auto &entry : result.type_distribution) {
    EXPECT_GE(entry.second, 0.0);
    EXPECT_LE(entry.second, 1.0);
  }
  EXPECT_TRUE(std::is_sorted(result.anomalies.begin(), result.anomalies.end(),
                             [](const AnomalyRecord &a, const AnomalyRecord &b) {
                               return a.row_index < b.row_index;
                             }));
  for (const auto &anomaly : result.anomalies) {
    EXPECT_GE(anomaly.probability, config.detection.anomaly_threshold);
    EXPECT_LT(anomaly.row_index, result.row_count);
  }
}

TEST_F(FlightAnalyzerTest, RepeatedAnalysisIsIdempotent) {
  FlightAnalyzer analyzer(config, stubbed_registry());
  auto log = TestData::multirotor_with_motor_dropout(120, 30, 50);
  expect_same_result(analyzer.analyze(log), analyzer.analyze(log));
}

TEST_F(FlightAnalyzerTest, ConcurrentAnalysesAgree) {
  FlightAnalyzer analyzer(config, stubbed_registry());
  auto log = TestData::multirotor_with_motor_dropout(120, 30, 50);
  const auto reference = analyzer.analyze(log);

  std::vector<AnalysisResult> results(4);
  std::vector<std::thread> threads;
  for (size_t t = 0; t < results.size(); ++t)
    threads.emplace_back([&, t] { results[t] = analyzer.analyze(log); });
  for (auto &thread : threads)
    thread.join();

  for (const auto &result : results)
    expect_same_result(reference, result);
}

TEST_F(FlightAnalyzerTest, PropagatesDegradedModel) {
  FlightAnalyzer analyzer(config, stubbed_registry(true));
  auto result =
      analyzer.analyze(TestData::multirotor_with_motor_dropout(100, 10, 20));
  EXPECT_TRUE(result.model_degraded);
}

TEST_F(FlightAnalyzerTest, MissingModelIsUnavailable) {
  auto registry = std::make_shared<ModelRegistry>(
      ProfileCatalog(config.classifier), config.training);
  FlightAnalyzer analyzer(config, registry);
  EXPECT_THROW(analyzer.analyze(TestData::fixed_wing_scenario()),
               ModelUnavailable);
}

TEST_F(FlightAnalyzerTest, LazyTrainingFailureThenDegradedResult) {
  config.training.lazy_training_enabled = true;
  auto registry = std::make_shared<ModelRegistry>(
      ProfileCatalog(config.classifier), config.training,
      std::make_shared<ThrowingGenerator>());
  FlightAnalyzer analyzer(config, registry);
  auto log = TestData::multirotor_scenario();

  EXPECT_THROW(analyzer.analyze(log), TrainingFailure);

  auto result = analyzer.analyze(log);
  EXPECT_TRUE(result.model_degraded);
  EXPECT_TRUE(result.anomalies.empty());
  EXPECT_EQ(result.explanation.status, ExplanationStatus::DEGENERATE);
}

TEST_F(FlightAnalyzerTest, RecordsMetricsWhenEnabled) {
  config.metrics.enabled = true;
  FlightAnalyzer analyzer(config, stubbed_registry());
  ASSERT_NE(analyzer.metrics_registry(), nullptr);

  analyzer.analyze(TestData::multirotor_with_motor_dropout(100, 10, 20));
  EXPECT_THROW(analyzer.analyze(FlightLog()), InvalidInput);

  auto &metrics = *analyzer.metrics_registry();
  EXPECT_DOUBLE_EQ(counter_value(metrics, "flight_analyses_total"), 1.0);
  EXPECT_DOUBLE_EQ(counter_value(metrics, "flight_anomalies_total"), 10.0);
  EXPECT_DOUBLE_EQ(counter_value(metrics, "flight_rejected_inputs_total"), 1.0);
}

TEST_F(FlightAnalyzerTest, AppliesLoggingConfiguration) {
  config.logging.log_levels[LogComponent::CLASSIFIER] = LogLevel::ERROR;
  {
    FlightAnalyzer analyzer(config, stubbed_registry());
    EXPECT_FALSE(LogManager::instance().should_log(LogLevel::WARN,
                                                   LogComponent::CLASSIFIER));
    EXPECT_TRUE(LogManager::instance().should_log(LogLevel::INFO,
                                                  LogComponent::CORE));
  }

  FlightAnalyzer defaults(Config::AppConfig{}, stubbed_registry());
  EXPECT_TRUE(LogManager::instance().should_log(LogLevel::WARN,
                                                LogComponent::CLASSIFIER));
}

TEST_F(FlightAnalyzerTest, MetricsDisabledByConfig) {
  FlightAnalyzer analyzer(config, stubbed_registry());
  EXPECT_EQ(analyzer.metrics_registry(), nullptr);
}

// End to end with synthetically trained models
class FlightAnalyzerTrainingTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() {
    analyzer = std::make_unique<FlightAnalyzer>(fast_training_config());
  }
  static void TearDownTestSuite() { analyzer.reset(); }

  static std::unique_ptr<FlightAnalyzer> analyzer;
};

std::unique_ptr<FlightAnalyzer> FlightAnalyzerTrainingTest::analyzer;

TEST_F(FlightAnalyzerTrainingTest, DetectsMotorDropout) {
  auto result =
      analyzer->analyze(TestData::multirotor_with_motor_dropout(200, 80, 120));

  EXPECT_EQ(result.aircraft_type, AircraftType::MULTIROTOR);
  EXPECT_FALSE(result.model_degraded);

  size_t in_dropout = 0;
  size_t outside = 0;
  for (const auto &anomaly : result.anomalies) {
    if (anomaly.row_index >= 80 && anomaly.row_index < 120)
      ++in_dropout;
    else
      ++outside;
  }
  EXPECT_GE(in_dropout, 32u);
  EXPECT_LE(outside, 8u);

  EXPECT_EQ(result.explanation.status, ExplanationStatus::OK);
  ASSERT_FALSE(result.explanation.ranking.empty());
  const auto &ranking = result.explanation.ranking;
  const size_t top = std::min<size_t>(3, ranking.size());
  EXPECT_TRUE(std::any_of(ranking.begin(), ranking.begin() + top,
                          [](const FeatureImportance &importance) {
                            return importance.feature == "motor_4_rpm";
                          }));
}

TEST_F(FlightAnalyzerTrainingTest, NominalSyntheticFlightIsLowRisk) {
  SyntheticFlightGenerator generator;
  auto result =
      analyzer->analyze(generator.synthesize_flight(AircraftType::FIXED_WING,
                                                    300, 5));
  EXPECT_EQ(result.aircraft_type, AircraftType::FIXED_WING);
  EXPECT_EQ(result.risk_level, RiskLevel::LOW);
  EXPECT_LT(result.anomalies.size(), 15u);
}

TEST_F(FlightAnalyzerTrainingTest, ModelsAreTrainedLazilyPerType) {
  auto &registry = analyzer->registry();
  analyzer->analyze(TestData::multirotor_scenario());
  EXPECT_NE(registry.find_model(AircraftType::MULTIROTOR), nullptr);
  EXPECT_FALSE(registry.find_model(AircraftType::MULTIROTOR)->degraded);
}
