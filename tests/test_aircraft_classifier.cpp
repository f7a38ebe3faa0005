#include "core/logger.hpp"
#include "detection/aircraft_classifier.hpp"
#include "features/feature_extractor.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <random>

class AircraftClassifierTest : public ::testing::Test {
protected:
  Classification classify_log(const FlightLog &log,
                              const Config::ClassifierConfig &config) {
    ProfileCatalog catalog(config);
    FeatureExtractor extractor(Config::FeatureExtractionConfig{});
    AircraftClassifier classifier(catalog, config);
    return classifier.classify(extractor.summarize(log));
  }

  // Multirotor and VTOL both score 0.5, fixed-wing 0.4
  static SummaryStats tied_stats() {
    SummaryStats stats;
    stats.row_count = 100;
    stats.has_signal = true;
    stats.motor_channel_count = 4;
    stats.active_motor_count = 4;
    stats.motor_symmetry = 0.9;
    stats.has_control_surfaces = true;
    stats.hover_ratio = 0.25;
    stats.cruise_ratio = 0.4;
    stats.average_speed = 20.0;
    stats.vertical_transition_ratio = 0.3;
    return stats;
  }

  Config::ClassifierConfig config;
};

TEST_F(AircraftClassifierTest, ClassifiesMultirotor) {
  auto result = classify_log(TestData::multirotor_scenario(), config);
  EXPECT_EQ(result.type, AircraftType::MULTIROTOR);
  EXPECT_DOUBLE_EQ(result.confidence, 0.8);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::FIXED_WING), 0.0);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::VTOL), 0.0);
  EXPECT_FALSE(result.undetected);
  EXPECT_FALSE(result.tie_broken);
  EXPECT_FALSE(result.low_confidence);
}

TEST_F(AircraftClassifierTest, ClassifiesFixedWing) {
  auto result = classify_log(TestData::fixed_wing_scenario(), config);
  EXPECT_EQ(result.type, AircraftType::FIXED_WING);
  EXPECT_DOUBLE_EQ(result.confidence, 1.0);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::MULTIROTOR), 0.0);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::VTOL), 0.0);
}

TEST_F(AircraftClassifierTest, FixedWingAltitudeNoiseIsLevelFlight) {
  const size_t rows = 300;
  std::mt19937_64 rng(17);
  std::uniform_real_distribution<double> band(199.0, 201.0);
  std::vector<double> sine(rows), uniform(rows);
  for (size_t i = 0; i < rows; ++i) {
    sine[i] = 200.0 + std::sin(0.3 * i);
    uniform[i] = band(rng);
  }

  for (const auto &altitude : {sine, uniform}) {
    auto log = TestData::fixed_wing_scenario(rows);
    log.set_column("altitude", altitude);
    FeatureExtractor extractor(Config::FeatureExtractionConfig{});
    EXPECT_DOUBLE_EQ(extractor.summarize(log).vertical_transition_ratio, 0.0);

    auto result = classify_log(log, config);
    EXPECT_EQ(result.type, AircraftType::FIXED_WING);
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_FALSE(result.low_confidence);
  }
}

TEST_F(AircraftClassifierTest, ClassifiesVtol) {
  auto result = classify_log(TestData::vtol_scenario(), config);
  EXPECT_EQ(result.type, AircraftType::VTOL);
  EXPECT_DOUBLE_EQ(result.confidence, 1.0);
  // Scores are independent per profile and need not sum to 1
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::FIXED_WING), 0.7);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::MULTIROTOR), 0.5);
}

TEST_F(AircraftClassifierTest, DegenerateLogIsUndetected) {
  auto result = classify_log(TestData::all_zero_log(), config);
  EXPECT_TRUE(result.undetected);
  EXPECT_TRUE(result.low_confidence);
  EXPECT_EQ(result.type, AircraftType::MULTIROTOR);
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
  for (const auto &entry : result.distribution)
    EXPECT_DOUBLE_EQ(entry.second, 0.0);
}

TEST_F(AircraftClassifierTest, UndetectedUsesConfiguredTieBreakType) {
  config.tie_break_type = "fixed_wing";
  auto result = classify_log(FlightLog(), config);
  EXPECT_TRUE(result.undetected);
  EXPECT_EQ(result.type, AircraftType::FIXED_WING);
}

TEST_F(AircraftClassifierTest, TieIsLoggedAsWarning) {
  LogManager::instance().configure(Config::LoggingConfig{});
  ProfileCatalog catalog(config);
  AircraftClassifier classifier(catalog, config);

  testing::internal::CaptureStdout();
  auto result = classifier.classify(tied_stats());
  const std::string output = testing::internal::GetCapturedStdout();

  EXPECT_TRUE(result.tie_broken);
  EXPECT_NE(output.find("[WARN] [CLASSIFIER]"), std::string::npos) << output;
  EXPECT_NE(output.find("Classification tie at score 0.5"), std::string::npos)
      << output;
  EXPECT_NE(output.find("resolved to multirotor"), std::string::npos)
      << output;
}

TEST_F(AircraftClassifierTest, TiePrefersConfiguredType) {
  ProfileCatalog catalog(config);
  AircraftClassifier classifier(catalog, config);
  auto result = classifier.classify(tied_stats());

  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::MULTIROTOR), 0.5);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::VTOL), 0.5);
  EXPECT_DOUBLE_EQ(result.distribution.at(AircraftType::FIXED_WING), 0.4);
  EXPECT_EQ(result.type, AircraftType::MULTIROTOR);
  EXPECT_TRUE(result.tie_broken);
  EXPECT_TRUE(result.low_confidence);
  EXPECT_FALSE(result.undetected);

  config.tie_break_type = "vtol";
  ProfileCatalog vtol_catalog(config);
  AircraftClassifier vtol_classifier(vtol_catalog, config);
  EXPECT_EQ(vtol_classifier.classify(tied_stats()).type, AircraftType::VTOL);
}

TEST_F(AircraftClassifierTest, TieWithoutPreferredTypeUsesCatalogOrder) {
  config.tie_break_type = "fixed_wing";
  ProfileCatalog catalog(config);
  AircraftClassifier classifier(catalog, config);
  auto result = classifier.classify(tied_stats());
  EXPECT_EQ(result.type, AircraftType::MULTIROTOR);
  EXPECT_TRUE(result.tie_broken);
}

TEST_F(AircraftClassifierTest, ConfidenceThresholdIsConfigurable) {
  config.min_confident_score = 0.9;
  auto result = classify_log(TestData::multirotor_scenario(), config);
  EXPECT_EQ(result.type, AircraftType::MULTIROTOR);
  EXPECT_TRUE(result.low_confidence);
}

TEST(AircraftProfileTest, CatalogProfiles) {
  ProfileCatalog catalog(Config::ClassifierConfig{});
  ASSERT_EQ(catalog.profiles().size(), 3u);
  EXPECT_EQ(catalog.profiles()[0].type(), AircraftType::FIXED_WING);
  EXPECT_EQ(catalog.profile(AircraftType::FIXED_WING).feature_count(), 16u);
  EXPECT_EQ(catalog.profile(AircraftType::MULTIROTOR).feature_count(), 15u);
  EXPECT_EQ(catalog.profile(AircraftType::VTOL).feature_count(), 19u);
  EXPECT_EQ(catalog.profile(AircraftType::MULTIROTOR).min_active_lift_motors(),
            4u);
  EXPECT_EQ(catalog.profile(AircraftType::VTOL).name(), "vtol");

  for (const auto &profile : catalog.profiles())
    EXPECT_NEAR(profile.max_raw_score(), 1.0, 1e-9);
}

TEST(AircraftProfileTest, MatchedRulesDescribeTheScore) {
  ProfileCatalog catalog(Config::ClassifierConfig{});
  FeatureExtractor extractor(Config::FeatureExtractionConfig{});
  auto stats = extractor.summarize(TestData::multirotor_scenario());
  auto matched =
      catalog.profile(AircraftType::MULTIROTOR).matched_rules(stats);
  EXPECT_EQ(matched.size(), 4u);
  EXPECT_TRUE(
      catalog.profile(AircraftType::FIXED_WING).matched_rules(stats).empty());
}

TEST(AircraftProfileTest, NominalRangeDeviation) {
  NominalRange range{"altitude", 0.0, 100.0, "low", "high"};
  EXPECT_DOUBLE_EQ(range.deviation(50.0), 0.0);
  EXPECT_DOUBLE_EQ(range.deviation(150.0), 0.5);
  EXPECT_DOUBLE_EQ(range.deviation(-20.0), 0.2);
}

TEST(AircraftTypeTest, StringConversions) {
  EXPECT_EQ(aircraft_type_to_string(AircraftType::FIXED_WING), "fixed_wing");
  EXPECT_EQ(aircraft_type_from_string("Fixed Wing"), AircraftType::FIXED_WING);
  EXPECT_EQ(aircraft_type_from_string("MULTIROTOR"), AircraftType::MULTIROTOR);
  EXPECT_FALSE(aircraft_type_from_string("helicopter").has_value());
}
