#include "detection/aircraft_classifier.hpp"
#include "features/feature_extractor.hpp"
#include "models/synthetic_flight_generator.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>

class SyntheticGeneratorTest : public ::testing::Test {
protected:
  SyntheticGeneratorTest() : catalog(Config::ClassifierConfig{}) {}

  Classification classify(const FlightLog &log) const {
    FeatureExtractor extractor(Config::FeatureExtractionConfig{});
    AircraftClassifier classifier(catalog, Config::ClassifierConfig{});
    return classifier.classify(extractor.summarize(log));
  }

  ProfileCatalog catalog;
  SyntheticFlightGenerator generator;
};

TEST_F(SyntheticGeneratorTest, TrainingSetIsDeterministicPerSeed) {
  const auto &profile = catalog.profile(AircraftType::MULTIROTOR);
  auto first = generator.generate_training_set(profile, 500, 0.2, 42);
  auto second = generator.generate_training_set(profile, 500, 0.2, 42);
  auto other = generator.generate_training_set(profile, 500, 0.2, 43);

  EXPECT_EQ(first.features, second.features);
  EXPECT_EQ(first.labels, second.labels);
  EXPECT_NE(first.features, other.features);
}

TEST_F(SyntheticGeneratorTest, TrainingSetShapeAndLabelFraction) {
  for (const auto &profile : catalog.profiles()) {
    auto set = generator.generate_training_set(profile, 1000, 0.2, 7);
    ASSERT_EQ(set.features.size(), 1000u);
    ASSERT_EQ(set.labels.size(), 1000u);
    for (const auto &row : set.features)
      ASSERT_EQ(row.size(), profile.feature_count());

    const int positives =
        std::accumulate(set.labels.begin(), set.labels.end(), 0);
    EXPECT_EQ(positives, 200) << profile.name();
  }
}

TEST_F(SyntheticGeneratorTest, AnomalousRowsLeaveTheNominalEnvelope) {
  const auto &profile = catalog.profile(AircraftType::FIXED_WING);
  auto set = generator.generate_training_set(profile, 2000, 0.2, 11);

  // Per-label share of rows with at least one feature outside its range
  auto outside_share = [&](int label) {
    size_t rows = 0, outside = 0;
    for (size_t i = 0; i < set.features.size(); ++i) {
      if (set.labels[i] != label)
        continue;
      ++rows;
      for (const auto &range : profile.nominal_ranges()) {
        const auto &names = profile.feature_names();
        const size_t f =
            std::find(names.begin(), names.end(), range.feature) -
            names.begin();
        if (range.deviation(set.features[i][f]) > 0.0) {
          ++outside;
          break;
        }
      }
    }
    return static_cast<double>(outside) / rows;
  };

  EXPECT_GT(outside_share(1), 0.9);
  EXPECT_LT(outside_share(0), outside_share(1));
}

TEST_F(SyntheticGeneratorTest, RejectsInvalidArguments) {
  const auto &profile = catalog.profile(AircraftType::VTOL);
  EXPECT_THROW(generator.generate_training_set(profile, 1, 0.2, 1),
               std::invalid_argument);
  EXPECT_THROW(generator.generate_training_set(profile, 100, 0.0, 1),
               std::invalid_argument);
  EXPECT_THROW(generator.generate_training_set(profile, 100, 1.0, 1),
               std::invalid_argument);
}

TEST_F(SyntheticGeneratorTest, SynthesizedFlightsClassifyAsTheirType) {
  double fixed_wing_confidence = 0.0;
  const int flights = 5;
  for (int seed = 0; seed < flights; ++seed) {
    auto result = classify(
        generator.synthesize_flight(AircraftType::FIXED_WING, 300, seed));
    EXPECT_EQ(result.type, AircraftType::FIXED_WING);
    fixed_wing_confidence += result.confidence;
  }
  EXPECT_GE(fixed_wing_confidence / flights, 0.8);

  auto multirotor =
      classify(generator.synthesize_flight(AircraftType::MULTIROTOR, 300, 3));
  EXPECT_EQ(multirotor.type, AircraftType::MULTIROTOR);

  auto vtol = classify(generator.synthesize_flight(AircraftType::VTOL, 300, 3));
  EXPECT_EQ(vtol.type, AircraftType::VTOL);
}

TEST_F(SyntheticGeneratorTest, SynthesizedFlightIsWellFormed) {
  auto log = generator.synthesize_flight(AircraftType::VTOL, 120, 9);
  EXPECT_EQ(log.row_count(), 120u);
  EXPECT_FALSE(log.structural_error().has_value());
  EXPECT_TRUE(log.has_column("transition_mode"));
  EXPECT_NEAR(log.mean_sample_interval(1.0), 0.1, 1e-9);
}
