#include "utils/utils.hpp"
#include <gtest/gtest.h>

// --- Tests for normalize_column_name ---
TEST(UtilsTest, NormalizeColumnName) {
  EXPECT_EQ(Utils::normalize_column_name("Motor 1 RPM"), "motor_1_rpm");
  EXPECT_EQ(Utils::normalize_column_name("  battery_voltage "),
            "battery_voltage");
  EXPECT_EQ(Utils::normalize_column_name("GPS\t HDOP"), "gps_hdop");
  EXPECT_EQ(Utils::normalize_column_name(""), "");
}

TEST(UtilsTest, SplitString) {
  auto parts = Utils::split_string("a,b,,c", ',');
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[2], "");
  EXPECT_EQ(parts[3], "c");
}

// --- Tests for statistics helpers ---
TEST(UtilsTest, MeanAndStandardDeviation) {
  std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
  EXPECT_DOUBLE_EQ(Utils::mean(values), 5.0);
  EXPECT_DOUBLE_EQ(Utils::population_stddev(values), 2.0);
  EXPECT_NEAR(Utils::sample_stddev(values), 2.13809, 1e-5);

  EXPECT_DOUBLE_EQ(Utils::mean({}), 0.0);
  EXPECT_DOUBLE_EQ(Utils::population_stddev({}), 0.0);
  EXPECT_DOUBLE_EQ(Utils::sample_stddev({3.0}), 0.0);
}

TEST(UtilsTest, RoundToKeepsAdditiveScoresExact) {
  EXPECT_DOUBLE_EQ(Utils::round_to(0.3 + 0.2 + 0.1 + 0.2, 6), 0.8);
  EXPECT_DOUBLE_EQ(Utils::round_to(0.1 + 0.2, 6), 0.3);
  EXPECT_DOUBLE_EQ(Utils::round_to(1.23456789, 3), 1.235);
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_EQ(Utils::string_to_number<size_t>("4000"), 4000u);
  EXPECT_FALSE(Utils::string_to_number<int>("4x").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("abc").has_value());
  EXPECT_EQ(Utils::string_to_number<int>(""), 0);
}

TEST(UtilsTest, ContainsSubstringAndCase) {
  EXPECT_TRUE(Utils::contains_substring("motor_3_rpm", "rpm"));
  EXPECT_FALSE(Utils::contains_substring("airspeed", "motor"));
  EXPECT_EQ(Utils::to_lower_copy("FiXeD_WiNg"), "fixed_wing");
  EXPECT_EQ(Utils::trim_copy("  x y  "), "x y");
}
