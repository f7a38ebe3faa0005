#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>

namespace {

AnalysisResult sample_result() {
  AnalysisResult result;
  result.aircraft_type = AircraftType::VTOL;
  result.aircraft_confidence = 0.8;
  result.type_distribution = {{AircraftType::FIXED_WING, 0.1},
                              {AircraftType::MULTIROTOR, 0.1},
                              {AircraftType::VTOL, 0.8}};
  result.classification_tie_broken = true;
  result.risk_score = 0.45;
  result.risk_level = RiskLevel::MEDIUM;

  AnomalyRecord record;
  record.row_index = 12;
  record.timestamp_s = 1.2;
  record.probability = 0.93;
  record.severity = Severity::CRITICAL;
  record.features = {{"altitude", 55.0}, {"motor_1_rpm", 0.0}};
  record.description = "Motor 1 underperforming (motor_1_rpm=0.00)";
  result.anomalies.push_back(record);

  result.explanation.status = ExplanationStatus::OK;
  result.explanation.ranking.push_back({"motor_1_rpm", 0.6, 0.4, 1200.0});
  result.explanation.overall_impact = 0.6;
  result.explanation.sample_size = 40;
  result.explanation.summary = "Key factors for vtol: Motor performance "
                               "asymmetry detected";

  result.flight_phases.durations_s = {{"hover", 6.0}, {"transition", 0.8}};
  result.flight_phases.total_flight_time_s = 19.9;
  result.performance.values = {{"max_altitude", 95.0}};
  result.row_count = 200;
  result.analyzed_at = "2024-05-01T10:00:00Z";
  return result;
}

} // namespace

TEST(JsonFormatterTest, ResultObjectCarriesClassificationAndRisk) {
  auto j = JsonFormatter::result_to_json_object(sample_result());

  EXPECT_EQ(j["aircraft_type"], "vtol");
  EXPECT_DOUBLE_EQ(j["aircraft_confidence"].get<double>(), 0.8);
  EXPECT_DOUBLE_EQ(j["type_distribution"]["fixed_wing"].get<double>(), 0.1);
  EXPECT_TRUE(j["classification_flags"]["tie_broken"].get<bool>());
  EXPECT_FALSE(j["classification_flags"]["undetected"].get<bool>());
  EXPECT_EQ(j["risk_level"], "medium");
  EXPECT_DOUBLE_EQ(j["risk_score"].get<double>(), 0.45);
  EXPECT_FALSE(j["model_degraded"].get<bool>());
  EXPECT_EQ(j["row_count"], 200);
}

TEST(JsonFormatterTest, AnomaliesAndExplanation) {
  auto j = JsonFormatter::result_to_json_object(sample_result());

  ASSERT_EQ(j["anomalies"].size(), 1u);
  EXPECT_EQ(j["anomaly_count"], 1);
  const auto &anomaly = j["anomalies"][0];
  EXPECT_EQ(anomaly["row_index"], 12);
  EXPECT_EQ(anomaly["severity"], "CRITICAL");
  EXPECT_DOUBLE_EQ(anomaly["features"]["altitude"].get<double>(), 55.0);
  EXPECT_EQ(anomaly["description"],
            "Motor 1 underperforming (motor_1_rpm=0.00)");

  const auto &explanation = j["explanation"];
  EXPECT_EQ(explanation["status"], "ok");
  EXPECT_EQ(explanation["sample_size"], 40);
  ASSERT_EQ(explanation["top_features"].size(), 1u);
  EXPECT_EQ(explanation["top_features"][0]["feature"], "motor_1_rpm");
  EXPECT_DOUBLE_EQ(explanation["top_features"][0]["importance"].get<double>(),
                   0.6);
}

TEST(JsonFormatterTest, FlightContext) {
  auto result = sample_result();
  auto j = JsonFormatter::result_to_json_object(result);
  EXPECT_DOUBLE_EQ(j["flight_phases"]["hover"].get<double>(), 6.0);
  EXPECT_DOUBLE_EQ(j["flight_phases"]["total_flight_time_s"].get<double>(),
                   19.9);
  EXPECT_FALSE(j["performance_metrics"].contains("engine_state"));

  result.performance.engine_state = "below_normal";
  j = JsonFormatter::result_to_json_object(result);
  EXPECT_EQ(j["performance_metrics"]["engine_state"], "below_normal");
  EXPECT_DOUBLE_EQ(j["performance_metrics"]["max_altitude"].get<double>(),
                   95.0);
}

TEST(JsonFormatterTest, EmptyResultSerializesEmptyArrays) {
  auto parsed = nlohmann::json::parse(
      JsonFormatter::format_result_to_json(AnalysisResult{}, 2));
  EXPECT_TRUE(parsed["anomalies"].is_array());
  EXPECT_TRUE(parsed["anomalies"].empty());
  EXPECT_TRUE(parsed["explanation"]["top_features"].empty());
  EXPECT_EQ(parsed["explanation"]["status"], "degenerate");
  EXPECT_EQ(parsed["risk_level"], "low");
}
