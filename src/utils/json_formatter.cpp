#include "json_formatter.hpp"

nlohmann::json JsonFormatter::anomaly_to_json_object(const AnomalyRecord &record) {
  nlohmann::json j;
  j["row_index"] = record.row_index;
  j["timestamp"] = record.timestamp_s;
  j["anomaly_probability"] = record.probability;
  j["severity"] = severity_to_string(record.severity);
  j["description"] = record.description;
  j["features"] = record.features;
  return j;
}

nlohmann::json
JsonFormatter::explanation_to_json_object(const Explanation &explanation) {
  nlohmann::json j;
  j["status"] = explanation_status_to_string(explanation.status);
  j["summary"] = explanation.summary;
  j["overall_impact"] = explanation.overall_impact;
  j["sample_size"] = explanation.sample_size;
  j["expected_value"] = explanation.expected_value;

  nlohmann::json j_ranking = nlohmann::json::array();
  for (const auto &importance : explanation.ranking) {
    j_ranking.push_back({{"feature", importance.feature},
                         {"importance", importance.mean_abs_attribution},
                         {"mean_attribution", importance.mean_attribution},
                         {"mean_value", importance.mean_value}});
  }
  j["top_features"] = j_ranking;
  return j;
}

nlohmann::json JsonFormatter::result_to_json_object(const AnalysisResult &result) {
  nlohmann::json j;

  // === Classification ===
  j["aircraft_type"] = aircraft_type_to_string(result.aircraft_type);
  j["aircraft_confidence"] = result.aircraft_confidence;
  nlohmann::json j_distribution;
  for (const auto &[type, score] : result.type_distribution)
    j_distribution[aircraft_type_to_string(type)] = score;
  j["type_distribution"] = j_distribution;
  j["classification_flags"] = {
      {"undetected", result.classification_undetected},
      {"tie_broken", result.classification_tie_broken},
      {"low_confidence", result.classification_low_confidence}};

  // === Risk ===
  j["risk_score"] = result.risk_score;
  j["risk_level"] = risk_level_to_string(result.risk_level);
  j["model_degraded"] = result.model_degraded;
  j["detection_skipped"] = result.detection_skipped;

  nlohmann::json j_anomalies = nlohmann::json::array();
  for (const auto &record : result.anomalies)
    j_anomalies.push_back(anomaly_to_json_object(record));
  j["anomalies"] = j_anomalies;
  j["anomaly_count"] = result.anomalies.size();

  j["explanation"] = explanation_to_json_object(result.explanation);

  // === Flight Context ===
  nlohmann::json j_phases = result.flight_phases.durations_s;
  j_phases["total_flight_time_s"] = result.flight_phases.total_flight_time_s;
  j["flight_phases"] = j_phases;

  nlohmann::json j_performance = result.performance.values;
  if (result.performance.engine_state)
    j_performance["engine_state"] = *result.performance.engine_state;
  j["performance_metrics"] = j_performance;

  j["row_count"] = result.row_count;
  j["processing_time_ms"] = result.processing_time_ms;
  j["analyzed_at"] = result.analyzed_at;
  return j;
}

std::string JsonFormatter::format_result_to_json(const AnalysisResult &result,
                                                 int indent) {
  return result_to_json_object(result).dump(indent);
}
