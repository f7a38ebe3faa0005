#ifndef ANALYSIS_RESULT_HPP
#define ANALYSIS_RESULT_HPP

#include "aircraft/aircraft_type.hpp"
#include "features/flight_phase_analyzer.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

enum class Severity { WARNING, CRITICAL };
enum class RiskLevel { LOW, MEDIUM, HIGH };
enum class ExplanationStatus { OK, DEGENERATE };

const char *severity_to_string(Severity severity);
const char *risk_level_to_string(RiskLevel level);
const char *explanation_status_to_string(ExplanationStatus status);

struct AnomalyRecord {
  size_t row_index = 0;
  double timestamp_s = 0.0;
  double probability = 0.0;
  Severity severity = Severity::WARNING;
  // Raw feature values of the row, in profile order
  std::map<std::string, double> features;
  std::string description;
};

struct Detection {
  double risk_score = 0.0;
  RiskLevel risk_level = RiskLevel::LOW;
  std::vector<AnomalyRecord> anomalies;
  std::vector<double> probabilities;
  bool model_degraded = false;
};

struct FeatureImportance {
  std::string feature;
  double mean_abs_attribution = 0.0;
  double mean_attribution = 0.0;
  double mean_value = 0.0;
};

struct Explanation {
  ExplanationStatus status = ExplanationStatus::DEGENERATE;
  std::vector<FeatureImportance> ranking;
  double overall_impact = 0.0;
  size_t sample_size = 0;
  double expected_value = 0.0;
  std::string summary;
};

// Immutable outcome of one analyze() call
struct AnalysisResult {
  AircraftType aircraft_type = AircraftType::MULTIROTOR;
  double aircraft_confidence = 0.0;
  std::map<AircraftType, double> type_distribution;
  bool classification_undetected = false;
  bool classification_tie_broken = false;
  bool classification_low_confidence = false;

  double risk_score = 0.0;
  RiskLevel risk_level = RiskLevel::LOW;
  std::vector<AnomalyRecord> anomalies;
  Explanation explanation;

  FlightPhases flight_phases;
  PerformanceMetrics performance;

  size_t row_count = 0;
  bool model_degraded = false;
  bool detection_skipped = false;

  // Timing metadata; excluded from result comparisons
  double processing_time_ms = 0.0;
  std::string analyzed_at;
};

#endif // ANALYSIS_RESULT_HPP
