#include "analysis/risk_aggregator.hpp"
#include "core/logger.hpp"

#include <algorithm>

AnalysisResult RiskAggregator::aggregate(const Classification &classification,
                                         const Detection &detection,
                                         const Explanation &explanation,
                                         const AnalysisContext &context) const {
  AnalysisResult result;
  result.aircraft_type = classification.type;
  result.aircraft_confidence = std::clamp(classification.confidence, 0.0, 1.0);
  result.type_distribution = classification.distribution;
  result.classification_undetected = classification.undetected;
  result.classification_tie_broken = classification.tie_broken;
  result.classification_low_confidence = classification.low_confidence;

  result.risk_score = std::clamp(detection.risk_score, 0.0, 1.0);
  result.risk_level = detection.risk_level;
  result.anomalies = detection.anomalies;
  result.model_degraded = detection.model_degraded;

  result.explanation = explanation;

  result.flight_phases = context.flight_phases;
  result.performance = context.performance;
  result.row_count = context.row_count;
  result.detection_skipped = context.detection_skipped;
  result.processing_time_ms = context.processing_time_ms;
  result.analyzed_at = context.analyzed_at;

  LOG(LogLevel::INFO, LogComponent::AGGREGATE,
      "Flight analyzed: type=" << aircraft_type_to_string(result.aircraft_type)
                               << " confidence=" << result.aircraft_confidence
                               << " risk=" << result.risk_score << " ("
                               << risk_level_to_string(result.risk_level)
                               << ") anomalies=" << result.anomalies.size());
  return result;
}
