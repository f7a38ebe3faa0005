#ifndef RISK_AGGREGATOR_HPP
#define RISK_AGGREGATOR_HPP

#include "analysis/analysis_result.hpp"
#include "detection/aircraft_classifier.hpp"

#include <string>

// Per-request facts that are not produced by the pipeline stages themselves
struct AnalysisContext {
  size_t row_count = 0;
  bool detection_skipped = false;
  FlightPhases flight_phases;
  PerformanceMetrics performance;
  double processing_time_ms = 0.0;
  std::string analyzed_at;
};

class RiskAggregator {
public:
  AnalysisResult aggregate(const Classification &classification,
                           const Detection &detection,
                           const Explanation &explanation,
                           const AnalysisContext &context) const;
};

#endif // RISK_AGGREGATOR_HPP
