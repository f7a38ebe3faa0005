#ifndef ANALYSIS_METRICS_HPP
#define ANALYSIS_METRICS_HPP

#include "aircraft/aircraft_type.hpp"
#include "core/metrics_registry.hpp"

#include <cstddef>
#include <map>

// Counters and latency histograms for the analysis pipeline and model
// training, registered once on a MetricsRegistry.
class AnalysisMetrics {
public:
  explicit AnalysisMetrics(MetricsRegistry &registry);

  void record_analysis(AircraftType type, size_t anomaly_count,
                       bool model_degraded);
  void record_rejected_input();
  void record_training(AircraftType type, bool success);

  prometheus::Histogram &analysis_latency() { return analysis_latency_; }
  prometheus::Histogram &training_latency() { return training_latency_; }

private:
  prometheus::Counter &analyses_total_;
  prometheus::Counter &anomalies_total_;
  prometheus::Counter &rejected_inputs_total_;
  prometheus::Counter &degraded_analyses_total_;
  prometheus::Counter &training_failures_total_;
  prometheus::Histogram &analysis_latency_;
  prometheus::Histogram &training_latency_;

  std::map<AircraftType, prometheus::Counter *> classifications_;
  std::map<AircraftType, prometheus::Counter *> trainings_;
};

#endif // ANALYSIS_METRICS_HPP
