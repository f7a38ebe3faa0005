#include "core/analysis_metrics.hpp"

AnalysisMetrics::AnalysisMetrics(MetricsRegistry &registry)
    : analyses_total_(registry.create_counter(
          "flight_analyses_total", "Total number of analyzed flight logs.")),
      anomalies_total_(registry.create_counter(
          "flight_anomalies_total",
          "Total number of anomalous rows reported across all analyses.")),
      rejected_inputs_total_(registry.create_counter(
          "flight_rejected_inputs_total",
          "Flight logs rejected as structurally invalid.")),
      degraded_analyses_total_(registry.create_counter(
          "flight_degraded_analyses_total",
          "Analyses scored by a fallback model.")),
      training_failures_total_(registry.create_counter(
          "model_training_failures_total",
          "Synthetic training runs that failed.")),
      analysis_latency_(registry.create_histogram(
          "flight_analysis_duration_seconds",
          "Wall time of one analyze() call.",
          {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5})),
      training_latency_(registry.create_histogram(
          "model_training_duration_seconds",
          "Wall time of training one aircraft type.",
          {0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0})) {
  auto &classification_family = registry.create_counter_family(
      "flight_classifications_total", "Analyses per detected aircraft type.",
      {});
  auto &training_family = registry.create_counter_family(
      "model_trainings_total", "Completed training runs per aircraft type.",
      {});
  for (AircraftType type : ALL_AIRCRAFT_TYPES) {
    const std::string label = aircraft_type_to_string(type);
    classifications_[type] = &classification_family.Add({{"type", label}});
    trainings_[type] = &training_family.Add({{"type", label}});
  }
}

void AnalysisMetrics::record_analysis(AircraftType type, size_t anomaly_count,
                                      bool model_degraded) {
  analyses_total_.Increment();
  anomalies_total_.Increment(static_cast<double>(anomaly_count));
  classifications_.at(type)->Increment();
  if (model_degraded)
    degraded_analyses_total_.Increment();
}

void AnalysisMetrics::record_rejected_input() {
  rejected_inputs_total_.Increment();
}

void AnalysisMetrics::record_training(AircraftType type, bool success) {
  if (success)
    trainings_.at(type)->Increment();
  else
    training_failures_total_.Increment();
}
