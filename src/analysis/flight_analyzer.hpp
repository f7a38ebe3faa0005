#ifndef FLIGHT_ANALYZER_HPP
#define FLIGHT_ANALYZER_HPP

#include "analysis/analysis_result.hpp"
#include "analysis/anomaly_detector.hpp"
#include "analysis/explainability_engine.hpp"
#include "analysis/risk_aggregator.hpp"
#include "core/analysis_metrics.hpp"
#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "detection/aircraft_classifier.hpp"
#include "features/feature_extractor.hpp"
#include "features/flight_phase_analyzer.hpp"
#include "models/model_registry.hpp"

#include <memory>

// Entry point of the analysis core: flight log in, AnalysisResult out.
// analyze() is re-entrant; the only shared mutable state is the model
// registry.
class FlightAnalyzer {
public:
  explicit FlightAnalyzer(const Config::AppConfig &config);
  FlightAnalyzer(const Config::AppConfig &config,
                 std::shared_ptr<ModelRegistry> registry);

  FlightAnalyzer(const FlightAnalyzer &) = delete;
  FlightAnalyzer &operator=(const FlightAnalyzer &) = delete;

  // Throws InvalidInput for a log without rows or with a broken structure,
  // ModelUnavailable / TrainingFailure when the type's model cannot be
  // obtained.
  AnalysisResult analyze(const FlightLog &log) const;

  ModelRegistry &registry() const { return *registry_; }
  const ProfileCatalog &catalog() const { return catalog_; }
  // Null when metrics are disabled
  std::shared_ptr<MetricsRegistry> metrics_registry() const {
    return metrics_registry_;
  }

private:
  Config::AppConfig config_;
  ProfileCatalog catalog_;
  FeatureExtractor extractor_;
  AircraftClassifier classifier_;
  std::shared_ptr<ModelRegistry> registry_;
  AnomalyDetector detector_;
  ExplainabilityEngine explainer_;
  RiskAggregator aggregator_;
  FlightPhaseAnalyzer phase_analyzer_;

  std::shared_ptr<MetricsRegistry> metrics_registry_;
  std::shared_ptr<AnalysisMetrics> metrics_;
};

#endif // FLIGHT_ANALYZER_HPP
