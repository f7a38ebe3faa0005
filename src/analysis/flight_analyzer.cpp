#include "analysis/flight_analyzer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/scoped_timer.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::string utc_timestamp_now() {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace

FlightAnalyzer::FlightAnalyzer(const Config::AppConfig &config)
    : FlightAnalyzer(config,
                     std::make_shared<ModelRegistry>(
                         ProfileCatalog(config.classifier), config.training)) {}

FlightAnalyzer::FlightAnalyzer(const Config::AppConfig &config,
                               std::shared_ptr<ModelRegistry> registry)
    : config_(config), catalog_(config_.classifier),
      extractor_(config_.feature_extraction),
      classifier_(catalog_, config_.classifier), registry_(std::move(registry)),
      detector_(*registry_, extractor_, config_.detection,
                config_.feature_extraction.active_rpm_threshold),
      explainer_(*registry_, extractor_, config_.explainability) {
  LogManager::instance().configure(config_.logging);

  if (config_.metrics.enabled) {
    metrics_registry_ = std::make_shared<MetricsRegistry>();
    metrics_ = std::make_shared<AnalysisMetrics>(*metrics_registry_);
    registry_->set_metrics(metrics_);
  }

  if (config_.training.train_on_startup) {
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Training all aircraft models on startup.");
    const TrainingReport report = registry_->train_all();
    for (const auto &outcome : report.outcomes) {
      if (!outcome.success) {
        LOG(LogLevel::ERROR, LogComponent::CORE,
            "Startup training of " << aircraft_type_to_string(outcome.type)
                                   << " failed: " << outcome.message
                                   << ". Serving a degraded fallback model.");
      }
    }
  }
  LOG(LogLevel::INFO, LogComponent::CORE, "FlightAnalyzer ready.");
}

AnalysisResult FlightAnalyzer::analyze(const FlightLog &log) const {
  ScopedTimer timer(metrics_ ? &metrics_->analysis_latency() : nullptr);

  if (log.empty()) {
    if (metrics_)
      metrics_->record_rejected_input();
    throw InvalidInput("flight log has no rows");
  }
  if (auto problem = log.structural_error()) {
    if (metrics_)
      metrics_->record_rejected_input();
    throw InvalidInput("malformed flight log: " + *problem);
  }

  LOG(LogLevel::DEBUG, LogComponent::CORE,
      "Analyzing flight log with " << log.row_count() << " rows and "
                                   << log.column_names().size()
                                   << " columns.");

  const FeatureExtraction extraction = extractor_.extract(log, catalog_);
  const Classification classification =
      classifier_.classify(extraction.summary);

  AnalysisContext context;
  context.row_count = log.row_count();
  context.flight_phases =
      phase_analyzer_.analyze_phases(log, classification.type);
  context.performance =
      phase_analyzer_.compute_performance(log, classification.type);

  Detection detection;
  Explanation explanation;
  if (classification.undetected) {
    // Nothing to score: the log carries no aircraft signature
    context.detection_skipped = true;
    explanation.summary = "No significant features found";
    LOG(LogLevel::WARN, LogComponent::CORE,
        "Aircraft type undetected; anomaly detection skipped.");
  } else {
    // Both stages bind to the same model snapshot
    auto model = registry_->get_model(classification.type);
    const auto &matrix = extraction.matrices.at(classification.type);
    detection = detector_.detect(log, matrix, *model);
    explanation = explainer_.explain(matrix, *model);
  }

  context.processing_time_ms = timer.elapsed_ms();
  context.analyzed_at = utc_timestamp_now();

  AnalysisResult result =
      aggregator_.aggregate(classification, detection, explanation, context);

  if (metrics_)
    metrics_->record_analysis(result.aircraft_type, result.anomalies.size(),
                              result.model_degraded);
  return result;
}
