#include "analysis/anomaly_detector.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

AnomalyDetector::AnomalyDetector(ModelRegistry &registry,
                                 const FeatureExtractor &extractor,
                                 const Config::DetectionConfig &config,
                                 double active_rpm_threshold)
    : registry_(registry), extractor_(extractor), config_(config),
      active_rpm_threshold_(active_rpm_threshold) {}

Detection AnomalyDetector::detect(const FlightLog &log,
                                  AircraftType type) const {
  auto model = registry_.get_model(type);
  const auto &profile = registry_.catalog().profile(type);
  return detect(log, extractor_.build_matrix(log, profile), *model);
}

Detection AnomalyDetector::detect(const FlightLog &log,
                                  const FeatureMatrix &matrix,
                                  const TrainedModel &model) const {
  const auto &profile = registry_.catalog().profile(model.type);

  Detection detection;
  detection.model_degraded = model.degraded || model.classifier->is_degraded();
  detection.probabilities.reserve(matrix.size());

  double probability_sum = 0.0;
  for (size_t row = 0; row < matrix.size(); ++row) {
    const double probability = std::clamp(
        model.classifier->predict_probability(model.scale(matrix[row])), 0.0,
        1.0);
    detection.probabilities.push_back(probability);
    probability_sum += probability;

    if (probability < config_.anomaly_threshold)
      continue;

    AnomalyRecord record;
    record.row_index = row;
    record.timestamp_s =
        row < log.timestamps().size() ? log.timestamps()[row] : 0.0;
    record.probability = probability;
    record.severity = probability > config_.critical_threshold
                          ? Severity::CRITICAL
                          : Severity::WARNING;
    for (size_t f = 0; f < profile.feature_count(); ++f)
      record.features[profile.feature_names()[f]] = matrix[row][f];
    record.description = describe(profile, matrix[row]);
    detection.anomalies.push_back(std::move(record));
  }

  detection.risk_score =
      matrix.empty()
          ? 0.0
          : std::clamp(probability_sum / static_cast<double>(matrix.size()),
                       0.0, 1.0);
  detection.risk_level = classify_risk(detection.risk_score);

  LOG(LogLevel::DEBUG, LogComponent::ML_INFERENCE,
      "Scored " << matrix.size() << " rows with the " << profile.name()
                << " model: risk=" << detection.risk_score << " anomalies="
                << detection.anomalies.size()
                << (detection.model_degraded ? " (degraded model)" : ""));
  return detection;
}

RiskLevel AnomalyDetector::classify_risk(double risk_score) const {
  if (risk_score < config_.medium_risk_threshold)
    return RiskLevel::LOW;
  if (risk_score < config_.high_risk_threshold)
    return RiskLevel::MEDIUM;
  return RiskLevel::HIGH;
}

std::string AnomalyDetector::describe(const AircraftProfile &profile,
                                      const std::vector<double> &row) const {
  std::vector<std::string> issues;

  const auto &lift_motors = profile.lift_motor_columns();
  if (!lift_motors.empty()) {
    size_t operational = 0;
    for (const auto &motor : lift_motors) {
      const auto &names = profile.feature_names();
      auto it = std::find(names.begin(), names.end(), motor);
      if (it != names.end() &&
          row[static_cast<size_t>(it - names.begin())] > active_rpm_threshold_)
        ++operational;
    }
    if (operational < profile.min_active_lift_motors()) {
      std::ostringstream oss;
      oss << "CRITICAL: Insufficient motors operational (" << operational
          << " of " << lift_motors.size() << ")";
      issues.push_back(oss.str());
    }
  }

  struct Deviation {
    const NominalRange *range;
    double value;
    double amount;
  };
  std::vector<Deviation> deviations;
  for (const auto &range : profile.nominal_ranges()) {
    const auto &names = profile.feature_names();
    auto it = std::find(names.begin(), names.end(), range.feature);
    if (it == names.end())
      continue;
    const double value = row[static_cast<size_t>(it - names.begin())];
    const double amount = range.deviation(value);
    if (amount > 0.0)
      deviations.push_back({&range, value, amount});
  }
  std::stable_sort(deviations.begin(), deviations.end(),
                   [](const Deviation &a, const Deviation &b) {
                     return a.amount > b.amount;
                   });

  const size_t described =
      std::min(deviations.size(), config_.max_described_features);
  for (size_t i = 0; i < described; ++i) {
    const auto &d = deviations[i];
    std::ostringstream oss;
    oss << (d.value < d.range->low ? d.range->low_issue : d.range->high_issue)
        << " (" << d.range->feature << "=" << std::fixed
        << std::setprecision(2) << d.value << ")";
    issues.push_back(oss.str());
  }

  if (issues.empty())
    return "Flight parameter anomaly detected";

  std::ostringstream description;
  for (size_t i = 0; i < issues.size(); ++i)
    description << (i ? "; " : "") << issues[i];
  return description.str();
}
