#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include "analysis/analysis_result.hpp"
#include "core/config.hpp"
#include "features/feature_extractor.hpp"
#include "models/model_registry.hpp"

#include <string>
#include <vector>

class AnomalyDetector {
public:
  AnomalyDetector(ModelRegistry &registry, const FeatureExtractor &extractor,
                  const Config::DetectionConfig &config,
                  double active_rpm_threshold);

  // Scores every row with the type's current model (training it lazily if
  // allowed). Throws ModelUnavailable / TrainingFailure from the registry.
  Detection detect(const FlightLog &log, AircraftType type) const;

  // Scores a matrix already built for `model`'s profile
  Detection detect(const FlightLog &log, const FeatureMatrix &matrix,
                   const TrainedModel &model) const;

  RiskLevel classify_risk(double risk_score) const;

  // Names the features of `row` that lie furthest outside the profile's
  // nominal ranges, preceded by the lift-motor check.
  std::string describe(const AircraftProfile &profile,
                       const std::vector<double> &row) const;

private:
  ModelRegistry &registry_;
  const FeatureExtractor &extractor_;
  Config::DetectionConfig config_;
  double active_rpm_threshold_;
};

#endif // ANOMALY_DETECTOR_HPP
