#ifndef MODEL_REGISTRY_HPP
#define MODEL_REGISTRY_HPP

#include "aircraft/aircraft_profile.hpp"
#include "core/analysis_metrics.hpp"
#include "core/config.hpp"
#include "models/synthetic_flight_generator.hpp"
#include "models/trained_model.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct TrainingOutcome {
  enum class ErrorKind { NONE, INVALID_TRAINING_DATA, TRAINING_FAILURE };

  AircraftType type = AircraftType::MULTIROTOR;
  bool success = false;
  ErrorKind error_kind = ErrorKind::NONE;
  std::string message;
  double duration_ms = 0.0;
};

std::string error_kind_to_string(TrainingOutcome::ErrorKind kind);

struct TrainingReport {
  std::vector<TrainingOutcome> outcomes;

  bool all_succeeded() const;
  size_t failure_count() const;
};

// Holds one TrainedModel per aircraft type. Readers copy the shared_ptr
// under a short lock and score without holding it; training publishes a new
// pointer, so in-flight analyses finish on the model they started with.
class ModelRegistry {
public:
  ModelRegistry(ProfileCatalog catalog, const Config::TrainingConfig &config,
                std::shared_ptr<const ITrainingDataGenerator> generator =
                    std::make_shared<SyntheticFlightGenerator>());

  // Trains the type on first use when lazy training is enabled. Throws
  // ModelUnavailable when it is disabled and TrainingFailure when lazy
  // training fails.
  std::shared_ptr<const TrainedModel> get_model(AircraftType type);

  // Current model or nullptr; never trains.
  std::shared_ptr<const TrainedModel> find_model(AircraftType type) const;

  TrainingOutcome train(AircraftType type,
                        const ITrainingDataGenerator &generator);
  TrainingReport train_all(const ITrainingDataGenerator &generator);
  TrainingReport train_all() { return train_all(*generator_); }

  // Publishes an externally built model, e.g. a deterministic stub.
  void install(AircraftType type, std::shared_ptr<const TrainedModel> model);

  void set_metrics(std::shared_ptr<AnalysisMetrics> metrics);

  const ProfileCatalog &catalog() const { return catalog_; }

private:
  TrainingOutcome train_locked(AircraftType type,
                               const ITrainingDataGenerator &generator);
  std::shared_ptr<const TrainedModel>
  fit_model(const AircraftProfile &profile,
            const ITrainingDataGenerator &generator) const;
  std::shared_ptr<const TrainedModel>
  make_fallback(const AircraftProfile &profile) const;

  ProfileCatalog catalog_;
  Config::TrainingConfig config_;
  std::shared_ptr<const ITrainingDataGenerator> generator_;
  std::shared_ptr<AnalysisMetrics> metrics_;

  std::map<AircraftType, std::shared_ptr<const TrainedModel>> models_;
  mutable std::mutex models_mutex_;
  // Serializes training so concurrent first requests train a type once
  std::mutex training_mutex_;
};

#endif // MODEL_REGISTRY_HPP
