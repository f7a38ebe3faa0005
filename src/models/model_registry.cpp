#include "models/model_registry.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "models/fallback_model.hpp"
#include "models/gradient_boosted_model.hpp"
#include "utils/scoped_timer.hpp"

#include <cmath>
#include <stdexcept>

std::string error_kind_to_string(TrainingOutcome::ErrorKind kind) {
  switch (kind) {
  case TrainingOutcome::ErrorKind::NONE:
    return "none";
  case TrainingOutcome::ErrorKind::INVALID_TRAINING_DATA:
    return "invalid_training_data";
  case TrainingOutcome::ErrorKind::TRAINING_FAILURE:
    return "training_failure";
  }
  return "unknown";
}

bool TrainingReport::all_succeeded() const { return failure_count() == 0; }

size_t TrainingReport::failure_count() const {
  size_t failures = 0;
  for (const auto &outcome : outcomes) {
    if (!outcome.success)
      ++failures;
  }
  return failures;
}

ModelRegistry::ModelRegistry(
    ProfileCatalog catalog, const Config::TrainingConfig &config,
    std::shared_ptr<const ITrainingDataGenerator> generator)
    : catalog_(std::move(catalog)), config_(config),
      generator_(std::move(generator)) {
  if (!generator_)
    generator_ = std::make_shared<SyntheticFlightGenerator>();
  LOG(LogLevel::INFO, LogComponent::ML_REGISTRY,
      "ModelRegistry created (lazy training "
          << (config_.lazy_training_enabled ? "enabled" : "disabled") << ").");
}

void ModelRegistry::set_metrics(std::shared_ptr<AnalysisMetrics> metrics) {
  metrics_ = std::move(metrics);
}

std::shared_ptr<const TrainedModel>
ModelRegistry::find_model(AircraftType type) const {
  std::lock_guard<std::mutex> lock(models_mutex_);
  auto it = models_.find(type);
  return it == models_.end() ? nullptr : it->second;
}

std::shared_ptr<const TrainedModel>
ModelRegistry::get_model(AircraftType type) {
  if (auto model = find_model(type))
    return model;

  const std::string type_name = aircraft_type_to_string(type);
  if (!config_.lazy_training_enabled) {
    LOG(LogLevel::ERROR, LogComponent::ML_REGISTRY,
        "No model for " << type_name << " and lazy training is disabled.");
    throw ModelUnavailable("no trained model for aircraft type " + type_name);
  }

  std::lock_guard<std::mutex> training_lock(training_mutex_);
  // Another caller may have trained it while we waited
  if (auto model = find_model(type))
    return model;

  LOG(LogLevel::INFO, LogComponent::ML_REGISTRY,
      "Lazily training model for " << type_name << ".");
  const TrainingOutcome outcome = train_locked(type, *generator_);
  if (!outcome.success) {
    throw TrainingFailure("lazy training of " + type_name + " failed (" +
                          error_kind_to_string(outcome.error_kind) +
                          "): " + outcome.message);
  }
  return find_model(type);
}

TrainingOutcome ModelRegistry::train(AircraftType type,
                                     const ITrainingDataGenerator &generator) {
  std::lock_guard<std::mutex> training_lock(training_mutex_);
  return train_locked(type, generator);
}

TrainingReport
ModelRegistry::train_all(const ITrainingDataGenerator &generator) {
  TrainingReport report;
  std::lock_guard<std::mutex> training_lock(training_mutex_);
  for (AircraftType type : ALL_AIRCRAFT_TYPES)
    report.outcomes.push_back(train_locked(type, generator));

  LOG(LogLevel::INFO, LogComponent::ML_REGISTRY,
      "Training finished: " << report.outcomes.size() - report.failure_count()
                            << " of " << report.outcomes.size()
                            << " aircraft types trained.");
  return report;
}

void ModelRegistry::install(AircraftType type,
                            std::shared_ptr<const TrainedModel> model) {
  if (!model || !model->classifier)
    throw std::invalid_argument("cannot install an empty model");

  std::lock_guard<std::mutex> lock(models_mutex_);
  models_[type] = std::move(model);
  LOG(LogLevel::INFO, LogComponent::ML_REGISTRY,
      "Model for " << aircraft_type_to_string(type) << " installed.");
}

TrainingOutcome
ModelRegistry::train_locked(AircraftType type,
                            const ITrainingDataGenerator &generator) {
  TrainingOutcome outcome;
  outcome.type = type;
  const AircraftProfile &profile = catalog_.profile(type);

  ScopedTimer timer(metrics_ ? &metrics_->training_latency() : nullptr);
  try {
    auto model = fit_model(profile, generator);
    {
      std::lock_guard<std::mutex> lock(models_mutex_);
      models_[type] = std::move(model);
    }
    outcome.success = true;
  } catch (const std::invalid_argument &e) {
    outcome.error_kind = TrainingOutcome::ErrorKind::INVALID_TRAINING_DATA;
    outcome.message = e.what();
  } catch (const std::exception &e) {
    outcome.error_kind = TrainingOutcome::ErrorKind::TRAINING_FAILURE;
    outcome.message = e.what();
  }
  outcome.duration_ms = timer.elapsed_ms();

  if (metrics_)
    metrics_->record_training(type, outcome.success);

  if (outcome.success) {
    LOG(LogLevel::INFO, LogComponent::ML_TRAINING,
        "Trained " << profile.name() << " model in " << outcome.duration_ms
                   << " ms.");
    return outcome;
  }

  std::lock_guard<std::mutex> lock(models_mutex_);
  auto it = models_.find(type);
  if (it != models_.end() && it->second) {
    // The previously published snapshot stays in service
    LOG(LogLevel::ERROR, LogComponent::ML_TRAINING,
        "Training " << profile.name() << " failed ("
                    << error_kind_to_string(outcome.error_kind)
                    << "): " << outcome.message
                    << ". Keeping the current model.");
    return outcome;
  }

  LOG(LogLevel::ERROR, LogComponent::ML_TRAINING,
      "Training " << profile.name() << " failed ("
                  << error_kind_to_string(outcome.error_kind)
                  << "): " << outcome.message
                  << ". Installing degraded fallback model.");
  models_[type] = make_fallback(profile);
  return outcome;
}

std::shared_ptr<const TrainedModel>
ModelRegistry::fit_model(const AircraftProfile &profile,
                         const ITrainingDataGenerator &generator) const {
  const uint64_t seed =
      config_.seed + static_cast<uint64_t>(profile.type());
  TrainingSet set = generator.generate_training_set(
      profile, config_.training_samples, config_.anomaly_fraction, seed);

  if (set.features.empty())
    throw std::invalid_argument("generator returned no training rows");
  if (set.features.size() != set.labels.size())
    throw std::invalid_argument("generator returned mismatched labels");

  size_t positives = 0;
  for (size_t i = 0; i < set.features.size(); ++i) {
    const auto &row = set.features[i];
    if (row.size() != profile.feature_count()) {
      throw std::invalid_argument(
          "training row " + std::to_string(i) + " has " +
          std::to_string(row.size()) + " features, expected " +
          std::to_string(profile.feature_count()));
    }
    for (double v : row) {
      if (!std::isfinite(v))
        throw std::invalid_argument("training row " + std::to_string(i) +
                                    " holds a non-finite value");
    }
    if (set.labels[i] != 0)
      ++positives;
  }
  if (positives == 0 || positives == set.labels.size())
    throw std::invalid_argument("training labels contain a single class");

  auto trained = std::make_shared<TrainedModel>();
  trained->type = profile.type();
  trained->feature_names = profile.feature_names();
  trained->scaler.fit(set.features);

  BoostingParams params;
  params.n_estimators = config_.n_estimators;
  params.max_depth = config_.max_depth;
  params.learning_rate = config_.learning_rate;
  params.min_samples_leaf = config_.min_samples_leaf;
  params.max_bins = config_.max_bins;

  auto classifier = std::make_shared<GradientBoostedModel>();
  classifier->fit(trained->scaler.transform(set.features), set.labels, params);
  if (classifier->tree_count() == 0)
    throw TrainingFailure("boosting produced no trees");

  trained->classifier = std::move(classifier);
  trained->degraded = false;
  return trained;
}

std::shared_ptr<const TrainedModel>
ModelRegistry::make_fallback(const AircraftProfile &profile) const {
  auto fallback = std::make_shared<TrainedModel>();
  fallback->type = profile.type();
  fallback->feature_names = profile.feature_names();
  fallback->classifier =
      std::make_shared<FallbackModel>(config_.fallback_probability);
  fallback->degraded = true;
  return fallback;
}
