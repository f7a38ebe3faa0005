#ifndef TRAINED_MODEL_HPP
#define TRAINED_MODEL_HPP

#include "aircraft/aircraft_type.hpp"
#include "models/base_model.hpp"
#include "models/standard_scaler.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Everything needed to score one aircraft type. Published by the registry
// as shared_ptr<const TrainedModel> and never modified afterwards.
struct TrainedModel {
  AircraftType type = AircraftType::MULTIROTOR;
  std::vector<std::string> feature_names;
  StandardScaler scaler;
  std::shared_ptr<const IAnomalyModel> classifier;
  bool degraded = false;
  std::chrono::system_clock::time_point trained_at =
      std::chrono::system_clock::now();

  std::vector<double> scale(const std::vector<double> &row) const {
    return scaler.is_fitted() ? scaler.transform(row) : row;
  }
};

#endif // TRAINED_MODEL_HPP
