#include "models/fallback_model.hpp"

#include <algorithm>

FallbackModel::FallbackModel(double probability)
    : probability_(std::clamp(probability, 0.0, 1.0)),
      margin_(logit(probability_)) {}

double FallbackModel::predict_margin(const std::vector<double> &) const {
  return margin_;
}

double FallbackModel::predict_probability(const std::vector<double> &) const {
  return probability_;
}

std::vector<double>
FallbackModel::explain(const std::vector<double> &features) const {
  return std::vector<double>(features.size(), 0.0);
}
