#include "models/base_model.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr double PROBABILITY_EPSILON = 1e-6;
}

double IAnomalyModel::predict_probability(
    const std::vector<double> &features) const {
  return sigmoid(predict_margin(features));
}

double sigmoid(double margin) {
  if (margin >= 0.0)
    return 1.0 / (1.0 + std::exp(-margin));
  const double z = std::exp(margin);
  return z / (1.0 + z);
}

double logit(double probability) {
  const double p =
      std::clamp(probability, PROBABILITY_EPSILON, 1.0 - PROBABILITY_EPSILON);
  return std::log(p / (1.0 - p));
}
