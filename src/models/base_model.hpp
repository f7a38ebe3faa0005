#ifndef BASE_MODEL_HPP
#define BASE_MODEL_HPP

#include <cstddef>
#include <vector>

// Abstract base class for the per-aircraft binary anomaly classifiers.
// Inputs are rows already transformed by the model's scaler.
class IAnomalyModel {
public:
  virtual ~IAnomalyModel() = default;

  // Raw score in log-odds space
  virtual double predict_margin(const std::vector<double> &features) const = 0;

  // Per-feature attribution of the margin. The attributions plus
  // expected_value() sum to predict_margin(features).
  virtual std::vector<double>
  explain(const std::vector<double> &features) const = 0;

  // Margin of the average training row
  virtual double expected_value() const = 0;

  virtual size_t tree_count() const = 0;

  virtual bool is_degraded() const { return false; }

  // Positive-class (anomalous) probability.
  virtual double predict_probability(const std::vector<double> &features) const;
};

double sigmoid(double margin);
double logit(double probability);

#endif // BASE_MODEL_HPP
