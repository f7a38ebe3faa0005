#ifndef GRADIENT_BOOSTED_MODEL_HPP
#define GRADIENT_BOOSTED_MODEL_HPP

#include "models/base_model.hpp"
#include "models/decision_tree.hpp"

#include <cstddef>
#include <vector>

struct BoostingParams {
  size_t n_estimators = 100;
  size_t max_depth = 4;
  double learning_rate = 0.1;
  size_t min_samples_leaf = 5;
  size_t max_bins = 64;
  double l2_regularization = 1.0;
};

// Binary classifier trained with logistic loss. The margin is the base
// log-odds of the positive class prior plus the sum of all tree outputs.
class GradientBoostedModel : public IAnomalyModel {
public:
  GradientBoostedModel() = default;
  // Assembles a model from already built trees
  GradientBoostedModel(double base_score, std::vector<DecisionTree> trees);

  // labels: 1 = anomalous, 0 = normal. Throws std::invalid_argument on
  // inconsistent input.
  void fit(const std::vector<std::vector<double>> &rows,
           const std::vector<int> &labels, const BoostingParams &params);

  double predict_margin(const std::vector<double> &features) const override;
  std::vector<double>
  explain(const std::vector<double> &features) const override;
  double expected_value() const override { return expected_value_; }
  size_t tree_count() const override { return trees_.size(); }

  double base_score() const { return base_score_; }
  const std::vector<DecisionTree> &trees() const { return trees_; }

private:
  void refresh_expected_value();

  double base_score_ = 0.0;
  double expected_value_ = 0.0;
  size_t feature_count_ = 0;
  std::vector<DecisionTree> trees_;
};

#endif // GRADIENT_BOOSTED_MODEL_HPP
