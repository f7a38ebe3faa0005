#include "models/gradient_boosted_model.hpp"
#include "core/logger.hpp"
#include "models/tree_shap.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

GradientBoostedModel::GradientBoostedModel(double base_score,
                                           std::vector<DecisionTree> trees)
    : base_score_(base_score), trees_(std::move(trees)) {
  for (const auto &tree : trees_) {
    std::function<void(const Node *)> visit = [&](const Node *node) {
      if (node == nullptr || node->is_leaf)
        return;
      feature_count_ = std::max(feature_count_,
                                static_cast<size_t>(node->feature_index) + 1);
      visit(node->left_child.get());
      visit(node->right_child.get());
    };
    visit(tree.root());
  }
  refresh_expected_value();
}

void GradientBoostedModel::fit(const std::vector<std::vector<double>> &rows,
                               const std::vector<int> &labels,
                               const BoostingParams &params) {
  if (rows.empty())
    throw std::invalid_argument("cannot fit a boosted model on zero rows");
  if (rows.size() != labels.size())
    throw std::invalid_argument("row and label counts differ");

  feature_count_ = rows.front().size();
  const size_t n = rows.size();

  double positives = 0.0;
  for (int label : labels)
    positives += label != 0 ? 1.0 : 0.0;
  base_score_ = logit(positives / static_cast<double>(n));

  BinnedDataset data(rows, params.max_bins);
  TreeParams tree_params;
  tree_params.max_depth = params.max_depth;
  tree_params.min_samples_leaf = params.min_samples_leaf;
  tree_params.l2_regularization = params.l2_regularization;
  tree_params.shrinkage = params.learning_rate;

  std::vector<double> margins(n, base_score_);
  std::vector<double> gradients(n, 0.0);
  std::vector<double> hessians(n, 0.0);

  trees_.clear();
  trees_.reserve(params.n_estimators);
  for (size_t round = 0; round < params.n_estimators; ++round) {
    for (size_t i = 0; i < n; ++i) {
      const double p = sigmoid(margins[i]);
      gradients[i] = p - (labels[i] != 0 ? 1.0 : 0.0);
      hessians[i] = std::max(p * (1.0 - p), 1e-12);
    }

    DecisionTree tree;
    tree.fit(data, gradients, hessians, tree_params);
    for (size_t i = 0; i < n; ++i)
      margins[i] += tree.predict(rows[i]);
    trees_.push_back(std::move(tree));
  }

  double log_loss = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double p = std::clamp(sigmoid(margins[i]), 1e-12, 1.0 - 1e-12);
    log_loss -= labels[i] != 0 ? std::log(p) : std::log(1.0 - p);
  }
  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Boosting finished: trees=" << trees_.size() << " base_score="
                                  << base_score_ << " train_logloss="
                                  << log_loss / static_cast<double>(n));

  refresh_expected_value();
}

double
GradientBoostedModel::predict_margin(const std::vector<double> &features) const {
  double margin = base_score_;
  for (const auto &tree : trees_)
    margin += tree.predict(features);
  return margin;
}

std::vector<double>
GradientBoostedModel::explain(const std::vector<double> &features) const {
  std::vector<double> phi(std::max(features.size(), feature_count_), 0.0);
  for (const auto &tree : trees_)
    TreeShap::accumulate(tree, features, phi);
  phi.resize(features.size());
  return phi;
}

void GradientBoostedModel::refresh_expected_value() {
  expected_value_ = base_score_;
  for (const auto &tree : trees_)
    expected_value_ += tree.expected_value();
}
