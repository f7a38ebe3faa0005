#include "models/decision_tree.hpp"

#include <algorithm>
#include <functional>

BinnedDataset::BinnedDataset(const std::vector<std::vector<double>> &rows,
                             size_t max_bins) {
  const size_t n_rows = rows.size();
  const size_t n_features = rows.empty() ? 0 : rows.front().size();
  const size_t bins_limit = std::clamp<size_t>(max_bins, 2, 65535);

  cut_points_.resize(n_features);
  for (size_t f = 0; f < n_features; ++f) {
    std::vector<double> distinct;
    distinct.reserve(n_rows);
    for (const auto &row : rows)
      distinct.push_back(row[f]);
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()),
                   distinct.end());

    auto &cuts = cut_points_[f];
    const size_t m = distinct.size();
    if (m <= bins_limit) {
      for (size_t i = 0; i + 1 < m; ++i)
        cuts.push_back((distinct[i] + distinct[i + 1]) / 2.0);
    } else {
      // Quantiles over the distinct values
      for (size_t k = 1; k < bins_limit; ++k) {
        const size_t idx = k * m / bins_limit;
        const double cut = (distinct[idx - 1] + distinct[idx]) / 2.0;
        if (cuts.empty() || cut > cuts.back())
          cuts.push_back(cut);
      }
    }
  }

  bins_.assign(n_rows, std::vector<uint16_t>(n_features, 0));
  for (size_t r = 0; r < n_rows; ++r) {
    for (size_t f = 0; f < n_features; ++f) {
      const auto &cuts = cut_points_[f];
      bins_[r][f] = static_cast<uint16_t>(
          std::upper_bound(cuts.begin(), cuts.end(), rows[r][f]) -
          cuts.begin());
    }
  }
}

DecisionTree::DecisionTree(std::unique_ptr<Node> root)
    : root_(std::move(root)) {}

void DecisionTree::fit(const BinnedDataset &data,
                       const std::vector<double> &gradients,
                       const std::vector<double> &hessians,
                       const TreeParams &params) {
  std::vector<size_t> indices(data.row_count());
  for (size_t i = 0; i < indices.size(); ++i)
    indices[i] = i;
  root_ = build_recursive(data, gradients, hessians, indices, 0, params);
}

std::unique_ptr<Node> DecisionTree::build_recursive(
    const BinnedDataset &data, const std::vector<double> &gradients,
    const std::vector<double> &hessians, std::vector<size_t> &indices,
    size_t depth, const TreeParams &params) const {
  auto node = std::make_unique<Node>();
  node->cover = static_cast<double>(indices.size());

  double grad_sum = 0.0;
  double hess_sum = 0.0;
  for (size_t idx : indices) {
    grad_sum += gradients[idx];
    hess_sum += hessians[idx];
  }

  auto make_leaf = [&]() {
    node->is_leaf = true;
    node->prediction_value = -grad_sum /
                             (hess_sum + params.l2_regularization) *
                             params.shrinkage;
    return std::move(node);
  };

  if (depth >= params.max_depth ||
      indices.size() < 2 * std::max<size_t>(params.min_samples_leaf, 1))
    return make_leaf();

  const SplitCandidate best = find_best_split(data, gradients, hessians,
                                              indices, grad_sum, hess_sum,
                                              params);
  if (best.feature_index < 0)
    return make_leaf();

  const size_t feature = static_cast<size_t>(best.feature_index);
  std::vector<size_t> left_indices;
  std::vector<size_t> right_indices;
  for (size_t idx : indices) {
    if (data.bin(idx, feature) <= best.bin)
      left_indices.push_back(idx);
    else
      right_indices.push_back(idx);
  }

  node->feature_index = best.feature_index;
  node->split_value = data.cut_point(feature, best.bin);
  node->left_child = build_recursive(data, gradients, hessians, left_indices,
                                     depth + 1, params);
  node->right_child = build_recursive(data, gradients, hessians,
                                      right_indices, depth + 1, params);
  return node;
}

DecisionTree::SplitCandidate DecisionTree::find_best_split(
    const BinnedDataset &data, const std::vector<double> &gradients,
    const std::vector<double> &hessians, const std::vector<size_t> &indices,
    double grad_sum, double hess_sum, const TreeParams &params) const {
  const double lambda = params.l2_regularization;
  const double parent_score = grad_sum * grad_sum / (hess_sum + lambda);
  const size_t min_leaf = std::max<size_t>(params.min_samples_leaf, 1);

  SplitCandidate best;
  best.gain = params.min_split_gain;

  for (size_t f = 0; f < data.feature_count(); ++f) {
    const size_t n_bins = data.bin_count(f);
    if (n_bins < 2)
      continue;

    std::vector<double> bin_grad(n_bins, 0.0);
    std::vector<double> bin_hess(n_bins, 0.0);
    std::vector<size_t> bin_rows(n_bins, 0);
    for (size_t idx : indices) {
      const uint16_t b = data.bin(idx, f);
      bin_grad[b] += gradients[idx];
      bin_hess[b] += hessians[idx];
      ++bin_rows[b];
    }

    double left_grad = 0.0;
    double left_hess = 0.0;
    size_t left_rows = 0;
    // The last bin has no cut point above it
    for (size_t b = 0; b + 1 < n_bins; ++b) {
      left_grad += bin_grad[b];
      left_hess += bin_hess[b];
      left_rows += bin_rows[b];
      const size_t right_rows = indices.size() - left_rows;
      if (left_rows < min_leaf)
        continue;
      if (right_rows < min_leaf)
        break;

      const double right_grad = grad_sum - left_grad;
      const double right_hess = hess_sum - left_hess;
      const double gain = left_grad * left_grad / (left_hess + lambda) +
                          right_grad * right_grad / (right_hess + lambda) -
                          parent_score;
      if (gain > best.gain) {
        best.feature_index = static_cast<int>(f);
        best.bin = b;
        best.gain = gain;
      }
    }
  }
  return best;
}

double DecisionTree::predict(const std::vector<double> &features) const {
  if (!root_)
    return 0.0;
  return predict_recursive(root_.get(), features);
}

double
DecisionTree::predict_recursive(const Node *node,
                                const std::vector<double> &features) const {
  if (node->is_leaf)
    return node->prediction_value;

  // Bounds check to prevent crashes if the feature vector is malformed.
  if (node->feature_index < 0 ||
      static_cast<size_t>(node->feature_index) >= features.size())
    return 0.0;

  if (features[node->feature_index] < node->split_value)
    return predict_recursive(node->left_child.get(), features);
  else
    return predict_recursive(node->right_child.get(), features);
}

double DecisionTree::expected_value() const {
  std::function<double(const Node *)> visit = [&](const Node *node) {
    if (node->is_leaf)
      return node->prediction_value;
    const double left_cover = node->left_child->cover;
    const double right_cover = node->right_child->cover;
    const double total = left_cover + right_cover;
    if (total <= 0.0)
      return 0.5 * (visit(node->left_child.get()) +
                    visit(node->right_child.get()));
    return (visit(node->left_child.get()) * left_cover +
            visit(node->right_child.get()) * right_cover) /
           total;
  };
  return root_ ? visit(root_.get()) : 0.0;
}

size_t DecisionTree::depth() const {
  std::function<size_t(const Node *)> visit = [&](const Node *node) -> size_t {
    if (node == nullptr || node->is_leaf)
      return 0;
    return 1 + std::max(visit(node->left_child.get()),
                        visit(node->right_child.get()));
  };
  return visit(root_.get());
}

size_t DecisionTree::leaf_count() const {
  std::function<size_t(const Node *)> visit = [&](const Node *node) -> size_t {
    if (node == nullptr)
      return 0;
    if (node->is_leaf)
      return 1;
    return visit(node->left_child.get()) + visit(node->right_child.get());
  };
  return visit(root_.get());
}
