#ifndef DECISION_TREE_HPP
#define DECISION_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct Node {
  int feature_index = -1;   // Which feature from the vector to check
  double split_value = 0.0; // Rows with feature < split_value go left
  std::unique_ptr<Node> left_child;
  std::unique_ptr<Node> right_child;

  bool is_leaf = false;
  double prediction_value = 0.0;

  // Number of training rows that reached this node
  double cover = 0.0;
};

// Training rows quantized per feature. bins[row][feature] is the number of
// cut points at or below the raw value, so "bin <= b" is equivalent to
// "value < cut_points[feature][b]".
class BinnedDataset {
public:
  BinnedDataset(const std::vector<std::vector<double>> &rows, size_t max_bins);

  size_t row_count() const { return bins_.size(); }
  size_t feature_count() const { return cut_points_.size(); }
  size_t bin_count(size_t feature) const {
    return cut_points_[feature].size() + 1;
  }

  uint16_t bin(size_t row, size_t feature) const { return bins_[row][feature]; }
  double cut_point(size_t feature, size_t index) const {
    return cut_points_[feature][index];
  }

private:
  std::vector<std::vector<double>> cut_points_;
  std::vector<std::vector<uint16_t>> bins_;
};

struct TreeParams {
  size_t max_depth = 4;
  size_t min_samples_leaf = 5;
  double l2_regularization = 1.0;
  double min_split_gain = 1e-9;
  // Applied to every leaf value
  double shrinkage = 1.0;
};

// Regression tree fitted to first and second order gradients (Newton
// boosting). Leaves hold -G / (H + lambda) scaled by the shrinkage.
class DecisionTree {
public:
  DecisionTree() = default;
  explicit DecisionTree(std::unique_ptr<Node> root);

  void fit(const BinnedDataset &data, const std::vector<double> &gradients,
           const std::vector<double> &hessians, const TreeParams &params);

  double predict(const std::vector<double> &features) const;

  // Cover-weighted mean of the leaf values
  double expected_value() const;

  const Node *root() const { return root_.get(); }
  size_t depth() const;
  size_t leaf_count() const;

private:
  struct SplitCandidate {
    int feature_index = -1;
    size_t bin = 0;
    double gain = 0.0;
  };

  std::unique_ptr<Node> build_recursive(const BinnedDataset &data,
                                        const std::vector<double> &gradients,
                                        const std::vector<double> &hessians,
                                        std::vector<size_t> &indices,
                                        size_t depth,
                                        const TreeParams &params) const;

  SplitCandidate find_best_split(const BinnedDataset &data,
                                 const std::vector<double> &gradients,
                                 const std::vector<double> &hessians,
                                 const std::vector<size_t> &indices,
                                 double grad_sum, double hess_sum,
                                 const TreeParams &params) const;

  double predict_recursive(const Node *node,
                           const std::vector<double> &features) const;

  std::unique_ptr<Node> root_;
};

#endif // DECISION_TREE_HPP
