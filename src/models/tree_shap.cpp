#include "models/tree_shap.hpp"

#include <algorithm>

namespace TreeShap {
namespace {

struct PathElement {
  int feature_index = -1;
  double zero_fraction = 0.0;
  double one_fraction = 0.0;
  double pweight = 0.0;
};

void extend_path(PathElement *unique_path, unsigned unique_depth,
                 double zero_fraction, double one_fraction,
                 int feature_index) {
  unique_path[unique_depth].feature_index = feature_index;
  unique_path[unique_depth].zero_fraction = zero_fraction;
  unique_path[unique_depth].one_fraction = one_fraction;
  unique_path[unique_depth].pweight = (unique_depth == 0 ? 1.0 : 0.0);
  for (int i = static_cast<int>(unique_depth) - 1; i >= 0; --i) {
    unique_path[i + 1].pweight += one_fraction * unique_path[i].pweight *
                                  (i + 1) /
                                  static_cast<double>(unique_depth + 1);
    unique_path[i].pweight = zero_fraction * unique_path[i].pweight *
                             (unique_depth - i) /
                             static_cast<double>(unique_depth + 1);
  }
}

// Undoes a previous extension of the path with the element at path_index
void unwind_path(PathElement *unique_path, unsigned unique_depth,
                 unsigned path_index) {
  const double one_fraction = unique_path[path_index].one_fraction;
  const double zero_fraction = unique_path[path_index].zero_fraction;
  double next_one_portion = unique_path[unique_depth].pweight;

  for (int i = static_cast<int>(unique_depth) - 1; i >= 0; --i) {
    if (one_fraction != 0.0) {
      const double tmp = unique_path[i].pweight;
      unique_path[i].pweight = next_one_portion * (unique_depth + 1) /
                               static_cast<double>((i + 1) * one_fraction);
      next_one_portion = tmp - unique_path[i].pweight * zero_fraction *
                                   (unique_depth - i) /
                                   static_cast<double>(unique_depth + 1);
    } else {
      unique_path[i].pweight =
          (unique_path[i].pweight * (unique_depth + 1)) /
          static_cast<double>(zero_fraction * (unique_depth - i));
    }
  }

  for (unsigned i = path_index; i < unique_depth; ++i) {
    unique_path[i].feature_index = unique_path[i + 1].feature_index;
    unique_path[i].zero_fraction = unique_path[i + 1].zero_fraction;
    unique_path[i].one_fraction = unique_path[i + 1].one_fraction;
  }
}

// Total permutation weight the path would have if the element at path_index
// were unwound, without modifying the path
double unwound_path_sum(const PathElement *unique_path, unsigned unique_depth,
                        unsigned path_index) {
  const double one_fraction = unique_path[path_index].one_fraction;
  const double zero_fraction = unique_path[path_index].zero_fraction;
  double next_one_portion = unique_path[unique_depth].pweight;
  double total = 0.0;

  for (int i = static_cast<int>(unique_depth) - 1; i >= 0; --i) {
    if (one_fraction != 0.0) {
      const double tmp = next_one_portion * (unique_depth + 1) /
                         static_cast<double>((i + 1) * one_fraction);
      total += tmp;
      next_one_portion =
          unique_path[i].pweight -
          tmp * zero_fraction *
              ((unique_depth - i) / static_cast<double>(unique_depth + 1));
    } else if (zero_fraction != 0.0) {
      total += (unique_path[i].pweight / zero_fraction) /
               ((unique_depth - i) / static_cast<double>(unique_depth + 1));
    }
  }
  return total;
}

void recurse(const Node *node, const std::vector<double> &features,
             std::vector<double> &phi, unsigned unique_depth,
             PathElement *parent_unique_path, double parent_zero_fraction,
             double parent_one_fraction, int parent_feature_index) {
  PathElement *unique_path = parent_unique_path + unique_depth + 1;
  std::copy(parent_unique_path, parent_unique_path + unique_depth + 1,
            unique_path);
  extend_path(unique_path, unique_depth, parent_zero_fraction,
              parent_one_fraction, parent_feature_index);

  if (node->is_leaf) {
    for (unsigned i = 1; i <= unique_depth; ++i) {
      const double weight = unwound_path_sum(unique_path, unique_depth, i);
      const PathElement &el = unique_path[i];
      phi[el.feature_index] +=
          weight * (el.one_fraction - el.zero_fraction) * node->prediction_value;
    }
    return;
  }

  const int split_index = node->feature_index;
  const bool go_left =
      split_index >= 0 && static_cast<size_t>(split_index) < features.size() &&
      features[split_index] < node->split_value;
  const Node *hot = go_left ? node->left_child.get() : node->right_child.get();
  const Node *cold = go_left ? node->right_child.get() : node->left_child.get();

  const double w = node->cover;
  const double hot_zero_fraction = w > 0.0 ? hot->cover / w : 0.5;
  const double cold_zero_fraction = w > 0.0 ? cold->cover / w : 0.5;
  double incoming_zero_fraction = 1.0;
  double incoming_one_fraction = 1.0;

  // A feature split on twice along the path keeps a single path element
  unsigned path_index = 0;
  for (; path_index <= unique_depth; ++path_index) {
    if (unique_path[path_index].feature_index == split_index)
      break;
  }
  if (path_index != unique_depth + 1) {
    incoming_zero_fraction = unique_path[path_index].zero_fraction;
    incoming_one_fraction = unique_path[path_index].one_fraction;
    unwind_path(unique_path, unique_depth, path_index);
    unique_depth -= 1;
  }

  recurse(hot, features, phi, unique_depth + 1, unique_path,
          hot_zero_fraction * incoming_zero_fraction, incoming_one_fraction,
          split_index);
  recurse(cold, features, phi, unique_depth + 1, unique_path,
          cold_zero_fraction * incoming_zero_fraction, 0.0, split_index);
}

} // namespace

void accumulate(const DecisionTree &tree, const std::vector<double> &features,
                std::vector<double> &phi) {
  const Node *root = tree.root();
  if (root == nullptr || root->is_leaf)
    return;

  const size_t max_depth = tree.depth() + 2;
  std::vector<PathElement> path_buffer((max_depth * (max_depth + 1)) / 2);
  recurse(root, features, phi, 0, path_buffer.data(), 1.0, 1.0, -1);
}

} // namespace TreeShap
