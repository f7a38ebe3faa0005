#ifndef TREE_SHAP_HPP
#define TREE_SHAP_HPP

#include "models/decision_tree.hpp"

#include <vector>

namespace TreeShap {

// Adds the exact path-dependent SHAP values of `tree` at `features` into
// `phi` (one slot per feature). Node covers act as the background
// distribution, so sum(phi) == tree.predict(features) - tree.expected_value().
void accumulate(const DecisionTree &tree, const std::vector<double> &features,
                std::vector<double> &phi);

} // namespace TreeShap

#endif // TREE_SHAP_HPP
