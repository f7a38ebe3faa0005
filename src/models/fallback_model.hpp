#ifndef FALLBACK_MODEL_HPP
#define FALLBACK_MODEL_HPP

#include "models/base_model.hpp"

// Stand-in for an aircraft type whose training failed: scores every row with
// the same low prior and attributes nothing to any feature.
class FallbackModel : public IAnomalyModel {
public:
  explicit FallbackModel(double probability);

  double predict_margin(const std::vector<double> &features) const override;
  double predict_probability(const std::vector<double> &features) const override;
  std::vector<double>
  explain(const std::vector<double> &features) const override;
  double expected_value() const override { return margin_; }
  size_t tree_count() const override { return 0; }
  bool is_degraded() const override { return true; }

private:
  double probability_;
  double margin_;
};

#endif // FALLBACK_MODEL_HPP
