#ifndef STANDARD_SCALER_HPP
#define STANDARD_SCALER_HPP

#include <cstddef>
#include <vector>

// Per-feature standardization (x - mean) / stddev. Constant features keep a
// unit scale so they map to 0.
class StandardScaler {
public:
  StandardScaler() = default;
  StandardScaler(std::vector<double> means, std::vector<double> scales);

  void fit(const std::vector<std::vector<double>> &rows);

  std::vector<double> transform(const std::vector<double> &row) const;
  std::vector<std::vector<double>>
  transform(const std::vector<std::vector<double>> &rows) const;

  bool is_fitted() const { return !means_.empty(); }
  size_t feature_count() const { return means_.size(); }
  const std::vector<double> &means() const { return means_; }
  const std::vector<double> &scales() const { return scales_; }

private:
  std::vector<double> means_;
  std::vector<double> scales_;
};

#endif // STANDARD_SCALER_HPP
