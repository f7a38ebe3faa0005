#include "models/standard_scaler.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

StandardScaler::StandardScaler(std::vector<double> means,
                               std::vector<double> scales)
    : means_(std::move(means)), scales_(std::move(scales)) {
  if (means_.size() != scales_.size())
    throw std::invalid_argument("StandardScaler: means and scales differ in size");
}

void StandardScaler::fit(const std::vector<std::vector<double>> &rows) {
  if (rows.empty())
    throw std::invalid_argument("StandardScaler: cannot fit on zero rows");

  const size_t n_features = rows.front().size();
  means_.assign(n_features, 0.0);
  scales_.assign(n_features, 1.0);

  for (const auto &row : rows) {
    for (size_t f = 0; f < n_features; ++f)
      means_[f] += row[f];
  }
  for (auto &m : means_)
    m /= static_cast<double>(rows.size());

  std::vector<double> sq_sum(n_features, 0.0);
  for (const auto &row : rows) {
    for (size_t f = 0; f < n_features; ++f) {
      const double d = row[f] - means_[f];
      sq_sum[f] += d * d;
    }
  }
  for (size_t f = 0; f < n_features; ++f) {
    const double stddev = std::sqrt(sq_sum[f] / rows.size());
    scales_[f] = stddev > 0.0 ? stddev : 1.0;
  }
}

std::vector<double>
StandardScaler::transform(const std::vector<double> &row) const {
  if (row.size() != means_.size()) {
    throw std::invalid_argument("StandardScaler: expected " +
                                std::to_string(means_.size()) +
                                " features, got " + std::to_string(row.size()));
  }
  std::vector<double> out(row.size());
  for (size_t f = 0; f < row.size(); ++f)
    out[f] = (row[f] - means_[f]) / scales_[f];
  return out;
}

std::vector<std::vector<double>>
StandardScaler::transform(const std::vector<std::vector<double>> &rows) const {
  std::vector<std::vector<double>> out;
  out.reserve(rows.size());
  for (const auto &row : rows)
    out.push_back(transform(row));
  return out;
}
