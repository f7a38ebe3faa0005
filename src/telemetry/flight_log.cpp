#include "flight_log.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace {

double coerce(double value) { return std::isfinite(value) ? value : 0.0; }

} // namespace

FlightLog::FlightLog(std::vector<double> timestamps_s)
    : timestamps_(std::move(timestamps_s)) {}

void FlightLog::set_column(std::string_view name, std::vector<double> values) {
  columns_[Utils::normalize_column_name(name)] = std::move(values);
}

void FlightLog::append_row(double timestamp_s,
                           const std::map<std::string, double> &values) {
  const size_t previous_rows = timestamps_.size();
  timestamps_.push_back(timestamp_s);

  for (auto &column : columns_)
    column.second.resize(previous_rows, 0.0);

  for (const auto &entry : values) {
    auto &column = columns_[Utils::normalize_column_name(entry.first)];
    column.resize(previous_rows, 0.0);
    column.push_back(entry.second);
  }

  for (auto &column : columns_)
    column.second.resize(previous_rows + 1, 0.0);
}

bool FlightLog::has_column(std::string_view name) const {
  return columns_.count(Utils::normalize_column_name(name)) > 0;
}

std::vector<std::string> FlightLog::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto &column : columns_)
    names.push_back(column.first);
  return names;
}

std::vector<double> FlightLog::column_or_zero(std::string_view name) const {
  std::vector<double> out(timestamps_.size(), 0.0);
  auto it = columns_.find(Utils::normalize_column_name(name));
  if (it == columns_.end())
    return out;

  const auto &values = it->second;
  const size_t n = std::min(values.size(), out.size());
  for (size_t i = 0; i < n; ++i)
    out[i] = coerce(values[i]);
  return out;
}

double FlightLog::value(size_t row, std::string_view name) const {
  auto it = columns_.find(Utils::normalize_column_name(name));
  if (it == columns_.end() || row >= it->second.size())
    return 0.0;
  return coerce(it->second[row]);
}

double FlightLog::mean_sample_interval(double fallback_s) const {
  if (timestamps_.size() < 2)
    return fallback_s;
  const double span = timestamps_.back() - timestamps_.front();
  if (!std::isfinite(span) || span <= 0.0)
    return fallback_s;
  return span / static_cast<double>(timestamps_.size() - 1);
}

std::optional<std::string> FlightLog::structural_error() const {
  for (size_t i = 0; i < timestamps_.size(); ++i) {
    if (!std::isfinite(timestamps_[i])) {
      std::ostringstream oss;
      oss << "timestamp at row " << i << " is not a finite number";
      return oss.str();
    }
    if (i > 0 && timestamps_[i] < timestamps_[i - 1]) {
      std::ostringstream oss;
      oss << "timestamps are not ordered: row " << i << " (" << timestamps_[i]
          << ") precedes row " << i - 1 << " (" << timestamps_[i - 1] << ")";
      return oss.str();
    }
  }

  for (const auto &column : columns_) {
    if (column.second.size() != timestamps_.size()) {
      std::ostringstream oss;
      oss << "column '" << column.first << "' has " << column.second.size()
          << " values but the log has " << timestamps_.size() << " rows";
      return oss.str();
    }
  }
  return std::nullopt;
}
