#ifndef FLIGHT_LOG_HPP
#define FLIGHT_LOG_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Column-oriented flight telemetry table. Rows are ordered by timestamp
// (seconds). Column names are normalized on insertion; reading a column that
// does not exist, or a cell that is NaN/Inf, yields 0.
class FlightLog {
public:
  FlightLog() = default;
  explicit FlightLog(std::vector<double> timestamps_s);

  void set_column(std::string_view name, std::vector<double> values);

  // Appends one row. Columns absent from `values` get 0 for this row, and a
  // column seen for the first time is zero-filled for all earlier rows.
  void append_row(double timestamp_s,
                  const std::map<std::string, double> &values);

  size_t row_count() const { return timestamps_.size(); }
  bool empty() const { return timestamps_.empty(); }

  const std::vector<double> &timestamps() const { return timestamps_; }
  bool has_column(std::string_view name) const;
  std::vector<std::string> column_names() const;

  std::vector<double> column_or_zero(std::string_view name) const;
  double value(size_t row, std::string_view name) const;

  // Mean spacing between consecutive timestamps, or `fallback_s` when the
  // log has fewer than two rows or the timestamps do not advance.
  double mean_sample_interval(double fallback_s) const;

  // Describes the first structural problem (ragged columns, timestamps that
  // go backwards or are not finite); nullopt when the log is well formed.
  std::optional<std::string> structural_error() const;

private:
  std::vector<double> timestamps_;
  std::map<std::string, std::vector<double>> columns_;
};

#endif // FLIGHT_LOG_HPP
