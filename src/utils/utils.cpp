#include "utils.hpp"

#include <cmath>
#include <cstddef>
#include <numeric>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::string normalize_column_name(std::string_view raw_name) {
  std::string name = to_lower_copy(trim_copy(raw_name));
  std::string normalized;
  normalized.reserve(name.size());

  bool previous_was_space = false;
  for (char c : name) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!previous_was_space)
        normalized.push_back('_');
      previous_was_space = true;
    } else {
      normalized.push_back(c);
      previous_was_space = false;
    }
  }
  return normalized;
}

bool contains_substring(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double population_stddev(const std::vector<double> &values) {
  if (values.size() < 2)
    return 0.0;
  const double mu = mean(values);
  double sum_sq = 0.0;
  for (double v : values)
    sum_sq += (v - mu) * (v - mu);
  return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double sample_stddev(const std::vector<double> &values) {
  if (values.size() < 2)
    return 0.0;
  const double mu = mean(values);
  double sum_sq = 0.0;
  for (double v : values)
    sum_sq += (v - mu) * (v - mu);
  return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

} // namespace Utils
