#include "analysis/explainability_engine.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

constexpr const char *NO_SIGNIFICANT_FEATURES = "No significant features found";

// "battery_voltage" -> "Battery Voltage"
std::string title_case(const std::string &feature) {
  std::string out;
  bool start_of_word = true;
  for (char c : feature) {
    if (c == '_') {
      out.push_back(' ');
      start_of_word = true;
    } else {
      out.push_back(start_of_word ? static_cast<char>(std::toupper(
                                        static_cast<unsigned char>(c)))
                                  : c);
      start_of_word = false;
    }
  }
  return out;
}

std::string interpret(AircraftType type, const FeatureImportance &importance,
                      double significant_importance) {
  const std::string &f = importance.feature;
  const bool significant = importance.mean_abs_attribution > significant_importance;
  auto has = [&f](const char *needle) {
    return Utils::contains_substring(f, needle);
  };

  switch (type) {
  case AircraftType::FIXED_WING:
    if (has("airspeed"))
      return "Airspeed variations significantly impact flight safety";
    if (has("motor") || has("engine"))
      return "Engine performance is a critical factor";
    if (has("elevator") || has("aileron") || has("rudder"))
      return "Control surface deflections indicate flight dynamics issues";
    if (significant)
      return title_case(f) + " shows significant impact on fixed-wing performance";
    break;
  case AircraftType::MULTIROTOR:
    if (has("motor"))
      return "Motor performance asymmetry detected";
    if (has("vibration"))
      return "Vibration levels indicate mechanical issues";
    if (has("pitch") || has("roll"))
      return "Attitude control instability detected";
    if (significant)
      return title_case(f) + " shows significant impact on multirotor stability";
    break;
  case AircraftType::VTOL:
    if (has("transition"))
      return "Transition mode operations affecting flight safety";
    if (has("motor_5"))
      return "Forward propulsion system performance critical";
    if (significant)
      return title_case(f) + " significantly impacts VTOL operations";
    break;
  }
  return "";
}

} // namespace

ExplainabilityEngine::ExplainabilityEngine(
    ModelRegistry &registry, const FeatureExtractor &extractor,
    const Config::ExplainabilityConfig &config)
    : registry_(registry), extractor_(extractor), config_(config) {}

std::vector<size_t> ExplainabilityEngine::sample_rows(size_t row_count,
                                                      size_t sample_size) {
  std::vector<size_t> rows;
  if (row_count == 0 || sample_size == 0)
    return rows;
  if (row_count <= sample_size) {
    rows.resize(row_count);
    for (size_t i = 0; i < row_count; ++i)
      rows[i] = i;
    return rows;
  }
  rows.reserve(sample_size);
  for (size_t i = 0; i < sample_size; ++i)
    rows.push_back(i * row_count / sample_size);
  return rows;
}

Explanation ExplainabilityEngine::explain(const FlightLog &log,
                                          AircraftType type) const {
  auto model = registry_.get_model(type);
  const auto &profile = registry_.catalog().profile(type);
  return explain(extractor_.build_matrix(log, profile), *model);
}

Explanation ExplainabilityEngine::explain(const FeatureMatrix &matrix,
                                          const TrainedModel &model) const {
  Explanation explanation;
  explanation.expected_value = model.classifier->expected_value();
  explanation.summary = NO_SIGNIFICANT_FEATURES;

  const auto sampled = sample_rows(matrix.size(), config_.sample_size);
  explanation.sample_size = sampled.size();
  if (sampled.empty() || model.classifier->tree_count() == 0) {
    LOG(LogLevel::DEBUG, LogComponent::EXPLAIN,
        "Degenerate explanation for " << aircraft_type_to_string(model.type)
                                      << ": " << sampled.size()
                                      << " rows, "
                                      << model.classifier->tree_count()
                                      << " trees.");
    return explanation;
  }

  const size_t n_features = model.feature_names.size();
  std::vector<double> abs_sum(n_features, 0.0);
  std::vector<double> signed_sum(n_features, 0.0);
  std::vector<double> value_sum(n_features, 0.0);

  for (size_t row : sampled) {
    const auto phi = model.classifier->explain(model.scale(matrix[row]));
    for (size_t f = 0; f < n_features && f < phi.size(); ++f) {
      abs_sum[f] += std::abs(phi[f]);
      signed_sum[f] += phi[f];
      value_sum[f] += matrix[row][f];
    }
  }

  const double n = static_cast<double>(sampled.size());
  std::vector<FeatureImportance> importances;
  for (size_t f = 0; f < n_features; ++f) {
    const double mean_abs = abs_sum[f] / n;
    explanation.overall_impact += mean_abs;
    if (mean_abs <= 0.0)
      continue;
    importances.push_back(
        {model.feature_names[f], mean_abs, signed_sum[f] / n, value_sum[f] / n});
  }

  if (importances.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::EXPLAIN,
        "All attributions are zero for "
            << aircraft_type_to_string(model.type) << ".");
    return explanation;
  }

  std::stable_sort(importances.begin(), importances.end(),
                   [](const FeatureImportance &a, const FeatureImportance &b) {
                     return a.mean_abs_attribution > b.mean_abs_attribution;
                   });
  if (importances.size() > config_.top_n)
    importances.resize(config_.top_n);

  explanation.status = ExplanationStatus::OK;
  explanation.ranking = std::move(importances);
  explanation.summary = summarize(model.type, explanation.ranking);

  LOG(LogLevel::DEBUG, LogComponent::EXPLAIN,
      "Explained " << sampled.size() << " rows; top feature "
                   << explanation.ranking.front().feature << " ("
                   << explanation.ranking.front().mean_abs_attribution
                   << ").");
  return explanation;
}

std::string ExplainabilityEngine::summarize(
    AircraftType type, const std::vector<FeatureImportance> &ranking) const {
  const std::string context = " for " + aircraft_type_to_string(type);

  std::vector<std::string> phrases;
  const size_t considered = std::min(ranking.size(), config_.summary_features);
  for (size_t i = 0; i < considered; ++i) {
    std::string phrase =
        interpret(type, ranking[i], config_.significant_importance);
    if (!phrase.empty() &&
        std::find(phrases.begin(), phrases.end(), phrase) == phrases.end())
      phrases.push_back(std::move(phrase));
  }

  if (phrases.empty())
    return "Low overall feature impact detected" + context;

  std::string summary = "Key factors" + context + ": ";
  for (size_t i = 0; i < phrases.size(); ++i)
    summary += (i ? ", " : "") + phrases[i];
  return summary;
}
