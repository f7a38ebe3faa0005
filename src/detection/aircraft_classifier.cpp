#include "detection/aircraft_classifier.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

AircraftClassifier::AircraftClassifier(const ProfileCatalog &catalog,
                                       const Config::ClassifierConfig &config)
    : catalog_(catalog),
      tie_break_type_(aircraft_type_from_string(config.tie_break_type)
                          .value_or(AircraftType::MULTIROTOR)),
      min_confident_score_(config.min_confident_score) {}

Classification AircraftClassifier::classify(const SummaryStats &stats) const {
  Classification result;

  double best_score = 0.0;
  for (const auto &profile : catalog_.profiles()) {
    const double score = std::clamp(profile.score(stats), 0.0, 1.0);
    result.distribution[profile.type()] = score;
    best_score = std::max(best_score, score);

    LOG(LogLevel::DEBUG, LogComponent::CLASSIFIER,
        profile.name() << " scored " << score << " ("
                       << profile.matched_rules(stats).size() << " of "
                       << profile.rules().size() << " rules matched)");
  }

  std::vector<AircraftType> leaders;
  for (const auto &profile : catalog_.profiles()) {
    if (result.distribution[profile.type()] == best_score)
      leaders.push_back(profile.type());
  }

  if (best_score <= 0.0) {
    result.type = tie_break_type_;
    result.confidence = 0.0;
    result.undetected = true;
    result.low_confidence = true;
    LOG(LogLevel::WARN, LogComponent::CLASSIFIER,
        "No aircraft profile matched (rows=" << stats.row_count
                                             << "); defaulting to "
                                             << aircraft_type_to_string(
                                                    tie_break_type_));
    return result;
  }

  if (leaders.size() == 1) {
    result.type = leaders.front();
  } else {
    const bool preferred_tied =
        std::find(leaders.begin(), leaders.end(), tie_break_type_) !=
        leaders.end();
    result.type = preferred_tied ? tie_break_type_ : leaders.front();
    result.tie_broken = true;

    std::ostringstream tied;
    for (size_t i = 0; i < leaders.size(); ++i)
      tied << (i ? ", " : "") << aircraft_type_to_string(leaders[i]);
    LOG(LogLevel::WARN, LogComponent::CLASSIFIER,
        "Classification tie at score " << best_score << " between " << tied.str()
                                       << "; resolved to "
                                       << aircraft_type_to_string(result.type));
  }

  result.confidence = best_score;
  if (result.confidence < min_confident_score_) {
    result.low_confidence = true;
    LOG(LogLevel::WARN, LogComponent::CLASSIFIER,
        "Low classification confidence " << result.confidence << " for "
                                         << aircraft_type_to_string(
                                                result.type));
  }

  LOG(LogLevel::INFO, LogComponent::CLASSIFIER,
      "Classified flight as " << aircraft_type_to_string(result.type)
                              << " with confidence " << result.confidence);
  return result;
}
