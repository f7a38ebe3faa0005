#ifndef AIRCRAFT_PROFILE_HPP
#define AIRCRAFT_PROFILE_HPP

#include "aircraft/aircraft_type.hpp"
#include "core/config.hpp"
#include "features/summary_stats.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct ScoringRule {
  std::string description;
  double weight = 0.0;
  std::function<bool(const SummaryStats &)> predicate;
};

// Operating envelope of one feature during normal flight
struct NominalRange {
  std::string feature;
  double low = 0.0;
  double high = 0.0;
  std::string low_issue;
  std::string high_issue;

  // Distance outside [low, high] relative to the range width; 0 inside.
  double deviation(double value) const;
};

class AircraftProfile {
public:
  AircraftProfile(AircraftType type, std::vector<std::string> feature_names,
                  std::vector<ScoringRule> rules,
                  std::vector<NominalRange> nominal_ranges,
                  std::vector<std::string> lift_motor_columns,
                  size_t min_active_lift_motors);

  AircraftType type() const { return type_; }
  std::string name() const { return aircraft_type_to_string(type_); }

  const std::vector<std::string> &feature_names() const {
    return feature_names_;
  }
  size_t feature_count() const { return feature_names_.size(); }

  const std::vector<ScoringRule> &rules() const { return rules_; }
  const std::vector<NominalRange> &nominal_ranges() const {
    return nominal_ranges_;
  }
  const std::vector<std::string> &lift_motor_columns() const {
    return lift_motor_columns_;
  }
  size_t min_active_lift_motors() const { return min_active_lift_motors_; }

  // Sum of all rule weights; scores are normalized by it.
  double max_raw_score() const { return max_raw_score_; }

  // Normalized score in [0, 1]
  double score(const SummaryStats &stats) const;
  std::vector<std::string> matched_rules(const SummaryStats &stats) const;

private:
  AircraftType type_;
  std::vector<std::string> feature_names_;
  std::vector<ScoringRule> rules_;
  std::vector<NominalRange> nominal_ranges_;
  std::vector<std::string> lift_motor_columns_;
  size_t min_active_lift_motors_;
  double max_raw_score_ = 0.0;
};

// The three immutable aircraft profiles, built once from the classifier
// settings and shared by every pipeline stage.
class ProfileCatalog {
public:
  explicit ProfileCatalog(const Config::ClassifierConfig &config);

  const AircraftProfile &profile(AircraftType type) const;
  const std::vector<AircraftProfile> &profiles() const { return profiles_; }

private:
  std::vector<AircraftProfile> profiles_;
};

#endif // AIRCRAFT_PROFILE_HPP
