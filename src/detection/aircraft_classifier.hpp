#ifndef AIRCRAFT_CLASSIFIER_HPP
#define AIRCRAFT_CLASSIFIER_HPP

#include "aircraft/aircraft_profile.hpp"
#include "core/config.hpp"
#include "features/summary_stats.hpp"

#include <map>

struct Classification {
  AircraftType type = AircraftType::MULTIROTOR;
  double confidence = 0.0;
  // Normalized score of every profile, independent of each other
  std::map<AircraftType, double> distribution;

  // Every profile scored 0; `type` is the tie-break type
  bool undetected = false;
  bool tie_broken = false;
  bool low_confidence = false;
};

class AircraftClassifier {
public:
  AircraftClassifier(const ProfileCatalog &catalog,
                     const Config::ClassifierConfig &config);

  // Never throws. Degenerate statistics yield an undetected classification.
  Classification classify(const SummaryStats &stats) const;

private:
  const ProfileCatalog &catalog_;
  AircraftType tie_break_type_;
  double min_confident_score_;
};

#endif // AIRCRAFT_CLASSIFIER_HPP
