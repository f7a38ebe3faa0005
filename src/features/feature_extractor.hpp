#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "aircraft/aircraft_profile.hpp"
#include "core/config.hpp"
#include "features/summary_stats.hpp"
#include "telemetry/flight_log.hpp"

#include <map>
#include <vector>

using FeatureMatrix = std::vector<std::vector<double>>;

struct FeatureExtraction {
  SummaryStats summary;
  std::map<AircraftType, FeatureMatrix> matrices;
};

class FeatureExtractor {
public:
  explicit FeatureExtractor(const Config::FeatureExtractionConfig &config);

  // Summary statistics plus one feature matrix per catalog profile. Never
  // throws; a zero-row log yields zeroed statistics and empty matrices.
  FeatureExtraction extract(const FlightLog &log,
                            const ProfileCatalog &catalog) const;

  SummaryStats summarize(const FlightLog &log) const;

  // One row per log row, one column per profile feature in profile order.
  // Features the log does not carry are zero-filled.
  FeatureMatrix build_matrix(const FlightLog &log,
                             const AircraftProfile &profile) const;

private:
  void compute_motor_stats(const FlightLog &log, SummaryStats &stats) const;
  void compute_motion_stats(const std::vector<double> &altitude,
                            const std::vector<double> &speed,
                            SummaryStats &stats) const;
  double vertical_transition_ratio(const std::vector<double> &altitude) const;

  Config::FeatureExtractionConfig config_;
};

#endif // FEATURE_EXTRACTOR_HPP
