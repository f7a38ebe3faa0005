#ifndef EXPLAINABILITY_ENGINE_HPP
#define EXPLAINABILITY_ENGINE_HPP

#include "analysis/analysis_result.hpp"
#include "core/config.hpp"
#include "features/feature_extractor.hpp"
#include "models/model_registry.hpp"

#include <cstddef>
#include <vector>

class ExplainabilityEngine {
public:
  ExplainabilityEngine(ModelRegistry &registry,
                       const FeatureExtractor &extractor,
                       const Config::ExplainabilityConfig &config);

  // Binds to the type's current model. A model without trees, or one whose
  // attributions are all zero, yields a DEGENERATE explanation rather than
  // an error.
  Explanation explain(const FlightLog &log, AircraftType type) const;
  Explanation explain(const FeatureMatrix &matrix,
                      const TrainedModel &model) const;

  // Evenly strided, deterministic row sample of at most `sample_size` rows
  static std::vector<size_t> sample_rows(size_t row_count, size_t sample_size);

private:
  std::string summarize(AircraftType type,
                        const std::vector<FeatureImportance> &ranking) const;

  ModelRegistry &registry_;
  const FeatureExtractor &extractor_;
  Config::ExplainabilityConfig config_;
};

#endif // EXPLAINABILITY_ENGINE_HPP
