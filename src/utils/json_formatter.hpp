#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/analysis_result.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json anomaly_to_json_object(const AnomalyRecord &record);
nlohmann::json explanation_to_json_object(const Explanation &explanation);
nlohmann::json result_to_json_object(const AnalysisResult &result);

std::string format_result_to_json(const AnalysisResult &result,
                                  int indent = -1);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
