#include "analysis/analysis_result.hpp"

const char *severity_to_string(Severity severity) {
  switch (severity) {
  case Severity::WARNING:
    return "WARNING";
  case Severity::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

const char *risk_level_to_string(RiskLevel level) {
  switch (level) {
  case RiskLevel::LOW:
    return "low";
  case RiskLevel::MEDIUM:
    return "medium";
  case RiskLevel::HIGH:
    return "high";
  }
  return "unknown";
}

const char *explanation_status_to_string(ExplanationStatus status) {
  switch (status) {
  case ExplanationStatus::OK:
    return "ok";
  case ExplanationStatus::DEGENERATE:
    return "degenerate";
  }
  return "unknown";
}
