#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every error the analysis core raises to its caller
class AnalysisError : public std::runtime_error {
public:
  explicit AnalysisError(const std::string &message)
      : std::runtime_error(message) {}
};

// The flight log cannot be analyzed as given (no rows, unordered timestamps,
// ragged columns). Not retried; the caller has to fix the input.
class InvalidInput : public AnalysisError {
public:
  explicit InvalidInput(const std::string &message) : AnalysisError(message) {}
};

// No trained model exists for the requested aircraft type and lazy training
// is disabled.
class ModelUnavailable : public AnalysisError {
public:
  explicit ModelUnavailable(const std::string &message)
      : AnalysisError(message) {}
};

// Synthetic training of one aircraft type failed.
class TrainingFailure : public AnalysisError {
public:
  explicit TrainingFailure(const std::string &message)
      : AnalysisError(message) {}
};

#endif // ERRORS_HPP
