#pragma once

#include <exception>
#include <string>

namespace policylens_core {

class PolicyLensError : public std::exception {
 public:
  explicit PolicyLensError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A page record is missing a required field or carries an invalid one.
// Recoverable: the offending page is skipped, the rest of the batch proceeds.
class ParseInputError : public PolicyLensError {
 public:
  using PolicyLensError::PolicyLensError;
};

// The embedding service is unreachable or answered with something unusable.
class ModelUnavailable : public PolicyLensError {
 public:
  using PolicyLensError::PolicyLensError;
};

class DimensionMismatch : public PolicyLensError {
 public:
  using PolicyLensError::PolicyLensError;
};

// Persisted index and metadata disagree (or are missing / unreadable).
class CorruptStore : public PolicyLensError {
 public:
  using PolicyLensError::PolicyLensError;
};

class ConfigError : public PolicyLensError {
 public:
  using PolicyLensError::PolicyLensError;
};

}  // namespace policylens_core
