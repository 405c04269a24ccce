#pragma once

#include <stdexcept>
#include <string>

namespace statute_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Misconfiguration: unknown model version, conflicting dimension. Never retried.
class EmbeddingConfigError : public EmbeddingError {
 public:
  explicit EmbeddingConfigError(const std::string& message) : EmbeddingError(message) {}
};

class EmbeddingDimensionError : public EmbeddingConfigError {
 public:
  EmbeddingDimensionError(const std::string& model_version, int expected, int actual)
      : EmbeddingConfigError("Embedding dimension mismatch for model '" + model_version +
                             "': expected " + std::to_string(expected) + ", got " +
                             std::to_string(actual)),
        model_version_(model_version),
        expected_(expected),
        actual_(actual) {}

  const std::string& model_version() const { return model_version_; }
  int expected() const { return expected_; }
  int actual() const { return actual_; }

 private:
  std::string model_version_;
  int expected_;
  int actual_;
};

}  // namespace statute_core
