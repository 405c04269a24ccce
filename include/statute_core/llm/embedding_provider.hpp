#pragma once

#include <string>
#include <vector>

namespace statute_core {

// A loaded embedding model. Constructed once per process and shared by every
// component that needs vectors.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // One vector per input, in input order.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;

  // Identifies the model weights; part of the embedding cache key.
  virtual std::string model_version() const = 0;
  virtual int dimension() const = 0;
};

}  // namespace statute_core
