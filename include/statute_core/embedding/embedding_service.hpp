#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "statute_core/db/embedding_cache.hpp"
#include "statute_core/embedding/embedding_errors.hpp"
#include "statute_core/llm/embedding_provider.hpp"

namespace statute_core {

/**
 * @brief Cache-first batch encoder in front of an EmbeddingProvider.
 *
 * Texts are hashed (SHA-256 of the final text, including the query instruction
 * for queries) and looked up under the provider's model version. Only misses
 * reach the provider, de-duplicated and sent in batches of `batch_size`.
 * Returned vectors are L2-normalised.
 */
class EmbeddingService {
 public:
  static constexpr const char* QUERY_INSTRUCTION =
      "Represent this sentence for searching relevant passages: ";
  static constexpr std::size_t DEFAULT_BATCH_SIZE = 32;

  // Registers the provider's model version with the cache.
  EmbeddingService(std::shared_ptr<EmbeddingProvider> provider,
                   std::shared_ptr<EmbeddingCache> cache,
                   std::size_t batch_size = DEFAULT_BATCH_SIZE);
  virtual ~EmbeddingService() = default;

  EmbeddingService(const EmbeddingService&) = delete;
  EmbeddingService& operator=(const EmbeddingService&) = delete;

  virtual std::vector<float> embed(const std::string& text, bool is_query = false);
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts,
                                                      bool is_query = false);

  // Final text that gets hashed and sent to the model.
  static std::string prepare_text(const std::string& text, bool is_query);

  const std::string& model_version() const { return model_version_; }
  int dimension() const { return dimension_; }
  std::size_t batch_size() const { return batch_size_; }

 private:
  std::vector<std::vector<float>> encode(const std::vector<std::string>& texts);

  std::shared_ptr<EmbeddingProvider> provider_;
  std::shared_ptr<EmbeddingCache> cache_;
  std::size_t batch_size_;
  std::string model_version_;
  int dimension_;
};

}  // namespace statute_core
