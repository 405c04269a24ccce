#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "statute_core/db/database_manager.hpp"

namespace statute_core {

class EmbeddingCacheError : public std::exception {
 public:
  explicit EmbeddingCacheError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Two workers racing to cache the same text is expected; the loser gets
// AlreadyPresent and keeps the vector it computed.
enum class CacheInsertOutcome { Inserted, AlreadyPresent };

/**
 * @brief Persistent (content_hash, model_version) -> vector map.
 *
 * Entries are insert-if-absent and never mutated. Every model version must be
 * registered with its dimension before it can be read or written.
 */
class EmbeddingCache {
 public:
  explicit EmbeddingCache(DatabaseManager& db_manager);

  EmbeddingCache(const EmbeddingCache&) = delete;
  EmbeddingCache& operator=(const EmbeddingCache&) = delete;

  // Throws EmbeddingConfigError if the version is already registered with another dimension.
  void register_model(const std::string& model_version, int dimension);
  std::optional<int> model_dimension(const std::string& model_version);

  std::optional<std::vector<float>> lookup(const std::string& content_hash,
                                           const std::string& model_version);
  std::unordered_map<std::string, std::vector<float>> lookup_many(
      const std::vector<std::string>& content_hashes, const std::string& model_version);

  CacheInsertOutcome insert_if_absent(const std::string& content_hash,
                                      const std::string& model_version,
                                      const std::vector<float>& vector);

  int entry_count(const std::string& model_version);

 private:
  int require_dimension(const std::string& model_version);
  static std::vector<float> blob_to_vector(const std::vector<char>& blob, int dimension,
                                           const std::string& content_hash);

  DatabaseManager& db_manager_;
};

}  // namespace statute_core
