#include "statute_core/db/embedding_cache.hpp"

#include <cstring>

#include "statute_core/db/pooled_connection.hpp"
#include "statute_core/db/sqlite_error_utils.hpp"
#include "statute_core/db/transaction.hpp"
#include "statute_core/embedding/embedding_errors.hpp"

namespace statute_core {

EmbeddingCache::EmbeddingCache(DatabaseManager& db_manager) : db_manager_(db_manager) {}

void EmbeddingCache::register_model(const std::string& model_version, int dimension) {
  if (model_version.empty()) {
    throw EmbeddingConfigError("Model version must not be empty");
  }
  if (dimension <= 0) {
    throw EmbeddingConfigError("Model '" + model_version + "' has invalid dimension " +
                               std::to_string(dimension));
  }
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "INSERT OR IGNORE INTO embedding_models (model_version, dimension) VALUES (?, ?)"
          << model_version << dimension;

    int stored = 0;
    *conn << "SELECT dimension FROM embedding_models WHERE model_version = ?" << model_version >>
        [&](int d) { stored = d; };
    tx.commit();

    if (stored != dimension) {
      throw EmbeddingDimensionError(model_version, stored, dimension);
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw EmbeddingCacheError(format_db_error("register_model", e));
  }
}

std::optional<int> EmbeddingCache::model_dimension(const std::string& model_version) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<int> dimension;
    *conn << "SELECT dimension FROM embedding_models WHERE model_version = ?" << model_version >>
        [&](int d) { dimension = d; };
    return dimension;
  } catch (const sqlite::sqlite_exception& e) {
    throw EmbeddingCacheError(format_db_error("model_dimension", e));
  }
}

int EmbeddingCache::require_dimension(const std::string& model_version) {
  auto dimension = model_dimension(model_version);
  if (!dimension) {
    throw EmbeddingConfigError("Unknown embedding model version '" + model_version +
                               "'; register it before use");
  }
  return *dimension;
}

std::vector<float> EmbeddingCache::blob_to_vector(const std::vector<char>& blob, int dimension,
                                                  const std::string& content_hash) {
  if (blob.size() != static_cast<size_t>(dimension) * sizeof(float)) {
    throw EmbeddingCacheError("Cached vector for " + content_hash + " has " +
                              std::to_string(blob.size()) + " bytes, expected " +
                              std::to_string(dimension * sizeof(float)));
  }
  std::vector<float> vec(dimension);
  std::memcpy(vec.data(), blob.data(), blob.size());
  return vec;
}

std::optional<std::vector<float>> EmbeddingCache::lookup(const std::string& content_hash,
                                                         const std::string& model_version) {
  const int dimension = require_dimension(model_version);
  try {
    PooledConnection conn(db_manager_);
    std::optional<std::vector<float>> result;
    *conn << "SELECT vector_blob FROM embedding_cache WHERE content_hash = ? AND model_version = ?"
          << content_hash << model_version >>
        [&](std::vector<char> blob) { result = blob_to_vector(blob, dimension, content_hash); };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw EmbeddingCacheError(format_db_error("embedding cache lookup", e));
  }
}

std::unordered_map<std::string, std::vector<float>> EmbeddingCache::lookup_many(
    const std::vector<std::string>& content_hashes, const std::string& model_version) {
  std::unordered_map<std::string, std::vector<float>> found;
  if (content_hashes.empty()) {
    return found;
  }
  const int dimension = require_dimension(model_version);
  try {
    PooledConnection conn(db_manager_);
    for (const auto& hash : content_hashes) {
      if (found.count(hash)) {
        continue;
      }
      *conn << "SELECT vector_blob FROM embedding_cache WHERE content_hash = ? AND "
               "model_version = ?"
            << hash << model_version >>
          [&](std::vector<char> blob) { found.emplace(hash, blob_to_vector(blob, dimension, hash)); };
    }
    return found;
  } catch (const sqlite::sqlite_exception& e) {
    throw EmbeddingCacheError(format_db_error("embedding cache lookup_many", e));
  }
}

CacheInsertOutcome EmbeddingCache::insert_if_absent(const std::string& content_hash,
                                                    const std::string& model_version,
                                                    const std::vector<float>& vector) {
  const int dimension = require_dimension(model_version);
  if (static_cast<int>(vector.size()) != dimension) {
    throw EmbeddingDimensionError(model_version, dimension, static_cast<int>(vector.size()));
  }
  try {
    std::vector<char> blob(vector.size() * sizeof(float));
    std::memcpy(blob.data(), vector.data(), blob.size());

    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO embedding_cache (content_hash, model_version, vector_blob) "
             "VALUES (?, ?, ?)"
          << content_hash << model_version << blob;
    return conn->rows_modified() > 0 ? CacheInsertOutcome::Inserted
                                     : CacheInsertOutcome::AlreadyPresent;
  } catch (const sqlite::sqlite_exception& e) {
    throw EmbeddingCacheError(format_db_error("embedding cache insert", e));
  }
}

int EmbeddingCache::entry_count(const std::string& model_version) {
  try {
    PooledConnection conn(db_manager_);
    int count = 0;
    *conn << "SELECT COUNT(*) FROM embedding_cache WHERE model_version = ?" << model_version >>
        count;
    return count;
  } catch (const sqlite::sqlite_exception& e) {
    throw EmbeddingCacheError(format_db_error("embedding cache entry_count", e));
  }
}

}  // namespace statute_core
