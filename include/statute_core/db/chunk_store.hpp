#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "statute_core/db/database_manager.hpp"
#include "statute_core/types.hpp"

namespace statute_core {

class ChunkStoreError : public std::exception {
 public:
  explicit ChunkStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Another ingestion of the same document committed first.
class IngestConflictError : public ChunkStoreError {
 public:
  IngestConflictError(const std::string &document_id, int expected_version, int actual_version)
      : ChunkStoreError("Document '" + document_id + "' changed during ingestion: expected version " +
                        std::to_string(expected_version) + ", found " +
                        std::to_string(actual_version)),
        document_id_(document_id),
        expected_version_(expected_version),
        actual_version_(actual_version) {}

  const std::string &document_id() const { return document_id_; }
  int expected_version() const { return expected_version_; }
  int actual_version() const { return actual_version_; }

 private:
  std::string document_id_;
  int expected_version_;
  int actual_version_;
};

struct ChunkSearchResult {
  Chunk chunk;  // vector_embedding left empty
  float relevance_score = 0.0f;
};

struct JurisdictionCount {
  std::string jurisdiction;
  int chunk_count = 0;
};

class ChunkStore {
 public:
  ChunkStore(DatabaseManager &db_manager, int vector_dimension);
  virtual ~ChunkStore() = default;

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;
  ChunkStore(ChunkStore &&) = delete;
  ChunkStore &operator=(ChunkStore &&) = delete;

  // 0 when the document has never been ingested.
  int current_version(const std::string &document_id);
  std::optional<DocumentRecord> get_document(const std::string &document_id);

  /**
   * @brief Atomically replaces every chunk of `document.document_id`.
   *
   * Runs in one immediate transaction guarded by a compare-and-swap on the
   * document version. Throws IngestConflictError when the stored version is no
   * longer `expected_version`. Returns the new version.
   */
  int replace_document_chunks(const DocumentRecord &document, int expected_version,
                              const std::vector<Chunk> &chunks);

  // Ordered by chunk_number; vectors included.
  std::vector<Chunk> get_document_chunks(const std::string &document_id);

  // False when the document did not exist.
  bool delete_document(const std::string &document_id);

  /**
   * @brief Exact inner-product search over the chunks in `region`, optionally
   * restricted to one jurisdiction.
   *
   * Relevance is the cosine similarity of the normalised vectors clamped to
   * [0, 1]. Results are ordered by relevance descending, then chunk_number,
   * then source_document_id.
   */
  std::vector<ChunkSearchResult> search_similar_chunks(const std::vector<float> &query_vector,
                                                       const std::string &region,
                                                       const std::optional<std::string> &jurisdiction,
                                                       int top_k, float min_relevance = 0.0f);

  // Ordered by chunk count descending, then name.
  std::vector<JurisdictionCount> list_jurisdictions(const std::string &region);

  int vector_dimension() const { return vector_dimension_; }

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  struct Candidate {
    faiss::idx_t id;
    std::string source_document_id;
    int chunk_number;
  };

  std::vector<char> vector_to_blob(const std::vector<float> &vec, const std::string &context) const;
  std::unordered_map<faiss::idx_t, Chunk> load_chunks(sqlite::database &db,
                                                      const std::vector<faiss::idx_t> &ids);

  DatabaseManager &db_manager_;
  int vector_dimension_;
};

}  // namespace statute_core
