#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "statute_core/db/chunk_store.hpp"
#include "statute_core/embedding/embedding_service.hpp"
#include "statute_core/types.hpp"

namespace statute_core {

class IngestionError : public std::exception {
 public:
  enum class Kind { Input, Configuration, Embedding, Storage, Conflict, Internal };

  IngestionError(const std::string& document_id, const std::string& stage, Kind kind,
                 const std::string& detail)
      : document_id_(document_id),
        stage_(stage),
        kind_(kind),
        message_("Ingestion of '" + document_id + "' failed at " + stage + " (" +
                 kind_to_string(kind) + "): " + detail) {}

  const char* what() const noexcept override { return message_.c_str(); }

  const std::string& document_id() const { return document_id_; }
  const std::string& stage() const { return stage_; }
  Kind kind() const { return kind_; }

  static std::string kind_to_string(Kind kind) {
    switch (kind) {
      case Kind::Input:
        return "input";
      case Kind::Configuration:
        return "configuration";
      case Kind::Embedding:
        return "embedding";
      case Kind::Storage:
        return "storage";
      case Kind::Conflict:
        return "conflict";
      default:
        return "internal";
    }
  }

 private:
  std::string document_id_;
  std::string stage_;
  Kind kind_;
  std::string message_;
};

// Outcome of one document in a batch.
struct IngestReport {
  std::string document_id;
  int chunks_written = 0;
  std::optional<std::string> error;
  std::optional<IngestionError::Kind> error_kind;
};

/**
 * @brief Chunks, embeds and stores source documents.
 *
 * Re-ingesting a document replaces all of its chunks. Empty documents are
 * skipped with 0 chunks written; every fatal failure is an IngestionError.
 */
class IngestionService {
 public:
  IngestionService(std::shared_ptr<ChunkStore> chunk_store,
                   std::shared_ptr<EmbeddingService> embedding_service);
  virtual ~IngestionService() = default;

  virtual int ingest(const std::string& document_id, const std::string& jurisdiction,
                     const std::string& region, const std::string& raw_text,
                     const ChunkingConfig& config);
  int ingest(const SourceDocument& document, const ChunkingConfig& config);

  // Parallel over documents. A configuration error stops the batch and is rethrown;
  // any other failure is recorded in that document's report.
  std::vector<IngestReport> ingest_batch(const std::vector<SourceDocument>& documents,
                                         const ChunkingConfig& config, int num_workers);

 private:
  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<EmbeddingService> embedding_service_;
};

}  // namespace statute_core
