#include "statute_core/services/ingestion_service.hpp"

#include <iostream>
#include <stdexcept>

#include "statute_core/async/worker_pool.hpp"
#include "statute_core/chunking/document_chunker.hpp"
#include "statute_core/llm/ollama_client.hpp"
#include "statute_core/util/text_utils.hpp"

namespace statute_core {

namespace {

using Kind = IngestionError::Kind;

// Runs one pipeline stage and maps component errors onto IngestionError kinds.
template <typename Fn>
auto run_stage(const std::string& document_id, const std::string& stage, Fn&& fn)
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const IngestionError&) {
    throw;
  } catch (const IngestConflictError& e) {
    throw IngestionError(document_id, stage, Kind::Conflict, e.what());
  } catch (const ChunkStoreError& e) {
    throw IngestionError(document_id, stage, Kind::Storage, e.what());
  } catch (const EmbeddingCacheError& e) {
    throw IngestionError(document_id, stage, Kind::Storage, e.what());
  } catch (const EmbeddingConfigError& e) {
    throw IngestionError(document_id, stage, Kind::Configuration, e.what());
  } catch (const EmbeddingError& e) {
    throw IngestionError(document_id, stage, Kind::Embedding, e.what());
  } catch (const OllamaError& e) {
    throw IngestionError(document_id, stage, Kind::Embedding, e.what());
  } catch (const std::invalid_argument& e) {
    throw IngestionError(document_id, stage, Kind::Configuration, e.what());
  } catch (const std::exception& e) {
    throw IngestionError(document_id, stage, Kind::Internal, e.what());
  }
}

}  // namespace

IngestionService::IngestionService(std::shared_ptr<ChunkStore> chunk_store,
                                   std::shared_ptr<EmbeddingService> embedding_service)
    : chunk_store_(std::move(chunk_store)), embedding_service_(std::move(embedding_service)) {
  if (!chunk_store_ || !embedding_service_) {
    throw std::invalid_argument("IngestionService requires a chunk store and embedding service");
  }
  if (chunk_store_->vector_dimension() != embedding_service_->dimension()) {
    throw EmbeddingDimensionError(embedding_service_->model_version(),
                                  chunk_store_->vector_dimension(),
                                  embedding_service_->dimension());
  }
}

int IngestionService::ingest(const SourceDocument& document, const ChunkingConfig& config) {
  return ingest(document.document_id, document.jurisdiction, document.region, document.raw_text,
                config);
}

int IngestionService::ingest(const std::string& document_id, const std::string& jurisdiction,
                             const std::string& region, const std::string& raw_text,
                             const ChunkingConfig& config) {
  if (document_id.empty()) {
    throw IngestionError("<unnamed>", "validate", Kind::Input, "document_id is required");
  }
  if (region.empty()) {
    throw IngestionError(document_id, "validate", Kind::Input, "region is required");
  }

  DocumentChunker chunker = run_stage(document_id, "config", [&] {
    return DocumentChunker(config, embedding_service_);
  });

  const int expected_version =
      run_stage(document_id, "load_version", [&] { return chunk_store_->current_version(document_id); });

  const std::string normalized =
      run_stage(document_id, "normalize", [&] { return chunker.normalize(raw_text); });
  if (normalized.empty()) {
    std::cout << "[Ingest] Skipping " << document_id << ": empty text" << std::endl;
    return 0;
  }

  const auto sentences =
      run_stage(document_id, "segment", [&] { return chunker.segment(normalized); });
  if (sentences.empty()) {
    std::cout << "[Ingest] Skipping " << document_id << ": no sentences found" << std::endl;
    return 0;
  }

  const auto boundaries =
      run_stage(document_id, "boundaries", [&] { return chunker.find_boundaries(sentences); });

  auto chunks = run_stage(document_id, "assemble", [&] {
    return chunker.assemble(sentences, boundaries, normalized.size());
  });
  for (auto& chunk : chunks) {
    chunk.source_document_id = document_id;
    chunk.jurisdiction = jurisdiction;
    chunk.region = region;
  }

  run_stage(document_id, "metadata", [&] { chunker.extract_metadata(chunks); });
  run_stage(document_id, "coherence", [&] { chunker.score_coherence(chunks); });

  run_stage(document_id, "embed", [&] {
    std::vector<std::string> texts;
    std::vector<size_t> missing;
    for (size_t i = 0; i < chunks.size(); ++i) {
      if (chunks[i].vector_embedding.empty()) {
        missing.push_back(i);
        texts.push_back(chunks[i].text);
      }
    }
    auto vectors = embedding_service_->embed_batch(texts);
    for (size_t j = 0; j < missing.size(); ++j) {
      chunks[missing[j]].vector_embedding = std::move(vectors[j]);
    }
  });

  DocumentRecord record;
  record.document_id = document_id;
  record.jurisdiction = jurisdiction;
  record.region = region;
  record.content_hash = run_stage(document_id, "hash", [&] { return sha256_hex(normalized); });
  record.model_version = embedding_service_->model_version();

  const int version = run_stage(document_id, "persist", [&] {
    return chunk_store_->replace_document_chunks(record, expected_version, chunks);
  });

  std::cout << "[Ingest] " << document_id << ": " << chunks.size() << " chunks from "
            << sentences.size() << " sentences (" << chunker.boundary_strategy()
            << " boundaries, version " << version << ")" << std::endl;
  return static_cast<int>(chunks.size());
}

std::vector<IngestReport> IngestionService::ingest_batch(const std::vector<SourceDocument>& documents,
                                                         const ChunkingConfig& config,
                                                         int num_workers) {
  async::WorkerPool pool(num_workers, *this);
  return pool.run_batch(documents, config);
}

}  // namespace statute_core
