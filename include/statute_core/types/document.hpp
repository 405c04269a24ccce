#pragma once

#include <chrono>
#include <string>

namespace statute_core {

// What the upstream extractor hands us.
struct SourceDocument {
  std::string document_id;
  std::string jurisdiction;
  std::string region;
  std::string raw_text;
};

struct ChunkingConfig {
  int target_words = 400;
  int max_words = 500;
  int overlap_sentences = 2;
  float semantic_threshold = 0.75f;
  bool use_semantic_boundaries = true;

  // Throws std::invalid_argument describing the first bad field.
  void validate() const;
};

// Row in the documents table. `version` advances on every successful ingestion and is
// the compare-and-swap token for re-ingesting the same document.
struct DocumentRecord {
  std::string document_id;
  std::string jurisdiction;
  std::string region;
  std::string content_hash;
  int version = 0;
  int chunk_count = 0;
  std::string model_version;
  std::chrono::system_clock::time_point ingested_at;
};

}  // namespace statute_core
