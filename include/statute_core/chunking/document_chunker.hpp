#pragma once

#include <memory>
#include <string>
#include <vector>

#include "statute_core/chunking/boundary_detector.hpp"
#include "statute_core/chunking/chunk_assembler.hpp"
#include "statute_core/chunking/coherence_scorer.hpp"
#include "statute_core/embedding/embedding_service.hpp"
#include "statute_core/metadata/metadata_extractor.hpp"
#include "statute_core/text/sentence_segmenter.hpp"
#include "statute_core/text/text_normalizer.hpp"
#include "statute_core/types.hpp"

namespace statute_core {

struct ChunkedDocument {
  std::string normalized_text;
  std::vector<Sentence> sentences;
  std::vector<Chunk> chunks;
};

/**
 * @brief The text half of ingestion: normalize, segment, place boundaries,
 * assemble, extract metadata, score coherence.
 *
 * Without an embedding service only the structural strategy is available and
 * coherence stays at zero. Stages are public so callers can attribute failures.
 */
class DocumentChunker {
 public:
  explicit DocumentChunker(const ChunkingConfig& config,
                           std::shared_ptr<EmbeddingService> embeddings = nullptr);

  ChunkedDocument chunk(const std::string& raw_text) const;

  std::string normalize(const std::string& raw_text) const;
  std::vector<Sentence> segment(const std::string& normalized_text) const;
  std::vector<std::size_t> find_boundaries(const std::vector<Sentence>& sentences) const;
  std::vector<Chunk> assemble(const std::vector<Sentence>& sentences,
                              const std::vector<std::size_t>& boundaries,
                              std::size_t normalized_length) const;
  void extract_metadata(std::vector<Chunk>& chunks) const;
  void score_coherence(std::vector<Chunk>& chunks) const;

  std::string boundary_strategy() const;
  const ChunkingConfig& config() const { return config_; }

 private:
  ChunkingConfig config_;
  std::shared_ptr<EmbeddingService> embeddings_;
  TextNormalizer normalizer_;
  SentenceSegmenter segmenter_;
  std::unique_ptr<BoundaryDetector> detector_;
  ChunkAssembler assembler_;
  MetadataExtractor extractor_;
};

}  // namespace statute_core
