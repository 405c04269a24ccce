#include "statute_core/chunking/document_chunker.hpp"

namespace statute_core {

namespace {

std::unique_ptr<BoundaryDetector> make_detector(const ChunkingConfig& config,
                                                const std::shared_ptr<EmbeddingService>& embeddings) {
  if (embeddings && config.use_semantic_boundaries) {
    return std::make_unique<SemanticBoundaryDetector>(config, *embeddings);
  }
  return std::make_unique<StructuralBoundaryDetector>(config);
}

const ChunkingConfig& validated(const ChunkingConfig& config) {
  config.validate();
  return config;
}

}  // namespace

DocumentChunker::DocumentChunker(const ChunkingConfig& config,
                                 std::shared_ptr<EmbeddingService> embeddings)
    : config_(validated(config)),
      embeddings_(std::move(embeddings)),
      detector_(make_detector(config_, embeddings_)),
      assembler_(config_.overlap_sentences) {}

std::string DocumentChunker::boundary_strategy() const {
  return detector_->name();
}

ChunkedDocument DocumentChunker::chunk(const std::string& raw_text) const {
  ChunkedDocument doc;
  doc.normalized_text = normalize(raw_text);
  doc.sentences = segment(doc.normalized_text);
  if (doc.sentences.empty()) {
    return doc;
  }
  const auto boundaries = find_boundaries(doc.sentences);
  doc.chunks = assemble(doc.sentences, boundaries, doc.normalized_text.size());
  extract_metadata(doc.chunks);
  score_coherence(doc.chunks);
  return doc;
}

std::string DocumentChunker::normalize(const std::string& raw_text) const {
  return normalizer_.normalize(raw_text);
}

std::vector<Sentence> DocumentChunker::segment(const std::string& normalized_text) const {
  return segmenter_.segment(normalized_text);
}

std::vector<std::size_t> DocumentChunker::find_boundaries(
    const std::vector<Sentence>& sentences) const {
  return detector_->find_boundaries(sentences);
}

std::vector<Chunk> DocumentChunker::assemble(const std::vector<Sentence>& sentences,
                                             const std::vector<std::size_t>& boundaries,
                                             std::size_t normalized_length) const {
  return assembler_.assemble(sentences, boundaries, normalized_length);
}

void DocumentChunker::extract_metadata(std::vector<Chunk>& chunks) const {
  extractor_.enrich_all(chunks);
}

void DocumentChunker::score_coherence(std::vector<Chunk>& chunks) const {
  if (!embeddings_) {
    return;
  }
  CoherenceScorer(*embeddings_).score(chunks);
}

}  // namespace statute_core
