#include "statute_core/chunking/coherence_scorer.hpp"

#include <string>

#include "statute_core/util/vector_math.hpp"

namespace statute_core {

CoherenceScorer::CoherenceScorer(EmbeddingService& embeddings) : embeddings_(embeddings) {}

void CoherenceScorer::score(std::vector<Chunk>& chunks) const {
  if (chunks.size() < 2) {
    return;
  }

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text);
  }
  auto vectors = embeddings_.embed_batch(texts);

  for (size_t i = 0; i < chunks.size(); ++i) {
    double total = 0.0;
    int neighbours = 0;
    if (i > 0) {
      total += cosine_similarity(vectors[i], vectors[i - 1]);
      ++neighbours;
    }
    if (i + 1 < chunks.size()) {
      total += cosine_similarity(vectors[i], vectors[i + 1]);
      ++neighbours;
    }
    chunks[i].coherence_score = static_cast<float>(total / neighbours);
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    chunks[i].vector_embedding = std::move(vectors[i]);
  }
}

}  // namespace statute_core
