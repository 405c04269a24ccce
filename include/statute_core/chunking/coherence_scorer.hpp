#pragma once

#include <vector>

#include "statute_core/embedding/embedding_service.hpp"
#include "statute_core/types/chunk.hpp"

namespace statute_core {

// Mean cosine similarity of each chunk to its immediate neighbours. Also stores
// the chunk vectors, so indexing afterwards needs no further model calls.
class CoherenceScorer {
 public:
  explicit CoherenceScorer(EmbeddingService& embeddings);

  void score(std::vector<Chunk>& chunks) const;

 private:
  EmbeddingService& embeddings_;
};

}  // namespace statute_core
