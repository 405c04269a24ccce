#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "statute_core/embedding/embedding_service.hpp"
#include "statute_core/text/sentence_segmenter.hpp"
#include "statute_core/types/document.hpp"

namespace statute_core {

/**
 * @brief Chooses the sentence indices where chunks start.
 *
 * Returns strictly increasing indices beginning with 0 and ending with the
 * sentence count. Every strategy shares the same size walk: a boundary is placed
 * in front of any sentence that would push a non-empty chunk past `max_words`,
 * a boundary is forced once `max_words` is reached, and a strategy-specific soft
 * trigger may cut earlier once `target_words` is reached.
 */
class BoundaryDetector {
 public:
  BoundaryDetector(int target_words, int max_words);
  virtual ~BoundaryDetector() = default;

  virtual std::vector<std::size_t> find_boundaries(const std::vector<Sentence>& sentences) = 0;
  virtual std::string name() const = 0;

 protected:
  // `soft_break(i)` asks whether a cut between sentence i and i + 1 is natural.
  std::vector<std::size_t> walk(const std::vector<Sentence>& sentences,
                                const std::function<bool(std::size_t)>& soft_break) const;

  int target_words_;
  int max_words_;
};

class SemanticBoundaryDetector : public BoundaryDetector {
 public:
  SemanticBoundaryDetector(const ChunkingConfig& config, EmbeddingService& embeddings);

  std::vector<std::size_t> find_boundaries(const std::vector<Sentence>& sentences) override;
  std::string name() const override { return "semantic"; }

 private:
  float threshold_;
  EmbeddingService& embeddings_;
};

class StructuralBoundaryDetector : public BoundaryDetector {
 public:
  explicit StructuralBoundaryDetector(const ChunkingConfig& config);

  std::vector<std::size_t> find_boundaries(const std::vector<Sentence>& sentences) override;
  std::string name() const override { return "structural"; }

  // "ARTICLE IV - ..." or "12.3 - ..." at the start of the sentence.
  static bool is_section_header(const std::string& sentence);
};

}  // namespace statute_core
