#include "statute_core/chunking/boundary_detector.hpp"

#include <regex>
#include <stdexcept>

#include "statute_core/util/text_utils.hpp"
#include "statute_core/util/vector_math.hpp"

namespace statute_core {

BoundaryDetector::BoundaryDetector(int target_words, int max_words)
    : target_words_(target_words), max_words_(max_words) {
  if (target_words_ <= 0 || max_words_ <= 0 || target_words_ > max_words_) {
    throw std::invalid_argument("Invalid chunk size bounds: target_words=" +
                                std::to_string(target_words_) +
                                ", max_words=" + std::to_string(max_words_));
  }
}

std::vector<std::size_t> BoundaryDetector::walk(
    const std::vector<Sentence>& sentences,
    const std::function<bool(std::size_t)>& soft_break) const {
  std::vector<std::size_t> boundaries{0};
  const std::size_t n = sentences.size();
  if (n == 0) {
    return boundaries;
  }

  int current_words = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const int words = count_words(sentences[i].text);

    if (current_words > 0 && current_words + words > max_words_) {
      boundaries.push_back(i);
      current_words = 0;
    }
    current_words += words;

    if (i + 1 == n) {
      break;
    }
    if (current_words >= max_words_ || (current_words >= target_words_ && soft_break(i))) {
      boundaries.push_back(i + 1);
      current_words = 0;
    }
  }

  boundaries.push_back(n);
  return boundaries;
}

SemanticBoundaryDetector::SemanticBoundaryDetector(const ChunkingConfig& config,
                                                   EmbeddingService& embeddings)
    : BoundaryDetector(config.target_words, config.max_words),
      threshold_(config.semantic_threshold),
      embeddings_(embeddings) {}

std::vector<std::size_t> SemanticBoundaryDetector::find_boundaries(
    const std::vector<Sentence>& sentences) {
  if (sentences.size() < 2) {
    return walk(sentences, [](std::size_t) { return false; });
  }

  std::vector<std::string> texts;
  texts.reserve(sentences.size());
  for (const auto& sentence : sentences) {
    texts.push_back(sentence.text);
  }
  const auto vectors = embeddings_.embed_batch(texts);

  std::vector<float> similarities(sentences.size() - 1);
  for (std::size_t i = 0; i + 1 < sentences.size(); ++i) {
    similarities[i] = cosine_similarity(vectors[i], vectors[i + 1]);
  }

  return walk(sentences, [&](std::size_t i) { return similarities[i] < threshold_; });
}

StructuralBoundaryDetector::StructuralBoundaryDetector(const ChunkingConfig& config)
    : BoundaryDetector(config.target_words, config.max_words) {}

bool StructuralBoundaryDetector::is_section_header(const std::string& sentence) {
  static const std::regex header(
      R"(^(?:ARTICLE [IVXLCDM]+\.?|\d+\.\d+\.?)\s*(?:-|—|–))");
  return std::regex_search(sentence, header);
}

std::vector<std::size_t> StructuralBoundaryDetector::find_boundaries(
    const std::vector<Sentence>& sentences) {
  return walk(sentences, [&](std::size_t i) {
    const Sentence& next = sentences[i + 1];
    return next.starts_paragraph || is_section_header(next.text);
  });
}

}  // namespace statute_core
