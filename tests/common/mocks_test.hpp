#pragma once

#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "statute_core/embedding/embedding_service.hpp"
#include "statute_core/llm/embedding_provider.hpp"
#include "statute_core/services/ingestion_service.hpp"
#include "statute_core/services/search_service.hpp"

namespace statute_tests {

namespace MockUtilities {

constexpr int kTestDimension = 64;

inline uint32_t fnv1a(const std::string& word) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : word) {
    hash ^= c;
    hash *= 16777619u;
  }
  return hash;
}

// Bag-of-words vector: each lowercased alphanumeric token adds 1 to one hashed slot.
// Texts sharing vocabulary get high cosine similarity; disjoint texts get ~0.
inline std::vector<float> bag_of_words_embedding(const std::string& text,
                                                 int dimension = kTestDimension) {
  std::string body = text;
  const std::string prefix(statute_core::EmbeddingService::QUERY_INSTRUCTION);
  if (body.rfind(prefix, 0) == 0) {
    body = body.substr(prefix.size());
  }

  std::vector<float> vec(dimension, 0.0f);
  std::string word;
  auto flush = [&] {
    if (!word.empty()) {
      vec[fnv1a(word) % dimension] += 1.0f;
      word.clear();
    }
  };
  for (unsigned char c : body) {
    if (std::isalnum(c)) {
      word += static_cast<char>(std::tolower(c));
    } else {
      flush();
    }
  }
  flush();
  // Empty text still needs a non-zero vector
  if (std::all_of(vec.begin(), vec.end(), [](float v) { return v == 0.0f; })) {
    vec[0] = 1.0f;
  }
  return vec;
}

// Unit vector along `axis`, for hand-placed search fixtures.
inline std::vector<float> axis_vector(int axis, int dimension = kTestDimension) {
  std::vector<float> vec(dimension, 0.0f);
  vec[axis] = 1.0f;
  return vec;
}

// Normalized mix of two axes; cosine with axis `a` is cos(atan(weight_b / weight_a)).
inline std::vector<float> mixed_vector(int a, float weight_a, int b, float weight_b,
                                       int dimension = kTestDimension) {
  std::vector<float> vec(dimension, 0.0f);
  vec[a] = weight_a;
  vec[b] = weight_b;
  const float norm = std::sqrt(weight_a * weight_a + weight_b * weight_b);
  for (auto& v : vec) {
    v /= norm;
  }
  return vec;
}

}  // namespace MockUtilities

/**
 * Mock embedding model. Defaults to deterministic bag-of-words vectors and counts
 * every text it is asked to embed.
 */
class MockEmbeddingProvider : public statute_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(std::string model_version = "mock-embed-v1",
                                 int dimension = MockUtilities::kTestDimension)
      : model_version_(std::move(model_version)), dimension_(dimension) {
    ON_CALL(*this, embed(testing::_))
        .WillByDefault([this](const std::vector<std::string>& texts) {
          texts_embedded += static_cast<int>(texts.size());
          ++calls;
          std::vector<std::vector<float>> out;
          out.reserve(texts.size());
          for (const auto& text : texts) {
            out.push_back(MockUtilities::bag_of_words_embedding(text, dimension_));
          }
          return out;
        });
    ON_CALL(*this, model_version()).WillByDefault(testing::Return(model_version_));
    ON_CALL(*this, dimension()).WillByDefault(testing::Return(dimension_));
  }

  MOCK_METHOD(std::vector<std::vector<float>>, embed, (const std::vector<std::string>& texts),
              (override));
  MOCK_METHOD(std::string, model_version, (), (const, override));
  MOCK_METHOD(int, dimension, (), (const, override));

  std::atomic<int> texts_embedded{0};
  std::atomic<int> calls{0};

 private:
  std::string model_version_;
  int dimension_;
};

/**
 * Mock ingestion entry point for worker and route tests.
 */
class MockIngestionService : public statute_core::IngestionService {
 public:
  MockIngestionService(std::shared_ptr<statute_core::ChunkStore> store,
                       std::shared_ptr<statute_core::EmbeddingService> embeddings)
      : statute_core::IngestionService(std::move(store), std::move(embeddings)) {}

  MOCK_METHOD(int, ingest,
              (const std::string& document_id, const std::string& jurisdiction,
               const std::string& region, const std::string& raw_text,
               const statute_core::ChunkingConfig& config),
              (override));
};

}  // namespace statute_tests
