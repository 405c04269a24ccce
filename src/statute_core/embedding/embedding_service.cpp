#include "statute_core/embedding/embedding_service.hpp"

#include <algorithm>
#include <utility>
#include <unordered_map>

#include "statute_core/util/text_utils.hpp"
#include "statute_core/util/vector_math.hpp"

namespace statute_core {

EmbeddingService::EmbeddingService(std::shared_ptr<EmbeddingProvider> provider,
                                   std::shared_ptr<EmbeddingCache> cache,
                                   std::size_t batch_size)
    : provider_(std::move(provider)), cache_(std::move(cache)), batch_size_(batch_size) {
  if (!provider_) {
    throw EmbeddingConfigError("EmbeddingService requires an embedding provider");
  }
  if (!cache_) {
    throw EmbeddingConfigError("EmbeddingService requires an embedding cache");
  }
  if (batch_size_ == 0) {
    throw EmbeddingConfigError("Embedding batch size must be positive");
  }
  model_version_ = provider_->model_version();
  dimension_ = provider_->dimension();
  cache_->register_model(model_version_, dimension_);
}

std::string EmbeddingService::prepare_text(const std::string& text, bool is_query) {
  return is_query ? std::string(QUERY_INSTRUCTION) + text : text;
}

std::vector<float> EmbeddingService::embed(const std::string& text, bool is_query) {
  return embed_batch({text}, is_query).front();
}

std::vector<std::vector<float>> EmbeddingService::embed_batch(const std::vector<std::string>& texts,
                                                              bool is_query) {
  if (texts.empty()) {
    return {};
  }

  std::vector<std::string> prepared;
  std::vector<std::string> hashes;
  prepared.reserve(texts.size());
  hashes.reserve(texts.size());
  for (const auto& text : texts) {
    prepared.push_back(prepare_text(text, is_query));
    hashes.push_back(sha256_hex(prepared.back()));
  }

  auto found = cache_->lookup_many(hashes, model_version_);

  // Unique misses, in first-seen order
  std::vector<std::string> miss_hashes;
  std::vector<std::string> miss_texts;
  for (size_t i = 0; i < hashes.size(); ++i) {
    if (found.count(hashes[i]) ||
        std::find(miss_hashes.begin(), miss_hashes.end(), hashes[i]) != miss_hashes.end()) {
      continue;
    }
    miss_hashes.push_back(hashes[i]);
    miss_texts.push_back(prepared[i]);
  }

  if (!miss_texts.empty()) {
    auto vectors = encode(miss_texts);
    for (size_t i = 0; i < miss_hashes.size(); ++i) {
      if (cache_->insert_if_absent(miss_hashes[i], model_version_, vectors[i]) ==
          CacheInsertOutcome::AlreadyPresent) {
        // Another worker cached the same text first; keep its entry.
        auto existing = cache_->lookup(miss_hashes[i], model_version_);
        if (existing) {
          vectors[i] = std::move(*existing);
        }
      }
      found.emplace(miss_hashes[i], std::move(vectors[i]));
    }
  }

  std::vector<std::vector<float>> result;
  result.reserve(hashes.size());
  for (const auto& hash : hashes) {
    result.push_back(found.at(hash));
  }
  return result;
}

std::vector<std::vector<float>> EmbeddingService::encode(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t start = 0; start < texts.size(); start += batch_size_) {
    const size_t end = std::min(texts.size(), start + batch_size_);
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

    auto batch_vectors = provider_->embed(batch);
    if (batch_vectors.size() != batch.size()) {
      throw EmbeddingError("Model '" + model_version_ + "' returned " +
                           std::to_string(batch_vectors.size()) + " vectors for " +
                           std::to_string(batch.size()) + " inputs");
    }
    for (auto& vec : batch_vectors) {
      if (static_cast<int>(vec.size()) != dimension_) {
        throw EmbeddingDimensionError(model_version_, dimension_, static_cast<int>(vec.size()));
      }
      l2_normalize(vec);
      vectors.push_back(std::move(vec));
    }
  }
  return vectors;
}

}  // namespace statute_core
