#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "statute_core/db/chunk_store.hpp"
#include "statute_core/embedding/embedding_service.hpp"

namespace statute_core {

class SearchServiceError : public std::exception {
 public:
  explicit SearchServiceError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised for caller mistakes such as a blank query or a missing region.
class SearchInputError : public SearchServiceError {
 public:
  explicit SearchInputError(const std::string& message) : SearchServiceError(message) {}
};

class SearchService {
 public:
  struct SearchHit {
    std::string content;
    std::string jurisdiction;
    std::string source_document_id;
    int chunk_number = 0;
    float relevance_score = 0.0f;
    std::string section_id;
    std::string section_title;
  };

  static constexpr int DEFAULT_TOP_K = 5;

  SearchService(std::shared_ptr<ChunkStore> chunk_store,
                std::shared_ptr<EmbeddingService> embedding_service);
  virtual ~SearchService() = default;

  // Natural-language search within a region. Empty when nothing matches.
  virtual std::vector<SearchHit> search(const std::string& query,
                                        const std::optional<std::string>& jurisdiction,
                                        const std::string& region, int top_k = DEFAULT_TOP_K,
                                        float min_relevance = 0.0f);

  virtual std::vector<JurisdictionCount> list_jurisdictions(const std::string& region);

 private:
  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<EmbeddingService> embedding_service_;
};

}  // namespace statute_core
