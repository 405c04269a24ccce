#include "statute_core/services/search_service.hpp"

#include <iostream>

#include "statute_core/util/text_utils.hpp"

namespace statute_core {

SearchService::SearchService(std::shared_ptr<ChunkStore> chunk_store,
                             std::shared_ptr<EmbeddingService> embedding_service)
    : chunk_store_(std::move(chunk_store)), embedding_service_(std::move(embedding_service)) {}

std::vector<SearchService::SearchHit> SearchService::search(
    const std::string& query, const std::optional<std::string>& jurisdiction,
    const std::string& region, int top_k, float min_relevance) {
  if (!chunk_store_ || !embedding_service_) {
    throw SearchServiceError("Search index is not configured");
  }
  if (trim(query).empty()) {
    throw SearchInputError("Query must not be empty");
  }
  if (region.empty()) {
    throw SearchInputError("Region is required");
  }
  if (top_k <= 0) {
    return {};
  }

  try {
    std::vector<float> query_embedding = embedding_service_->embed(query, /*is_query*/ true);
    auto results = chunk_store_->search_similar_chunks(query_embedding, region, jurisdiction,
                                                       top_k, min_relevance);

    std::vector<SearchHit> hits;
    hits.reserve(results.size());
    for (auto& result : results) {
      SearchHit hit;
      hit.content = std::move(result.chunk.text);
      hit.jurisdiction = std::move(result.chunk.jurisdiction);
      hit.source_document_id = std::move(result.chunk.source_document_id);
      hit.chunk_number = result.chunk.chunk_number;
      hit.relevance_score = result.relevance_score;
      hit.section_id = std::move(result.chunk.section_id);
      hit.section_title = std::move(result.chunk.section_title);
      hits.push_back(std::move(hit));
    }
    std::cout << "[Search] " << hits.size() << " results in region " << region
              << (jurisdiction ? " / " + *jurisdiction : std::string()) << std::endl;
    return hits;
  } catch (const std::exception& e) {
    throw SearchServiceError("Search failed: " + std::string(e.what()));
  }
}

std::vector<JurisdictionCount> SearchService::list_jurisdictions(const std::string& region) {
  if (!chunk_store_) {
    throw SearchServiceError("Search index is not configured");
  }
  if (region.empty()) {
    throw SearchInputError("Region is required");
  }
  try {
    return chunk_store_->list_jurisdictions(region);
  } catch (const std::exception& e) {
    throw SearchServiceError("Listing jurisdictions failed: " + std::string(e.what()));
  }
}

}  // namespace statute_core
