#include "statute_core/metadata/metadata_extractor.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <optional>
#include <thread>

#include "statute_core/metadata/signal_patterns.hpp"

namespace statute_core {

namespace {

template <typename T>
std::function<void(const std::string&, Chunk&)> guarded(
    const std::string& field, T Chunk::*member,
    std::function<std::optional<T>(const std::string&)> detect) {
  return [field, member, detect = std::move(detect)](const std::string& text, Chunk& chunk) {
    std::optional<T> value;
    try {
      value = detect(text);
    } catch (const std::exception& e) {
      std::cerr << "[Metadata] " << field << " extraction failed for chunk "
                << chunk.chunk_number << " of " << chunk.source_document_id << ": " << e.what()
                << std::endl;
    }
    chunk.*member = value.value_or(T{});
  };
}

}  // namespace

MetadataExtractor::MetadataExtractor() {
  steps_ = {
      {"has_table", guarded<bool>("has_table", &Chunk::has_table, signals::detect_table)},
      {"has_list", guarded<bool>("has_list", &Chunk::has_list, signals::detect_list)},
      {"definitions", guarded<std::vector<std::string>>("definitions", &Chunk::definitions,
                                                        signals::find_definitions)},
      {"citations", guarded<std::vector<std::string>>("citations", &Chunk::citations,
                                                      signals::find_citations)},
      {"cross_references",
       guarded<std::vector<std::string>>("cross_references", &Chunk::cross_references,
                                         signals::find_cross_references)},
      {"legal_entities", guarded<std::vector<std::string>>("legal_entities", &Chunk::legal_entities,
                                                           signals::find_legal_entities)},
      {"key_phrases", guarded<std::vector<std::string>>("key_phrases", &Chunk::key_phrases,
                                                        signals::find_key_phrases)},
      {"semantic_density", guarded<float>("semantic_density", &Chunk::semantic_density,
                                          signals::semantic_density)},
  };
}

std::vector<std::string> MetadataExtractor::step_names() const {
  std::vector<std::string> names;
  names.reserve(steps_.size());
  for (const auto& step : steps_) {
    names.push_back(step.field);
  }
  return names;
}

ContentType MetadataExtractor::classify(const Chunk& chunk) {
  if (chunk.has_definition)
    return ContentType::Definition;
  if (chunk.has_citation)
    return ContentType::Citation;
  if (chunk.has_table && chunk.has_list)
    return ContentType::Mixed;
  if (chunk.has_table)
    return ContentType::Table;
  if (chunk.has_list)
    return ContentType::List;
  return ContentType::Text;
}

void MetadataExtractor::enrich(Chunk& chunk) const {
  for (const auto& step : steps_) {
    step.run(chunk.text, chunk);
  }
  chunk.has_definition = !chunk.definitions.empty();
  chunk.has_citation = !chunk.citations.empty();
  chunk.content_type = classify(chunk);
}

void MetadataExtractor::enrich_all(std::vector<Chunk>& chunks, unsigned max_threads) const {
  if (max_threads == 0) {
    max_threads = std::max(1u, std::thread::hardware_concurrency());
  }
  const size_t workers = std::min<size_t>(max_threads, chunks.size());
  if (workers <= 1) {
    for (auto& chunk : chunks) {
      enrich(chunk);
    }
    return;
  }

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [this, &chunks, w, workers] {
      for (size_t i = w; i < chunks.size(); i += workers) {
        enrich(chunks[i]);
      }
    }));
  }
  for (auto& future : futures) {
    future.get();
  }
}

}  // namespace statute_core
