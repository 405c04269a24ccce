#include "statute_core/types/chunk_json.hpp"

namespace statute_core {

nlohmann::json chunk_metadata_to_json(const Chunk& chunk) {
  return nlohmann::json{
      {"document_position", chunk.document_position},
      {"sentence_start", chunk.sentence_start},
      {"section_id", chunk.section_id},
      {"section_title", chunk.section_title},
      {"article", chunk.article},
      {"parent_section", chunk.parent_section},
      {"subsection_level", chunk.subsection_level},
      {"content_type", to_string(chunk.content_type)},
      {"has_table", chunk.has_table},
      {"has_list", chunk.has_list},
      {"has_definition", chunk.has_definition},
      {"has_citation", chunk.has_citation},
      {"definitions", chunk.definitions},
      {"citations", chunk.citations},
      {"cross_references", chunk.cross_references},
      {"legal_entities", chunk.legal_entities},
      {"key_phrases", chunk.key_phrases},
      {"semantic_density", chunk.semantic_density},
      {"coherence_score", chunk.coherence_score},
      {"prev_overlap_text", chunk.prev_overlap_text},
      {"next_preview_text", chunk.next_preview_text},
      {"sentence_count", chunk.sentence_count},
  };
}

void chunk_metadata_from_json(const nlohmann::json& metadata, Chunk& chunk) {
  chunk.document_position = metadata.value("document_position", 0.0);
  chunk.sentence_start = metadata.value("sentence_start", 0);
  chunk.section_id = metadata.value("section_id", std::string("UNKNOWN"));
  chunk.section_title = metadata.value("section_title", std::string("Unknown Section"));
  chunk.article = metadata.value("article", std::string());
  chunk.parent_section = metadata.value("parent_section", std::string());
  chunk.subsection_level = metadata.value("subsection_level", 0);
  chunk.content_type = content_type_from_string(metadata.value("content_type", std::string("text")));
  chunk.has_table = metadata.value("has_table", false);
  chunk.has_list = metadata.value("has_list", false);
  chunk.has_definition = metadata.value("has_definition", false);
  chunk.has_citation = metadata.value("has_citation", false);
  chunk.definitions = metadata.value("definitions", std::vector<std::string>{});
  chunk.citations = metadata.value("citations", std::vector<std::string>{});
  chunk.cross_references = metadata.value("cross_references", std::vector<std::string>{});
  chunk.legal_entities = metadata.value("legal_entities", std::vector<std::string>{});
  chunk.key_phrases = metadata.value("key_phrases", std::vector<std::string>{});
  chunk.semantic_density = metadata.value("semantic_density", 0.0f);
  chunk.coherence_score = metadata.value("coherence_score", 0.0f);
  chunk.prev_overlap_text = metadata.value("prev_overlap_text", std::string());
  chunk.next_preview_text = metadata.value("next_preview_text", std::string());
  chunk.sentence_count = metadata.value("sentence_count", 0);
}

nlohmann::json chunk_to_json(const Chunk& chunk) {
  nlohmann::json j = chunk_metadata_to_json(chunk);
  j["chunk_number"] = chunk.chunk_number;
  j["content_hash"] = chunk.content_hash;
  j["source_document_id"] = chunk.source_document_id;
  j["jurisdiction"] = chunk.jurisdiction;
  j["region"] = chunk.region;
  j["text"] = chunk.text;
  j["word_count"] = chunk.word_count;
  j["char_count"] = chunk.char_count;
  return j;
}

}  // namespace statute_core
