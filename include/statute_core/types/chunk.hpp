#pragma once

#include <string>
#include <vector>

namespace statute_core {

enum class ContentType { Text, Table, List, Definition, Citation, Mixed };

std::string to_string(ContentType type);
ContentType content_type_from_string(const std::string& str);

// One retrievable span of a source document. `text` is authoritative; the overlap
// fields only give downstream readers some context and never count toward coverage.
struct Chunk {
  int chunk_number = 0;
  std::string content_hash;

  std::string source_document_id;
  std::string jurisdiction;
  std::string region;
  double document_position = 0.0;
  int sentence_start = 0;

  std::string section_id;
  std::string section_title;
  std::string article;
  std::string parent_section;
  int subsection_level = 0;

  ContentType content_type = ContentType::Text;
  bool has_table = false;
  bool has_list = false;
  bool has_definition = false;
  bool has_citation = false;

  // Sorted, de-duplicated
  std::vector<std::string> definitions;
  std::vector<std::string> citations;
  std::vector<std::string> cross_references;
  std::vector<std::string> legal_entities;
  std::vector<std::string> key_phrases;

  float semantic_density = 0.0f;
  float coherence_score = 0.0f;

  std::string text;
  std::string prev_overlap_text;
  std::string next_preview_text;

  int word_count = 0;
  int char_count = 0;
  int sentence_count = 0;

  std::vector<float> vector_embedding;
};

}  // namespace statute_core
