#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "statute_core/text/sentence_segmenter.hpp"
#include "statute_core/types/chunk.hpp"

namespace statute_core {

struct SectionInfo {
  std::string section_id = "UNKNOWN";
  std::string section_title = "Unknown Section";
  std::string article;
  std::string parent_section;
  int subsection_level = 0;
};

// Turns boundary spans into chunks: text, overlap context, position, section info
// and size metrics. Provenance fields are left for the caller.
class ChunkAssembler {
 public:
  explicit ChunkAssembler(int overlap_sentences);

  std::vector<Chunk> assemble(const std::vector<Sentence>& sentences,
                              const std::vector<std::size_t>& boundaries,
                              std::size_t normalized_length) const;

  // Headers are read from the first line of the chunk's first sentence; an article
  // mention anywhere in the chunk fills `article`.
  static SectionInfo extract_section_info(const std::string& first_sentence,
                                          const std::string& chunk_text);

 private:
  static std::string join_span(const std::vector<Sentence>& sentences, std::size_t begin,
                               std::size_t end);

  int overlap_sentences_;
};

}  // namespace statute_core
