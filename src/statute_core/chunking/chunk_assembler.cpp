#include "statute_core/chunking/chunk_assembler.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "statute_core/util/text_utils.hpp"

namespace statute_core {

namespace {

constexpr std::size_t MAX_SECTION_LEAD_BYTES = 300;

std::vector<std::string> split_dotted(const std::string& id) {
  std::vector<std::string> parts;
  std::stringstream ss(id);
  std::string part;
  while (std::getline(ss, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

std::string strip_trailing_period(std::string value) {
  while (!value.empty() && value.back() == '.') {
    value.pop_back();
  }
  return value;
}

// First line of the sentence, cut to MAX_SECTION_LEAD_BYTES on a code point
// boundary. Section titles never run longer.
std::string section_lead(const std::string& first_sentence) {
  std::string lead = first_sentence.substr(0, first_sentence.find('\n'));
  if (lead.size() > MAX_SECTION_LEAD_BYTES) {
    std::size_t cut = MAX_SECTION_LEAD_BYTES;
    while (cut > 0 && (static_cast<unsigned char>(lead[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    lead.resize(cut);
  }
  return lead;
}

}  // namespace

ChunkAssembler::ChunkAssembler(int overlap_sentences) : overlap_sentences_(overlap_sentences) {
  if (overlap_sentences_ < 0) {
    throw std::invalid_argument("overlap_sentences cannot be negative");
  }
}

std::string ChunkAssembler::join_span(const std::vector<Sentence>& sentences, std::size_t begin,
                                      std::size_t end) {
  std::string out;
  for (std::size_t i = begin; i < end; ++i) {
    if (i > begin) {
      out += ' ';
    }
    out += sentences[i].text;
  }
  return out;
}

SectionInfo ChunkAssembler::extract_section_info(const std::string& first_sentence,
                                                 const std::string& chunk_text) {
  // Only the label is matched; the title is the rest of the lead line.
  static const std::regex numbered(R"(^(\d+(?:\.\d+)+\.?)\s*(?:-|—|–)\s*)");
  static const std::regex article_header(R"(^(ARTICLE [IVXLCDM]+)\.?\s*(?:-|—|–)\s*)");
  static const std::regex section_label(R"(^(§\s*\d+(?:\.\d+)*)\.?\s+)");
  static const std::regex article_anywhere(R"(ARTICLE [IVXLCDM]+)");

  SectionInfo info;
  const std::string lead = section_lead(first_sentence);

  std::smatch match;
  for (const std::regex* header : {&numbered, &article_header}) {
    if (!info.section_title.empty() || !std::regex_search(lead, match, *header)) {
      continue;
    }
    const std::string title = trim(strip_trailing_period(trim(match.suffix().str())));
    if (!title.empty()) {
      info.section_id = strip_trailing_period(match[1].str());
      info.section_title = title;
    }
  }
  if (info.section_title.empty() && std::regex_search(lead, match, section_label)) {
    const std::string rest = match.suffix().str();
    const std::string title = trim(rest.substr(0, rest.find('.')));
    if (!title.empty()) {
      info.section_id = strip_trailing_period(match[1].str());
      info.section_title = title;
    }
  }

  std::smatch article_match;
  if (std::regex_search(chunk_text, article_match, article_anywhere)) {
    info.article = article_match[0].str();
  }

  if (info.section_id != "UNKNOWN" && info.section_id.rfind("ARTICLE", 0) != 0) {
    const auto parts = split_dotted(info.section_id);
    if (parts.size() > 1) {
      info.subsection_level = static_cast<int>(parts.size()) - 1;
      std::vector<std::string> parent(parts.begin(), parts.end() - 1);
      info.parent_section = join(parent, ".");
    }
  }
  if (info.parent_section.empty() && !info.article.empty() && info.article != info.section_id) {
    info.parent_section = info.article;
  }
  return info;
}

std::vector<Chunk> ChunkAssembler::assemble(const std::vector<Sentence>& sentences,
                                            const std::vector<std::size_t>& boundaries,
                                            std::size_t normalized_length) const {
  std::vector<Chunk> chunks;
  if (boundaries.size() < 2) {
    return chunks;
  }
  const std::size_t overlap = static_cast<std::size_t>(overlap_sentences_);
  chunks.reserve(boundaries.size() - 1);

  for (std::size_t b = 0; b + 1 < boundaries.size(); ++b) {
    const std::size_t begin = boundaries[b];
    const std::size_t end = boundaries[b + 1];
    if (begin >= end || end > sentences.size()) {
      throw std::invalid_argument("Boundaries must be strictly increasing and within range");
    }

    Chunk chunk;
    chunk.chunk_number = static_cast<int>(b);
    chunk.sentence_start = static_cast<int>(begin);
    chunk.text = join_span(sentences, begin, end);
    chunk.content_hash = sha256_hex(chunk.text);

    if (b > 0 && overlap > 0) {
      const std::size_t prev_begin = boundaries[b - 1];
      const std::size_t from = begin - std::min(begin - prev_begin, overlap);
      chunk.prev_overlap_text = join_span(sentences, from, begin);
    }
    if (b + 2 < boundaries.size() && overlap > 0) {
      const std::size_t next_end = boundaries[b + 2];
      chunk.next_preview_text = join_span(sentences, end, std::min(next_end, end + overlap));
    }

    chunk.document_position =
        normalized_length > 0
            ? static_cast<double>(sentences[begin].offset) / static_cast<double>(normalized_length)
            : 0.0;

    SectionInfo section = extract_section_info(sentences[begin].text, chunk.text);
    chunk.section_id = std::move(section.section_id);
    chunk.section_title = std::move(section.section_title);
    chunk.article = std::move(section.article);
    chunk.parent_section = std::move(section.parent_section);
    chunk.subsection_level = section.subsection_level;

    chunk.word_count = count_words(chunk.text);
    chunk.char_count = count_code_points(chunk.text);
    chunk.sentence_count = static_cast<int>(end - begin);

    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace statute_core
