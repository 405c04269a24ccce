#include "statute_core/types.hpp"

#include <cmath>
#include <stdexcept>

namespace statute_core {

std::string to_string(ContentType type) {
  switch (type) {
    case ContentType::Text:
      return "text";
    case ContentType::Table:
      return "table";
    case ContentType::List:
      return "list";
    case ContentType::Definition:
      return "definition";
    case ContentType::Citation:
      return "citation";
    case ContentType::Mixed:
      return "mixed";
    default:
      return "text";
  }
}

ContentType content_type_from_string(const std::string& str) {
  if (str == "text")
    return ContentType::Text;
  if (str == "table")
    return ContentType::Table;
  if (str == "list")
    return ContentType::List;
  if (str == "definition")
    return ContentType::Definition;
  if (str == "citation")
    return ContentType::Citation;
  if (str == "mixed")
    return ContentType::Mixed;
  throw std::invalid_argument("Unknown ContentType: " + str);
}

void ChunkingConfig::validate() const {
  if (target_words <= 0) {
    throw std::invalid_argument("target_words must be greater than 0");
  }
  if (max_words <= 0) {
    throw std::invalid_argument("max_words must be greater than 0");
  }
  if (target_words > max_words) {
    throw std::invalid_argument("target_words (" + std::to_string(target_words) +
                                ") cannot exceed max_words (" + std::to_string(max_words) + ")");
  }
  if (overlap_sentences < 0) {
    throw std::invalid_argument("overlap_sentences cannot be negative");
  }
  if (std::isnan(semantic_threshold) || semantic_threshold < 0.0f || semantic_threshold > 1.0f) {
    throw std::invalid_argument("semantic_threshold must lie in [0, 1], got " +
                                std::to_string(semantic_threshold));
  }
}

}  // namespace statute_core
