#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace statute_core {

struct Sentence {
  std::string text;
  // Byte offset of the sentence's first character in the normalized text.
  std::size_t offset = 0;
  bool starts_paragraph = false;
};

/**
 * @brief Splits normalized legal text into sentences.
 *
 * Runs a general tokenizer first, then a merge pass that rejoins sentences the
 * tokenizer cut after a legal abbreviation ("Fla. Stat. permits ...").
 */
class SentenceSegmenter {
 public:
  SentenceSegmenter();
  explicit SentenceSegmenter(std::vector<std::string> domain_abbreviations);

  std::vector<Sentence> segment(const std::string& text) const;

  // Exposed for testing
  std::vector<Sentence> tokenize(const std::string& text) const;
  std::vector<Sentence> merge_domain_abbreviations(const std::vector<Sentence>& sentences) const;
  bool ends_with_domain_abbreviation(const std::string& sentence) const;

  static const std::vector<std::string>& default_domain_abbreviations();

 private:
  bool is_non_terminal_token(const std::string& text, std::size_t period_pos) const;

  std::vector<std::string> domain_abbreviations_;
  std::unordered_set<std::string> common_abbreviations_;
};

}  // namespace statute_core
