#include "statute_core/text/sentence_segmenter.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "statute_core/util/text_utils.hpp"

namespace statute_core {

namespace {

const char* const kSectionSign = "\xC2\xA7";
const char* const kPilcrow = "\xC2\xB6";

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_terminal(char c) {
  return c == '.' || c == '?' || c == '!';
}

bool is_closer(char c) {
  return c == '"' || c == '\'' || c == ')' || c == ']';
}

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

// Lowercased tokens, without the trailing period, that a period never terminates.
const std::unordered_set<std::string>& builtin_abbreviations() {
  static const std::unordered_set<std::string> table = {
      // titles
      "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st", "gen", "gov", "sen", "rep", "hon",
      // months
      "jan", "feb", "mar", "apr", "jun", "jul", "aug", "sep", "sept", "oct", "nov", "dec",
      // states
      "ala", "ariz", "ark", "cal", "calif", "colo", "conn", "del", "fla", "ga", "ill", "ind",
      "kan", "ky", "la", "md", "mass", "mich", "minn", "miss", "mo", "mont", "neb", "nev",
      "okla", "ore", "pa", "tenn", "tex", "va", "vt", "wash", "wis", "wyo",
      // corporate
      "inc", "corp", "co", "ltd", "llc", "bros",
      // misc
      "no", "nos", "vol", "vs", "approx", "dept", "est", "fig"};
  return table;
}

}  // namespace

const std::vector<std::string>& SentenceSegmenter::default_domain_abbreviations() {
  static const std::vector<std::string> abbreviations = {
      "U.S.", "Inc.", "Corp.", "Ltd.", "Co.",  "Fla.",   "Cal.", "N.Y.", "Stat.",
      "Rev.", "Art.", "Sec.",  kSectionSign,  kPilcrow, "No.",  "v.",   "et al.",
      "i.e.", "e.g.", "etc.", "Dr.",   "Mr.",  "Mrs.",   "Ms.",  "Prof."};
  return abbreviations;
}

SentenceSegmenter::SentenceSegmenter() : SentenceSegmenter(default_domain_abbreviations()) {}

SentenceSegmenter::SentenceSegmenter(std::vector<std::string> domain_abbreviations)
    : domain_abbreviations_(std::move(domain_abbreviations)),
      common_abbreviations_(builtin_abbreviations()) {}

std::vector<Sentence> SentenceSegmenter::segment(const std::string& text) const {
  return merge_domain_abbreviations(tokenize(text));
}

bool SentenceSegmenter::is_non_terminal_token(const std::string& text,
                                              std::size_t period_pos) const {
  std::size_t start = period_pos;
  while (start > 0 && !is_space(text[start - 1])) {
    --start;
  }
  std::string token = text.substr(start, period_pos - start);
  while (!token.empty() && (token.front() == '(' || token.front() == '"' ||
                            token.front() == '\'' || token.front() == '[')) {
    token.erase(token.begin());
  }
  if (token.empty()) {
    return false;
  }
  // Section and paragraph labels: "§101." never ends a sentence
  if (starts_with(token, kSectionSign) || starts_with(token, kPilcrow)) {
    return true;
  }
  // Initials and dotted forms such as "U.S" or "i.e"
  if (token.size() == 1 && std::isalpha(static_cast<unsigned char>(token[0]))) {
    return true;
  }
  if (token.find('.') != std::string::npos &&
      std::all_of(token.begin(), token.end(), [](char c) {
        return c == '.' || std::isalpha(static_cast<unsigned char>(c));
      })) {
    return true;
  }
  std::string lowered = token;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return common_abbreviations_.count(lowered) > 0;
}

std::vector<Sentence> SentenceSegmenter::tokenize(const std::string& text) const {
  std::vector<Sentence> sentences;
  const std::size_t n = text.size();

  auto skip_space = [&](std::size_t pos) {
    while (pos < n && is_space(text[pos])) {
      ++pos;
    }
    return pos;
  };

  bool next_starts_paragraph = true;
  auto emit = [&](std::size_t begin, std::size_t end) {
    std::string body = trim(std::string_view(text).substr(begin, end - begin));
    if (!body.empty()) {
      sentences.push_back({std::move(body), begin, next_starts_paragraph});
    }
  };

  std::size_t start = skip_space(0);
  std::size_t i = start;
  while (i < n) {
    const char c = text[i];

    if (c == '\n') {
      std::size_t j = i + 1;
      while (j < n && (text[j] == ' ' || text[j] == '\t')) {
        ++j;
      }
      if (j < n && text[j] == '\n') {
        emit(start, i);
        next_starts_paragraph = true;
        start = skip_space(j);
        i = start;
        continue;
      }
    }

    if (is_terminal(c)) {
      std::size_t j = i + 1;
      while (j < n && is_terminal(text[j])) {
        ++j;
      }
      while (j < n && is_closer(text[j])) {
        ++j;
      }
      if (j >= n) {
        break;
      }
      if (is_space(text[j])) {
        if (c == '.' && j == i + 1 && is_non_terminal_token(text, i)) {
          i = j;
          continue;
        }
        emit(start, j);
        const std::size_t next = skip_space(j);
        next_starts_paragraph =
            text.substr(j, next - j).find("\n\n") != std::string::npos;
        start = next;
        i = start;
        continue;
      }
      i = j;
      continue;
    }
    ++i;
  }
  emit(start, n);
  return sentences;
}

bool SentenceSegmenter::ends_with_domain_abbreviation(const std::string& sentence) const {
  const std::string body = trim(sentence);
  for (const auto& abbreviation : domain_abbreviations_) {
    if (abbreviation.empty() || body.size() < abbreviation.size()) {
      continue;
    }
    const std::size_t pos = body.size() - abbreviation.size();
    if (body.compare(pos, abbreviation.size(), abbreviation) != 0) {
      continue;
    }
    // Whole-token match: "Local." does not end with "Cal."
    if (pos == 0 || !std::isalnum(static_cast<unsigned char>(body[pos - 1]))) {
      return true;
    }
  }
  return false;
}

std::vector<Sentence> SentenceSegmenter::merge_domain_abbreviations(
    const std::vector<Sentence>& sentences) const {
  std::vector<Sentence> merged;
  merged.reserve(sentences.size());

  std::size_t i = 0;
  while (i < sentences.size()) {
    const Sentence& current = sentences[i];
    if (i + 1 < sentences.size() && ends_with_domain_abbreviation(current.text) &&
        starts_with_lowercase(sentences[i + 1].text)) {
      merged.push_back(
          {current.text + " " + sentences[i + 1].text, current.offset, current.starts_paragraph});
      i += 2;
      continue;
    }
    merged.push_back(current);
    ++i;
  }
  return merged;
}

}  // namespace statute_core
