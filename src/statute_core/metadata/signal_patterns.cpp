#include "statute_core/metadata/signal_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_set>

namespace statute_core::signals {

namespace {

// Collects capture group `group` (0 for the whole match) of every match.
void collect(const std::string& text, const std::regex& pattern, int group,
             std::set<std::string>& out) {
  for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
    std::string value = (*it)[group].str();
    if (!value.empty()) {
      out.insert(std::move(value));
    }
  }
}

std::optional<std::vector<std::string>> to_result(const std::set<std::string>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  return std::vector<std::string>(values.begin(), values.end());
}

std::size_t count_matches(const std::string& text, const std::regex& pattern) {
  return static_cast<std::size_t>(
      std::distance(std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
}

}  // namespace

std::optional<bool> detect_table(const std::string& text) {
  static const std::regex table(R"(\|[^\n|]{0,1000}\|[^\n]{0,4000}\n\|[-:| ]{1,1000}\|)");
  if (std::regex_search(text, table)) {
    return true;
  }
  return std::nullopt;
}

std::optional<bool> detect_list(const std::string& text) {
  static const std::regex enumerator(R"(^\((?:\d+|[a-z])\))");
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (std::regex_search(line, enumerator)) {
      return true;
    }
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> find_definitions(const std::string& text) {
  static const std::regex quoted_means("\"([^\"]{1,200})\"\\s+means", std::regex::icase);
  static const std::regex quoted_shall_mean("\"([^\"]{1,200})\"\\s+shall mean",
                                             std::regex::icase);
  static const std::regex bare_means(R"(\b([A-Z][a-z]+(?:\s+[A-Z][a-z]+){0,6})\s+means\b)");
  static const std::regex the_term("the term\\s+\"([^\"]{1,200})\"", std::regex::icase);

  std::set<std::string> terms;
  collect(text, quoted_means, 1, terms);
  collect(text, quoted_shall_mean, 1, terms);
  collect(text, bare_means, 1, terms);
  collect(text, the_term, 1, terms);
  return to_result(terms);
}

std::optional<std::vector<std::string>> find_citations(const std::string& text) {
  static const std::regex federal_code(R"(\d+\s+U\.S\.C\.\s+§\s*\d+)");
  static const std::regex state_statute(R"([A-Z][a-z]{1,4}\.\s+Stat\.(?:\s+§\s*\d+(?:\.\d+)*)?)");
  static const std::regex case_reporter(R"(\d+\s+[A-Z][a-z]+\.\s+\d+)");
  static const std::regex section_sign(R"(§\s*\d+(?:\.\d+)*)");

  std::set<std::string> citations;
  collect(text, federal_code, 0, citations);
  collect(text, state_statute, 0, citations);
  collect(text, case_reporter, 0, citations);
  collect(text, section_sign, 0, citations);
  return to_result(citations);
}

std::optional<std::vector<std::string>> find_cross_references(const std::string& text) {
  static const std::regex section_ref(R"((?:Section|Sec\.|§)\s*(\d+(?:\.\d+)*))");
  static const std::regex node_ref(R"(nodeId=[^\s)]{0,200}?(\d+\.\d+))");

  std::set<std::string> refs;
  collect(text, section_ref, 1, refs);
  collect(text, node_ref, 1, refs);
  return to_result(refs);
}

std::optional<std::vector<std::string>> find_legal_entities(const std::string& text) {
  static const std::regex city(R"(\bCity of [A-Z][a-z]+(?:\s+[A-Z][a-z]+){0,6}\b)");
  static const std::regex county(R"(\b[A-Z][a-z]+\s+County\b)");
  static const std::regex state(R"(\bState of [A-Z][a-z]+\b)");
  static const std::regex commission(R"(\b[A-Z][a-z]+\s+Commission\b)");

  std::set<std::string> entities;
  collect(text, city, 0, entities);
  collect(text, county, 0, entities);
  collect(text, state, 0, entities);
  collect(text, commission, 0, entities);
  return to_result(entities);
}

std::optional<std::vector<std::string>> find_key_phrases(const std::string& text) {
  static const std::regex phrase(R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+){1,3}\b)");
  static const std::unordered_set<std::string> noise = {"The City", "As Provided",
                                                        "In Accordance"};

  std::set<std::string> phrases;
  collect(text, phrase, 0, phrases);
  for (const auto& n : noise) {
    phrases.erase(n);
  }
  if (phrases.empty()) {
    return std::nullopt;
  }
  std::vector<std::string> result(phrases.begin(), phrases.end());
  if (result.size() > MAX_KEY_PHRASES) {
    result.resize(MAX_KEY_PHRASES);
  }
  return result;
}

std::optional<float> semantic_density(const std::string& text) {
  static const std::regex number(R"(\d+)");
  static const std::regex citation_marker(R"(§|\d+\.\d+)");
  static const std::regex capitalised(R"(\b[A-Z][a-z]+\b)");

  std::vector<std::string> words;
  std::stringstream ss(text);
  std::string word;
  while (ss >> word) {
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    words.push_back(word);
  }
  if (words.empty()) {
    return std::nullopt;
  }

  const double total = static_cast<double>(words.size());
  const std::unordered_set<std::string> unique(words.begin(), words.end());
  const double unique_ratio = static_cast<double>(unique.size()) / total;
  const double numbers = static_cast<double>(count_matches(text, number)) / total;
  const double citations = static_cast<double>(count_matches(text, citation_marker)) / total;
  const double caps = static_cast<double>(count_matches(text, capitalised)) / total;

  const double density = unique_ratio * 0.5 + numbers * 0.2 + citations * 0.2 + caps * 0.1;
  return static_cast<float>(std::clamp(density, 0.0, 1.0));
}

}  // namespace statute_core::signals
