#pragma once

#include <optional>
#include <string>
#include <vector>

// Independent classifiers over chunk text. Each returns std::nullopt when the
// signal is absent; set-valued results are sorted and de-duplicated.
namespace statute_core::signals {

// Markdown pipe table with a header separator row.
std::optional<bool> detect_table(const std::string& text);

// A line starting with "(1)" or "(a)".
std::optional<bool> detect_list(const std::string& text);

std::optional<std::vector<std::string>> find_definitions(const std::string& text);
std::optional<std::vector<std::string>> find_citations(const std::string& text);

// Section numbers referenced by "Section 4.2", "Sec. 7" or "§ 101".
std::optional<std::vector<std::string>> find_cross_references(const std::string& text);

std::optional<std::vector<std::string>> find_legal_entities(const std::string& text);

// Capitalised 2-4 word phrases, at most MAX_KEY_PHRASES.
std::optional<std::vector<std::string>> find_key_phrases(const std::string& text);

// Information-richness heuristic in [0, 1].
std::optional<float> semantic_density(const std::string& text);

constexpr std::size_t MAX_KEY_PHRASES = 10;

}  // namespace statute_core::signals
