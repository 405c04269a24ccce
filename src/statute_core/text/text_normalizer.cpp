#include "statute_core/text/text_normalizer.hpp"

#include <utf8.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <regex>
#include <sstream>
#include <utility>

#include "statute_core/util/text_utils.hpp"

namespace statute_core {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Erases every `open ... close` span, shortest match first. An `open` with no
// later `close` is left in place.
void erase_delimited(std::string& text, const std::string& open, const std::string& close,
                     bool single_line) {
  size_t pos = 0;
  while ((pos = text.find(open, pos)) != std::string::npos) {
    const size_t close_pos = text.find(close, pos + open.size());
    if (close_pos == std::string::npos) {
      return;
    }
    if (single_line && text.find('\n', pos) < close_pos) {
      pos += open.size();
      continue;
    }
    text.erase(pos, close_pos + close.size() - pos);
  }
}

bool is_horizontal_space(char c) {
  return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

// Collapses horizontal whitespace runs to one space and trims the line.
std::string squeeze_line(const std::string& line) {
  std::string out;
  out.reserve(line.size());
  bool pending_space = false;
  for (char c : line) {
    if (is_horizontal_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += c;
  }
  return out;
}

bool is_meaningful_alt_text(const std::string& alt_text) {
  if (count_code_points(alt_text) <= 10) {
    return false;
  }
  std::string lowered = alt_text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  static const std::array<const char*, 4> kDecorative = {"logo", "icon", "button", "image"};
  return std::none_of(kDecorative.begin(), kDecorative.end(), [&](const char* word) {
    return lowered.find(word) != std::string::npos;
  });
}

}  // namespace

std::string TextNormalizer::normalize(const std::string& raw_text) const {
  std::string text;
  text.reserve(raw_text.size());
  utf8::replace_invalid(raw_text.begin(), raw_text.end(), std::back_inserter(text));

  text = strip_navigation(text);
  text = rewrite_images(text);
  text = normalize_quotes(text);
  text = normalize_whitespace(text);
  return text;
}

std::string TextNormalizer::strip_navigation(const std::string& text) const {
  std::string out = text;
  erase_delimited(out, "Share Link to section", "Compare versions", false);
  erase_delimited(out, "Print section", "Email section", true);
  replace_all(out, "Loading, please wait", "");
  erase_delimited(out, "Show Changes", "more", false);
  return out;
}

std::string TextNormalizer::rewrite_images(const std::string& text) const {
  static const std::regex image(R"(!\[([^\]\n]{0,500})\]\(([^)\s]{0,2000})\))");

  std::string out;
  auto last = text.cbegin();
  for (std::sregex_iterator it(text.begin(), text.end(), image), end; it != end; ++it) {
    const std::smatch& match = *it;
    out.append(last, match[0].first);
    const std::string alt_text = match[1].str();
    if (is_meaningful_alt_text(alt_text)) {
      out += "[Image: " + alt_text + "]";
    }
    last = match[0].second;
  }
  out.append(last, text.cend());
  return out;
}

std::string TextNormalizer::normalize_quotes(const std::string& text) const {
  static const std::array<std::pair<const char*, const char*>, 4> kQuotes = {{
      {"\xE2\x80\x9C", "\""},
      {"\xE2\x80\x9D", "\""},
      {"\xE2\x80\x98", "'"},
      {"\xE2\x80\x99", "'"},
  }};
  std::string out = text;
  for (const auto& [from, to] : kQuotes) {
    replace_all(out, from, to);
  }
  return out;
}

std::string TextNormalizer::normalize_whitespace(const std::string& text) const {
  std::string unified = text;
  replace_all(unified, "\r\n", "\n");
  replace_all(unified, "\r", "\n");

  std::string out;
  out.reserve(unified.size());
  int blank_lines = 0;
  std::stringstream ss(unified);
  std::string line;
  bool first = true;
  while (std::getline(ss, line)) {
    std::string squeezed = squeeze_line(line);
    if (squeezed.empty()) {
      ++blank_lines;
      continue;
    }
    if (!first) {
      out += blank_lines > 0 ? "\n\n" : "\n";
    }
    out += squeezed;
    blank_lines = 0;
    first = false;
  }
  return trim(out);
}

}  // namespace statute_core
