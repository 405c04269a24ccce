#pragma once

#include <string>

namespace statute_core {

// Cleans scraped ordinance text before segmentation: strips site navigation,
// rewrites markdown images, normalizes quotes and whitespace.
class TextNormalizer {
 public:
  std::string normalize(const std::string& raw_text) const;

 private:
  std::string strip_navigation(const std::string& text) const;
  std::string rewrite_images(const std::string& text) const;
  std::string normalize_quotes(const std::string& text) const;
  std::string normalize_whitespace(const std::string& text) const;
};

}  // namespace statute_core
