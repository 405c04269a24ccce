#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace statute_core {

class HashError : public std::exception {
 public:
  explicit HashError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lowercase hex SHA-256 of the raw bytes.
std::string sha256_hex(std::string_view content);

// Whitespace-separated tokens.
int count_words(std::string_view text);

// Unicode code points; invalid UTF-8 sequences count one per byte.
int count_code_points(const std::string& text);

std::string trim(std::string_view text);

// True when the first code point of `text` is a lowercase letter.
bool starts_with_lowercase(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

}  // namespace statute_core
