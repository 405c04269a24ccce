#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace statute_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Zstandard frames for chunk bodies at rest. Empty input maps to an empty frame.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  static std::vector<char> compress(std::string_view text, int level = DEFAULT_LEVEL);

  // Throws CompressionError for data that is not a single sized zstd frame.
  static std::string decompress(const std::vector<char>& frame);
};

}  // namespace statute_core
