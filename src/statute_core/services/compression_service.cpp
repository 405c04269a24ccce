#include "statute_core/services/compression_service.hpp"

#include <zstd.h>

namespace statute_core {

std::vector<char> CompressionService::compress(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }
  if (level < ZSTD_minCLevel() || level > ZSTD_maxCLevel()) {
    throw CompressionError("zstd level " + std::to_string(level) + " out of range");
  }

  std::vector<char> frame(ZSTD_compressBound(text.size()));
  const size_t written = ZSTD_compress(frame.data(), frame.size(), text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char>& frame) {
  if (frame.empty()) {
    return {};
  }

  const unsigned long long content_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    throw CompressionError("Chunk content is not a zstd frame");
  }
  if (content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("zstd frame does not record its content size");
  }

  std::string text(static_cast<size_t>(content_size), '\0');
  const size_t read = ZSTD_decompress(text.data(), text.size(), frame.data(), frame.size());
  if (ZSTD_isError(read)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != content_size) {
    throw CompressionError("zstd frame truncated: expected " + std::to_string(content_size) +
                           " bytes, got " + std::to_string(read));
  }
  return text;
}

}  // namespace statute_core
