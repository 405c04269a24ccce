#include "statute_core/util/text_utils.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <cctype>
#include <cstdint>
#include <cwctype>
#include <iomanip>
#include <sstream>

namespace statute_core {

std::string sha256_hex(std::string_view content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw HashError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw HashError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw HashError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw HashError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

int count_words(std::string_view text) {
  int words = 0;
  bool in_word = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return words;
}

int count_code_points(const std::string& text) {
  int count = 0;
  auto it = text.begin();
  while (it != text.end()) {
    try {
      utf8::next(it, text.end());
    } catch (const utf8::exception&) {
      ++it;
    }
    ++count;
  }
  return count;
}

std::string trim(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return std::string(text.substr(start, end - start));
}

bool starts_with_lowercase(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  auto it = text.begin();
  uint32_t code_point = 0;
  try {
    code_point = utf8::next(it, text.end());
  } catch (const utf8::exception&) {
    return false;
  }
  if (code_point < 0x80) {
    return std::islower(static_cast<int>(code_point)) != 0;
  }
  return std::iswlower(static_cast<wint_t>(code_point)) != 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

}  // namespace statute_core
