#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>

#include "statute_core/util/text_utils.hpp"

namespace statute_tests {

std::filesystem::path TestUtilities::create_temp_test_db() {
  auto temp_dir = std::filesystem::temp_directory_path() / "statute_index_tests";
  std::filesystem::create_directories(temp_dir);

  static std::atomic<int> counter{0};
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  return temp_dir /
         ("test_" + std::to_string(timestamp) + "_" + std::to_string(counter++) + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  std::filesystem::remove(db_path.string() + "-wal", ec);
  std::filesystem::remove(db_path.string() + "-shm", ec);

  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir) && std::filesystem::is_empty(parent_dir)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

statute_core::Chunk TestUtilities::create_test_chunk(const std::string& document_id,
                                                     int chunk_number, const std::string& text,
                                                     const std::vector<float>& vector,
                                                     const std::string& jurisdiction,
                                                     const std::string& region) {
  statute_core::Chunk chunk;
  chunk.source_document_id = document_id;
  chunk.chunk_number = chunk_number;
  chunk.jurisdiction = jurisdiction;
  chunk.region = region;
  chunk.text = text;
  chunk.content_hash = statute_core::sha256_hex(text);
  chunk.word_count = statute_core::count_words(text);
  chunk.char_count = statute_core::count_code_points(text);
  chunk.sentence_count = 1;
  chunk.section_id = "UNKNOWN";
  chunk.section_title = "Unknown Section";
  chunk.vector_embedding = vector;
  return chunk;
}

statute_core::DocumentRecord TestUtilities::create_test_document(const std::string& document_id,
                                                                 const std::string& jurisdiction,
                                                                 const std::string& region) {
  statute_core::DocumentRecord record;
  record.document_id = document_id;
  record.jurisdiction = jurisdiction;
  record.region = region;
  record.content_hash = statute_core::sha256_hex(document_id);
  record.model_version = "mock-embed-v1";
  return record;
}

std::vector<statute_core::Sentence> TestUtilities::create_sentences(
    const std::vector<int>& word_counts) {
  std::vector<statute_core::Sentence> sentences;
  std::size_t offset = 0;
  for (size_t i = 0; i < word_counts.size(); ++i) {
    std::string text = "Sentence" + std::to_string(i);
    for (int w = 1; w < word_counts[i]; ++w) {
      text += " word";
    }
    text += ".";
    sentences.push_back({text, offset, i == 0});
    offset += text.size() + 1;
  }
  return sentences;
}

const std::string& TestUtilities::scenario_document() {
  static const std::string document =
      "\xC2\xA7" "101. Setbacks apply to all lots. No structure shall be built within 10 feet "
      "of a property line. Fla. Stat. permits variance requests.";
  return document;
}

}  // namespace statute_tests
