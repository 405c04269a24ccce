#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "statute_core/types/document.hpp"

namespace statute_api {

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_batch_size;
  int num_workers;
  int db_pool_size;

  // Defaults for ingestion requests that do not send their own
  statute_core::ChunkingConfig chunking;

  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.database_path = json_config.value("database_path", std::string("./data/statutes.db"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.embedding_dimension = int_or_default(json_config, "embedding_dimension", 1024);
    config.embedding_batch_size = int_or_default(json_config, "embedding_batch_size", 32);
    config.num_workers = int_or_default(json_config, "num_workers", 1);
    config.db_pool_size = int_or_default(json_config, "db_pool_size", 4);

    if (json_config.contains("chunking")) {
      config.chunking = chunking_from_json(json_config.at("chunking"), config.chunking);
    }

    config.validate();
    return config;
  }

  // Overlays the keys present in `json` on `base`. Throws std::runtime_error on an invalid result.
  static statute_core::ChunkingConfig chunking_from_json(
      const nlohmann::json& json, const statute_core::ChunkingConfig& base) {
    if (!json.is_object()) {
      throw std::runtime_error("chunking must be an object");
    }
    statute_core::ChunkingConfig chunking = base;
    try {
      chunking.target_words = json.value("target_words", base.target_words);
      chunking.max_words = json.value("max_words", base.max_words);
      chunking.overlap_sentences = json.value("overlap_sentences", base.overlap_sentences);
      chunking.semantic_threshold = json.value("semantic_threshold", base.semantic_threshold);
      chunking.use_semantic_boundaries =
          json.value("use_semantic_boundaries", base.use_semantic_boundaries);
      chunking.validate();
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid chunking config: ") + e.what());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(std::string("Invalid chunking config: ") + e.what());
    }
    return chunking;
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    // Wrong types fall back to the default
    if (json_config.contains(key) && json_config.at(key).is_number_integer()) {
      return json_config.at(key).get<int>();
    }
    return fallback;
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
  }
};

}  // namespace statute_api
