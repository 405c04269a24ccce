#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "statute_core/llm/embedding_provider.hpp"

namespace statute_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaClient : public EmbeddingProvider {
 public:
  // Throws OllamaError when the server is not reachable.
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model, int dimension);
  ~OllamaClient() override = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;
  std::string model_version() const override;
  int dimension() const override;

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int dimension_;

  void setup_server_connection();
};

}  // namespace statute_core
