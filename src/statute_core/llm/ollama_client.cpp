#include "statute_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace statute_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model,
                           int dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

// Sends the whole batch in one /api/embed request; "input" accepts an array.
std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  try {
    ollama::request request = ollama::request::from_embedding(embedding_model_, texts.front());
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() != texts.size()) {
      throw OllamaError("Expected " + std::to_string(texts.size()) + " embeddings, got " +
                        std::to_string(embeddings.size()));
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(embeddings.size());
    for (const auto &embedding : embeddings) {
      vectors.push_back(embedding.get<std::vector<float>>());
    }
    return vectors;
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::string OllamaClient::model_version() const {
  return embedding_model_;
}

int OllamaClient::dimension() const {
  return dimension_;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace statute_core
