#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "statute_api/server.hpp"
#include "statute_core/types/document.hpp"

namespace statute_core {
class ChunkStore;
class IngestionService;
class SearchService;
}  // namespace statute_core

namespace statute_api {

class Routes {
 public:
  Routes(std::shared_ptr<statute_core::IngestionService> ingestion_service,
         std::shared_ptr<statute_core::SearchService> search_service,
         std::shared_ptr<statute_core::ChunkStore> chunk_store,
         statute_core::ChunkingConfig default_chunking, int num_workers);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // Handlers are public so tests can drive them without a socket
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_ingest_batch(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_list_jurisdictions(const crow::request &req);
  crow::response handle_get_document_chunks(const crow::request &req,
                                            const std::string &document_id);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);

 private:
  std::shared_ptr<statute_core::IngestionService> ingestion_service_;
  std::shared_ptr<statute_core::SearchService> search_service_;
  std::shared_ptr<statute_core::ChunkStore> chunk_store_;
  statute_core::ChunkingConfig default_chunking_;
  int num_workers_;

  nlohmann::json parse_json_body(const std::string &body);
  std::string require_string(const nlohmann::json &body, const std::string &key);
  std::optional<std::string> optional_string(const nlohmann::json &body, const std::string &key);
  int optional_int(const nlohmann::json &body, const std::string &key, int fallback);
  float optional_number(const nlohmann::json &body, const std::string &key, float fallback);
  statute_core::ChunkingConfig chunking_from_request(const nlohmann::json &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

// Thrown by request parsing; mapped to 400.
class BadRequest : public std::exception {
 public:
  explicit BadRequest(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace statute_api
