#include "statute_api/routes.hpp"

#include <iostream>

#include "statute_api/config.hpp"
#include "statute_core/db/chunk_store.hpp"
#include "statute_core/services/ingestion_service.hpp"
#include "statute_core/services/search_service.hpp"
#include "statute_core/types/chunk_json.hpp"

namespace statute_api {

namespace {

int status_for(statute_core::IngestionError::Kind kind) {
  using Kind = statute_core::IngestionError::Kind;
  switch (kind) {
    case Kind::Input:
      return 400;
    case Kind::Conflict:
      return 409;
    default:
      return 500;
  }
}

}  // namespace

Routes::Routes(std::shared_ptr<statute_core::IngestionService> ingestion_service,
               std::shared_ptr<statute_core::SearchService> search_service,
               std::shared_ptr<statute_core::ChunkStore> chunk_store,
               statute_core::ChunkingConfig default_chunking, int num_workers)
    : ingestion_service_(std::move(ingestion_service)),
      search_service_(std::move(search_service)),
      chunk_store_(std::move(chunk_store)),
      default_chunking_(default_chunking),
      num_workers_(num_workers) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/ingest/batch")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_batch(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/jurisdictions")
  ([this](const crow::request &req) { return handle_list_jurisdictions(req); });

  CROW_ROUTE(app, "/documents/<string>/chunks")
  ([this](const crow::request &req, const std::string &document_id) {
    return handle_get_document_chunks(req, document_id);
  });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_delete_document(req, document_id);
          });

  std::cout << "[Server] All routes registered" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("Statute Index API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string document_id = require_string(body, "document_id");
    const std::string region = require_string(body, "region");
    const std::string jurisdiction = body.value("jurisdiction", std::string());
    const std::string text = body.value("text", std::string());
    const auto chunking = chunking_from_request(body);

    const int written =
        ingestion_service_->ingest(document_id, jurisdiction, region, text, chunking);

    nlohmann::json data;
    data["document_id"] = document_id;
    data["chunks_written"] = written;
    data["skipped"] = written == 0;
    return create_json_response(create_success_response("Document ingested", data));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const statute_core::IngestionError &e) {
    std::cerr << "[Ingest] " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), status_for(e.kind()));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ingest_batch(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    if (!body.contains("documents") || !body["documents"].is_array()) {
      throw BadRequest("'documents' must be an array");
    }
    std::vector<statute_core::SourceDocument> documents;
    for (const auto &item : body["documents"]) {
      statute_core::SourceDocument doc;
      doc.document_id = require_string(item, "document_id");
      doc.region = require_string(item, "region");
      doc.jurisdiction = item.value("jurisdiction", std::string());
      doc.raw_text = item.value("text", std::string());
      documents.push_back(std::move(doc));
    }
    const auto chunking = chunking_from_request(body);

    auto reports = ingestion_service_->ingest_batch(documents, chunking, num_workers_);

    nlohmann::json results = nlohmann::json::array();
    for (const auto &report : reports) {
      nlohmann::json r;
      r["document_id"] = report.document_id;
      r["chunks_written"] = report.chunks_written;
      if (report.error) {
        r["error"] = *report.error;
        r["error_kind"] = statute_core::IngestionError::kind_to_string(*report.error_kind);
      }
      results.push_back(r);
    }
    return create_json_response(create_success_response("Batch processed", results));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const statute_core::IngestionError &e) {
    std::cerr << "[Batch] " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), status_for(e.kind()));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest_batch: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string query = require_string(body, "query");
    const std::string region = require_string(body, "region");
    const std::optional<std::string> jurisdiction = optional_string(body, "jurisdiction");
    const int top_k = optional_int(body, "top_k", statute_core::SearchService::DEFAULT_TOP_K);
    const float min_relevance = optional_number(body, "min_relevance", 0.0f);

    auto hits = search_service_->search(query, jurisdiction, region, top_k, min_relevance);

    nlohmann::json results = nlohmann::json::array();
    for (const auto &hit : hits) {
      nlohmann::json r;
      r["content"] = hit.content;
      r["jurisdiction"] = hit.jurisdiction;
      r["source_document_id"] = hit.source_document_id;
      r["chunk_number"] = hit.chunk_number;
      r["relevance_score"] = hit.relevance_score;
      r["section_id"] = hit.section_id;
      r["section_title"] = hit.section_title;
      results.push_back(r);
    }
    nlohmann::json response = create_success_response("Search completed");
    response["results"] = results;
    return create_json_response(response);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const statute_core::SearchInputError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_jurisdictions(const crow::request &req) {
  try {
    const char *region = req.url_params.get("region");
    if (!region || std::string(region).empty()) {
      throw BadRequest("'region' query parameter is required");
    }
    auto counts = search_service_->list_jurisdictions(region);

    nlohmann::json results = nlohmann::json::array();
    for (const auto &count : counts) {
      results.push_back({{"jurisdiction", count.jurisdiction}, {"chunk_count", count.chunk_count}});
    }
    return create_json_response(create_success_response("Jurisdictions retrieved", results));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_jurisdictions: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_document_chunks(const crow::request &,
                                                  const std::string &document_id) {
  try {
    auto document = chunk_store_->get_document(document_id);
    if (!document) {
      return create_json_response(create_error_response("Document not found: " + document_id),
                                  404);
    }
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &chunk : chunk_store_->get_document_chunks(document_id)) {
      chunks.push_back(statute_core::chunk_to_json(chunk));
    }
    nlohmann::json data;
    data["document_id"] = document->document_id;
    data["version"] = document->version;
    data["model_version"] = document->model_version;
    data["chunks"] = chunks;
    return create_json_response(create_success_response("Chunks retrieved", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_document_chunks: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_document(const crow::request &,
                                              const std::string &document_id) {
  try {
    if (!chunk_store_->delete_document(document_id)) {
      return create_json_response(create_error_response("Document not found: " + document_id),
                                  404);
    }
    return create_json_response(create_success_response("Document deleted"));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    auto json = nlohmann::json::parse(body);
    if (!json.is_object()) {
      throw BadRequest("Request body must be a JSON object");
    }
    return json;
  } catch (const nlohmann::json::parse_error &e) {
    throw BadRequest(std::string("Malformed JSON: ") + e.what());
  }
}

std::string Routes::require_string(const nlohmann::json &body, const std::string &key) {
  if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
    throw BadRequest("'" + key + "' is required");
  }
  return body[key].get<std::string>();
}

std::optional<std::string> Routes::optional_string(const nlohmann::json &body,
                                                   const std::string &key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  if (!body[key].is_string()) {
    throw BadRequest("'" + key + "' must be a string");
  }
  return body[key].get<std::string>();
}

int Routes::optional_int(const nlohmann::json &body, const std::string &key, int fallback) {
  if (!body.contains(key) || body[key].is_null()) {
    return fallback;
  }
  if (!body[key].is_number_integer()) {
    throw BadRequest("'" + key + "' must be an integer");
  }
  return body[key].get<int>();
}

float Routes::optional_number(const nlohmann::json &body, const std::string &key, float fallback) {
  if (!body.contains(key) || body[key].is_null()) {
    return fallback;
  }
  if (!body[key].is_number()) {
    throw BadRequest("'" + key + "' must be a number");
  }
  return body[key].get<float>();
}

statute_core::ChunkingConfig Routes::chunking_from_request(const nlohmann::json &body) {
  if (!body.contains("config")) {
    return default_chunking_;
  }
  try {
    return Config::chunking_from_json(body["config"], default_chunking_);
  } catch (const std::runtime_error &e) {
    throw BadRequest(e.what());
  }
}

}  // namespace statute_api
