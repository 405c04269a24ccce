#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "statute_api/config.hpp"
#include "statute_api/routes.hpp"
#include "statute_api/server.hpp"
#include "statute_core/db/chunk_store.hpp"
#include "statute_core/db/database_manager.hpp"
#include "statute_core/db/embedding_cache.hpp"
#include "statute_core/embedding/embedding_service.hpp"
#include "statute_core/llm/ollama_client.hpp"
#include "statute_core/services/ingestion_service.hpp"
#include "statute_core/services/search_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  try {
    statute_api::Config config = statute_api::Config::from_file("statuterc.json");

    // An unset key opens the database unencrypted
    const char *key_env = std::getenv("STATUTE_DB_KEY");
    std::string db_key = key_env ? key_env : "";

    std::cout << "Starting Statute Index API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (dimension "
              << config.embedding_dimension << ")" << std::endl;
    std::cout << "Database Encryption: " << (db_key.empty() ? "Off" : "On") << std::endl;

    auto ollama_client = std::make_shared<statute_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.embedding_dimension);
    auto &db_manager = statute_core::DatabaseManager::get_instance();
    db_manager.initialize(config.database_path, db_key, config.db_pool_size);

    auto embedding_cache = std::make_shared<statute_core::EmbeddingCache>(db_manager);
    auto embedding_service = std::make_shared<statute_core::EmbeddingService>(
        ollama_client, embedding_cache, static_cast<std::size_t>(config.embedding_batch_size));
    auto chunk_store =
        std::make_shared<statute_core::ChunkStore>(db_manager, config.embedding_dimension);
    auto ingestion_service =
        std::make_shared<statute_core::IngestionService>(chunk_store, embedding_service);
    auto search_service =
        std::make_shared<statute_core::SearchService>(chunk_store, embedding_service);

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    statute_api::Server server(host, port);
    statute_api::Routes routes(ingestion_service, search_service, chunk_store, config.chunking,
                               config.num_workers);
    routes.register_routes(server);

    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
