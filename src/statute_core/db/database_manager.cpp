#include "statute_core/db/database_manager.hpp"

#include <stdexcept>

namespace statute_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  setup_schema(db_path, db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);
  is_initialized_ = true;
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(init_mutex_);
  return is_initialized_;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  ConnectionPool* pool = nullptr;
  {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (!is_initialized_) {
      throw std::runtime_error("DatabaseManager has not been initialized.");
    }
    pool = pool_.get();
  }
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  ConnectionPool* pool = nullptr;
  {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (!is_initialized_) {
      return;
    }
    pool = pool_.get();
  }
  pool->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  // Single-use connection so table creation is not racing pooled connections.
  sqlite::database db(db_path.string());
  ConnectionPool::configure_connection(db, db_key);

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          document_id TEXT PRIMARY KEY,
          jurisdiction TEXT NOT NULL,
          region TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          version INTEGER NOT NULL,
          chunk_count INTEGER NOT NULL,
          model_version TEXT NOT NULL,
          ingested_at TEXT NOT NULL
      )
    )";

  // Signal sets and structural fields live in the metadata JSON column.
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          source_document_id TEXT NOT NULL,
          chunk_number INTEGER NOT NULL,
          content_hash TEXT NOT NULL,
          jurisdiction TEXT NOT NULL,
          region TEXT NOT NULL,
          content BLOB NOT NULL,
          word_count INTEGER NOT NULL,
          char_count INTEGER NOT NULL,
          metadata TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          UNIQUE (source_document_id, chunk_number),
          FOREIGN KEY (source_document_id) REFERENCES documents(document_id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_region_jurisdiction
      ON chunks(region, jurisdiction)
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS embedding_models (
          model_version TEXT PRIMARY KEY,
          dimension INTEGER NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS embedding_cache (
          content_hash TEXT NOT NULL,
          model_version TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          created_at TEXT NOT NULL DEFAULT (datetime('now')),
          PRIMARY KEY (content_hash, model_version),
          FOREIGN KEY (model_version) REFERENCES embedding_models(model_version)
      )
    )";
}

}  // namespace statute_core
