#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "statute_core/db/connection_pool.hpp"

namespace statute_core {

class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Must be called once at application startup. Creates the schema if needed.
  void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  bool is_initialized() const;
  void shutdown();

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
  mutable std::mutex init_mutex_;
};

}  // namespace statute_core
