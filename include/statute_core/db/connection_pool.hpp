#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace statute_core {

class ConnectionPool {
 public:
  // An empty key opens the database unencrypted.
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  // Blocks until a connection is free.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  // Applies the key and per-connection pragmas to a freshly opened handle.
  static void configure_connection(sqlite::database& db, const std::string& db_key);

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace statute_core
