#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "statute_core/async/ingest_queue.hpp"
#include "statute_core/services/ingestion_service.hpp"

namespace statute_core::async {

// Shared by the workers of one batch.
struct BatchState {
  ChunkingConfig config;
  std::vector<IngestReport> reports;  // one slot per job index
  std::mutex mtx;
  std::optional<IngestionError> fatal;
};

/**
 * @class Worker
 * @brief One thread draining the ingest queue.
 *
 * A configuration error aborts the queue so sibling workers stop picking up
 * jobs; any other failure is recorded in the job's report and the loop goes on.
 */
class Worker {
 public:
  Worker(int worker_id, IngestQueue& queue, IngestionService& service, BatchState& state);

  // Stops and joins.
  ~Worker();

  void start();
  void stop();
  void join();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

  // Processes a single job on the calling thread.
  void process(const IngestJob& job);

 private:
  void run_loop();

  int worker_id_;
  IngestQueue& queue_;
  IngestionService& service_;
  BatchState& state_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace statute_core::async
