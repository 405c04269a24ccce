#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "statute_core/async/worker.hpp"

namespace statute_core::async {

/**
 * @class WorkerPool
 * @brief Ingests a batch of documents on a fixed number of threads.
 *
 * Documents are independent; the only shared state is the embedding cache and
 * the chunk store, both of which tolerate concurrent writers.
 */
class WorkerPool {
 public:
  WorkerPool(std::size_t num_threads, IngestionService& service);
  ~WorkerPool();

  /**
   * @brief Blocks until every document has been processed.
   *
   * Reports come back in submission order. Rethrows the first configuration
   * error after all workers have stopped.
   */
  std::vector<IngestReport> run_batch(const std::vector<SourceDocument>& documents,
                                      const ChunkingConfig& config);

  std::size_t size() const { return num_threads_; }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::size_t num_threads_;
  IngestionService& service_;
};

}  // namespace statute_core::async
