#include "statute_core/async/worker_pool.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace statute_core::async {

WorkerPool::WorkerPool(std::size_t num_threads, IngestionService& service)
    : num_threads_(num_threads), service_(service) {
  if (num_threads_ == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }
}

WorkerPool::~WorkerPool() = default;

std::vector<IngestReport> WorkerPool::run_batch(const std::vector<SourceDocument>& documents,
                                                const ChunkingConfig& config) {
  if (documents.empty()) {
    return {};
  }

  BatchState state;
  state.config = config;
  state.reports.resize(documents.size());

  IngestQueue queue;
  for (std::size_t i = 0; i < documents.size(); ++i) {
    queue.push({i, documents[i]});
  }
  queue.close();

  const std::size_t thread_count = std::min(num_threads_, documents.size());
  std::cout << "[Batch] Ingesting " << documents.size() << " documents on " << thread_count
            << " workers" << std::endl;
  {
    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
      workers.push_back(std::make_unique<Worker>(static_cast<int>(i), queue, service_, state));
    }
    for (const auto& worker : workers) {
      worker->start();
    }
    for (const auto& worker : workers) {
      worker->join();
    }
  }

  if (state.fatal) {
    throw *state.fatal;
  }

  for (std::size_t i = 0; i < documents.size(); ++i) {
    if (state.reports[i].document_id.empty()) {
      state.reports[i].document_id = documents[i].document_id;
    }
  }
  return std::move(state.reports);
}

}  // namespace statute_core::async
