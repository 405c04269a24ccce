#include "statute_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace statute_core::async {

Worker::Worker(int worker_id, IngestQueue& queue, IngestionService& service, BatchState& state)
    : worker_id_(worker_id), queue_(queue), service_(service), state_(state) {}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::process(const IngestJob& job) {
  IngestReport report;
  report.document_id = job.document.document_id;
  try {
    report.chunks_written = service_.ingest(job.document, state_.config);
  } catch (const IngestionError& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR ingesting " << job.document.document_id
              << ": " << e.what() << std::endl;
    report.error = e.what();
    report.error_kind = e.kind();
    if (e.kind() == IngestionError::Kind::Configuration) {
      {
        std::lock_guard<std::mutex> lock(state_.mtx);
        if (!state_.fatal) {
          state_.fatal = e;
        }
      }
      queue_.abort();
    }
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] unexpected failure on " << job.document.document_id
              << ": " << e.what() << std::endl;
    report.error = e.what();
    report.error_kind = IngestionError::Kind::Internal;
  }
  std::lock_guard<std::mutex> lock(state_.mtx);
  state_.reports[job.index] = std::move(report);
}

void Worker::run_loop() {
  while (!should_stop_.load()) {
    std::optional<IngestJob> job = queue_.pop();
    if (!job) {
      break;
    }
    process(*job);
  }
}

}  // namespace statute_core::async
