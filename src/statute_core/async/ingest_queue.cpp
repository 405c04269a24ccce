#include "statute_core/async/ingest_queue.hpp"

#include <stdexcept>

namespace statute_core::async {

void IngestQueue::push(IngestJob job) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      throw std::runtime_error("Cannot push to a closed ingest queue");
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void IngestQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
}

void IngestQueue::abort() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    jobs_.clear();
  }
  cv_.notify_all();
}

std::optional<IngestJob> IngestQueue::pop() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return closed_ || !jobs_.empty(); });
  if (jobs_.empty()) {
    return std::nullopt;
  }
  IngestJob job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

std::size_t IngestQueue::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return jobs_.size();
}

}  // namespace statute_core::async
