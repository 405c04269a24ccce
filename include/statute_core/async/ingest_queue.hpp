#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "statute_core/types/document.hpp"

namespace statute_core::async {

struct IngestJob {
  std::size_t index;  // position in the submitted batch
  SourceDocument document;
};

// Multi-consumer job queue. pop() blocks until a job arrives or the queue is closed.
class IngestQueue {
 public:
  void push(IngestJob job);

  // No further pushes; consumers drain what is left.
  void close();

  // Drops pending jobs and wakes every consumer.
  void abort();

  std::optional<IngestJob> pop();
  std::size_t pending() const;

 private:
  std::deque<IngestJob> jobs_;
  bool closed_ = false;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace statute_core::async
