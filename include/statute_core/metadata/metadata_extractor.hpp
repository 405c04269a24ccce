#pragma once

#include <functional>
#include <string>
#include <vector>

#include "statute_core/types/chunk.hpp"

namespace statute_core {

/**
 * @brief Fills a chunk's classification fields from its text.
 *
 * Runs a fixed, ordered list of independent steps. A step that throws only
 * resets its own field to the default; the remaining steps still run.
 */
class MetadataExtractor {
 public:
  MetadataExtractor();

  void enrich(Chunk& chunk) const;

  // Chunks are independent, so this spreads them over up to `max_threads` threads.
  void enrich_all(std::vector<Chunk>& chunks, unsigned max_threads = 0) const;

  // definition > citation > table+list (mixed) > table > list > text
  static ContentType classify(const Chunk& chunk);

  std::vector<std::string> step_names() const;

 private:
  struct Step {
    std::string field;
    std::function<void(const std::string&, Chunk&)> run;
  };

  std::vector<Step> steps_;
};

}  // namespace statute_core
