#pragma once

#include <nlohmann/json.hpp>

#include "statute_core/types/chunk.hpp"

namespace statute_core {

// Structural and classification fields, i.e. everything except text, size
// metrics, identity and the vector. Stored in chunks.metadata.
nlohmann::json chunk_metadata_to_json(const Chunk& chunk);
void chunk_metadata_from_json(const nlohmann::json& metadata, Chunk& chunk);

// Full record as served by the API (no vector).
nlohmann::json chunk_to_json(const Chunk& chunk);

}  // namespace statute_core
