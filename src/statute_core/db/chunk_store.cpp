#include "statute_core/db/chunk_store.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unordered_map>

#include "statute_core/db/pooled_connection.hpp"
#include "statute_core/db/sqlite_error_utils.hpp"
#include "statute_core/db/transaction.hpp"
#include "statute_core/services/compression_service.hpp"
#include "statute_core/types/chunk_json.hpp"
#include "statute_core/util/vector_math.hpp"

namespace statute_core {

namespace {

const char *const kChunkColumns =
    "id, source_document_id, chunk_number, content_hash, jurisdiction, region, content, "
    "word_count, char_count, metadata, vector_blob";

std::string id_list(const std::vector<faiss::idx_t> &ids) {
  std::string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += std::to_string(ids[i]);
  }
  return out;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vec(blob.size() / sizeof(float));
  std::memcpy(vec.data(), blob.data(), vec.size() * sizeof(float));
  return vec;
}

// Row reader shared by every query selecting kChunkColumns.
struct ChunkRowReader {
  std::unordered_map<faiss::idx_t, Chunk> &out;
  std::vector<faiss::idx_t> *order;

  void operator()(int64_t id, std::string source_document_id, int chunk_number,
                  std::string content_hash, std::string jurisdiction, std::string region,
                  std::vector<char> content, int word_count, int char_count, std::string metadata,
                  std::vector<char> vector_blob) const {
    Chunk chunk;
    chunk.source_document_id = std::move(source_document_id);
    chunk.chunk_number = chunk_number;
    chunk.content_hash = std::move(content_hash);
    chunk.jurisdiction = std::move(jurisdiction);
    chunk.region = std::move(region);
    chunk.text = CompressionService::decompress(content);
    chunk.word_count = word_count;
    chunk.char_count = char_count;
    chunk_metadata_from_json(nlohmann::json::parse(metadata), chunk);
    chunk.vector_embedding = blob_to_vector(vector_blob);
    out.emplace(id, std::move(chunk));
    if (order) {
      order->push_back(id);
    }
  }
};

}  // namespace

std::string ChunkStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point ChunkStore::string_to_time_point(const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw ChunkStoreError("Failed to parse time string: " + time_str +
                          ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

ChunkStore::ChunkStore(DatabaseManager &db_manager, int vector_dimension)
    : db_manager_(db_manager), vector_dimension_(vector_dimension) {
  if (vector_dimension_ <= 0) {
    throw ChunkStoreError("Vector dimension must be positive, got " +
                          std::to_string(vector_dimension_));
  }
}

std::vector<char> ChunkStore::vector_to_blob(const std::vector<float> &vec,
                                             const std::string &context) const {
  if (static_cast<int>(vec.size()) != vector_dimension_) {
    throw ChunkStoreError("Vector embedding size mismatch for " + context + ". Expected " +
                          std::to_string(vector_dimension_) + " dimensions, got " +
                          std::to_string(vec.size()) + ".");
  }
  std::vector<char> blob(vec.size() * sizeof(float));
  std::memcpy(blob.data(), vec.data(), blob.size());
  return blob;
}

int ChunkStore::current_version(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    int version = 0;
    *conn << "SELECT version FROM documents WHERE document_id = ?" << document_id >>
        [&](int v) { version = v; };
    return version;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("current_version", e));
  }
}

std::optional<DocumentRecord> ChunkStore::get_document(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<DocumentRecord> record;
    *conn << "SELECT document_id, jurisdiction, region, content_hash, version, chunk_count, "
             "model_version, ingested_at FROM documents WHERE document_id = ?"
          << document_id >>
        [&](std::string id, std::string jurisdiction, std::string region, std::string hash,
            int version, int chunk_count, std::string model_version, std::string ingested_at) {
          DocumentRecord r;
          r.document_id = std::move(id);
          r.jurisdiction = std::move(jurisdiction);
          r.region = std::move(region);
          r.content_hash = std::move(hash);
          r.version = version;
          r.chunk_count = chunk_count;
          r.model_version = std::move(model_version);
          r.ingested_at = string_to_time_point(ingested_at);
          record = std::move(r);
        };
    return record;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("get_document", e));
  }
}

int ChunkStore::replace_document_chunks(const DocumentRecord &document, int expected_version,
                                        const std::vector<Chunk> &chunks) {
  // Encode outside the transaction so the write lock is held only for SQL.
  std::vector<std::vector<char>> contents;
  std::vector<std::vector<char>> blobs;
  std::vector<std::string> metadata;
  contents.reserve(chunks.size());
  blobs.reserve(chunks.size());
  metadata.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    blobs.push_back(vector_to_blob(chunk.vector_embedding,
                                   document.document_id + "#" + std::to_string(chunk.chunk_number)));
    contents.push_back(CompressionService::compress(chunk.text));
    metadata.push_back(chunk_metadata_to_json(chunk).dump());
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    int stored_version = 0;
    *conn << "SELECT version FROM documents WHERE document_id = ?" << document.document_id >>
        [&](int v) { stored_version = v; };
    if (stored_version != expected_version) {
      throw IngestConflictError(document.document_id, expected_version, stored_version);
    }

    const int new_version = stored_version + 1;
    const std::string ingested_at = time_point_to_string(std::chrono::system_clock::now());
    const int chunk_count = static_cast<int>(chunks.size());

    if (stored_version == 0) {
      *conn << "INSERT INTO documents (document_id, jurisdiction, region, content_hash, version, "
               "chunk_count, model_version, ingested_at) VALUES (?,?,?,?,?,?,?,?)"
            << document.document_id << document.jurisdiction << document.region
            << document.content_hash << new_version << chunk_count << document.model_version
            << ingested_at;
    } else {
      *conn << "UPDATE documents SET jurisdiction=?, region=?, content_hash=?, version=?, "
               "chunk_count=?, model_version=?, ingested_at=? WHERE document_id=? AND version=?"
            << document.jurisdiction << document.region << document.content_hash << new_version
            << chunk_count << document.model_version << ingested_at << document.document_id
            << stored_version;
    }

    *conn << "DELETE FROM chunks WHERE source_document_id = ?" << document.document_id;

    for (size_t i = 0; i < chunks.size(); ++i) {
      const Chunk &chunk = chunks[i];
      *conn << "INSERT INTO chunks (source_document_id, chunk_number, content_hash, jurisdiction, "
               "region, content, word_count, char_count, metadata, vector_blob) "
               "VALUES (?,?,?,?,?,?,?,?,?,?)"
            << document.document_id << chunk.chunk_number << chunk.content_hash
            << document.jurisdiction << document.region << contents[i] << chunk.word_count
            << chunk.char_count << metadata[i] << blobs[i];
    }

    tx.commit();
    return new_version;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("replace_document_chunks", e));
  }
}

std::vector<Chunk> ChunkStore::get_document_chunks(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    std::unordered_map<faiss::idx_t, Chunk> rows;
    std::vector<faiss::idx_t> order;
    *conn << std::string("SELECT ") + kChunkColumns +
                 " FROM chunks WHERE source_document_id = ? ORDER BY chunk_number"
          << document_id >>
        ChunkRowReader{rows, &order};

    std::vector<Chunk> chunks;
    chunks.reserve(order.size());
    for (auto id : order) {
      chunks.push_back(std::move(rows.at(id)));
    }
    return chunks;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("get_document_chunks", e));
  }
}

bool ChunkStore::delete_document(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "DELETE FROM chunks WHERE source_document_id = ?" << document_id;
    *conn << "DELETE FROM documents WHERE document_id = ?" << document_id;
    const bool existed = conn->rows_modified() > 0;
    tx.commit();
    return existed;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("delete_document", e));
  }
}

std::unordered_map<faiss::idx_t, Chunk> ChunkStore::load_chunks(
    sqlite::database &db, const std::vector<faiss::idx_t> &ids) {
  std::unordered_map<faiss::idx_t, Chunk> rows;
  if (ids.empty()) {
    return rows;
  }
  db << std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE id IN (" + id_list(ids) + ")" >>
      ChunkRowReader{rows, nullptr};
  return rows;
}

std::vector<ChunkSearchResult> ChunkStore::search_similar_chunks(
    const std::vector<float> &query_vector, const std::string &region,
    const std::optional<std::string> &jurisdiction, int top_k, float min_relevance) {
  if (static_cast<int>(query_vector.size()) != vector_dimension_) {
    throw ChunkStoreError("Query vector dimension mismatch. Expected " +
                          std::to_string(vector_dimension_) + ", got " +
                          std::to_string(query_vector.size()));
  }
  if (top_k <= 0) {
    return {};
  }

  try {
    // Load the filtered vectors first so the FAISS search runs without holding a connection
    std::vector<Candidate> candidates;
    std::vector<faiss::idx_t> faiss_ids;
    std::vector<float> all_vectors_flat;
    {
      PooledConnection conn(db_manager_);
      auto collect = [&](int64_t id, std::string document_id, int chunk_number,
                         std::vector<char> vector_blob) {
        if (vector_blob.size() != static_cast<size_t>(vector_dimension_) * sizeof(float)) {
          std::cerr << "[ChunkStore] Skipping chunk " << id
                    << " with mismatched vector size: " << vector_blob.size() << " bytes"
                    << std::endl;
          return;
        }
        std::vector<float> vec = blob_to_vector(vector_blob);
        l2_normalize(vec);
        all_vectors_flat.insert(all_vectors_flat.end(), vec.begin(), vec.end());
        faiss_ids.push_back(id);
        candidates.push_back({id, std::move(document_id), chunk_number});
      };

      if (jurisdiction) {
        *conn << "SELECT id, source_document_id, chunk_number, vector_blob FROM chunks "
                 "WHERE region = ? AND jurisdiction = ?"
              << region << *jurisdiction >>
            collect;
      } else {
        *conn << "SELECT id, source_document_id, chunk_number, vector_blob FROM chunks "
                 "WHERE region = ?"
              << region >>
            collect;
      }
    }

    if (candidates.empty()) {
      return {};
    }

    faiss::IndexIDMap index(new faiss::IndexFlatIP(vector_dimension_));
    index.own_fields = true;
    index.add_with_ids(static_cast<faiss::idx_t>(candidates.size()), all_vectors_flat.data(),
                       faiss_ids.data());

    std::vector<float> query = query_vector;
    l2_normalize(query);

    // Score every candidate; ordering and cut-off are applied below so ties are deterministic
    const faiss::idx_t k = index.ntotal;
    std::vector<float> scores(k);
    std::vector<faiss::idx_t> labels(k);
    index.search(1, query.data(), k, scores.data(), labels.data());

    std::unordered_map<faiss::idx_t, const Candidate *> by_id;
    for (const auto &c : candidates) {
      by_id.emplace(c.id, &c);
    }

    struct Hit {
      const Candidate *candidate;
      float relevance;
    };
    std::vector<Hit> hits;
    for (faiss::idx_t i = 0; i < k; ++i) {
      if (labels[i] < 0) {
        continue;
      }
      const float relevance = std::clamp(scores[i], 0.0f, 1.0f);
      if (relevance < min_relevance) {
        continue;
      }
      hits.push_back({by_id.at(labels[i]), relevance});
    }

    std::sort(hits.begin(), hits.end(), [](const Hit &a, const Hit &b) {
      if (a.relevance != b.relevance)
        return a.relevance > b.relevance;
      if (a.candidate->chunk_number != b.candidate->chunk_number)
        return a.candidate->chunk_number < b.candidate->chunk_number;
      if (a.candidate->source_document_id != b.candidate->source_document_id)
        return a.candidate->source_document_id < b.candidate->source_document_id;
      return a.candidate->id < b.candidate->id;
    });
    if (hits.size() > static_cast<size_t>(top_k)) {
      hits.resize(top_k);
    }

    std::vector<faiss::idx_t> selected;
    selected.reserve(hits.size());
    for (const auto &hit : hits) {
      selected.push_back(hit.candidate->id);
    }

    std::unordered_map<faiss::idx_t, Chunk> rows;
    {
      PooledConnection conn(db_manager_);
      rows = load_chunks(*conn, selected);
    }

    std::vector<ChunkSearchResult> results;
    results.reserve(hits.size());
    for (const auto &hit : hits) {
      auto it = rows.find(hit.candidate->id);
      if (it == rows.end()) {
        // Deleted between the two reads
        continue;
      }
      ChunkSearchResult result;
      result.chunk = std::move(it->second);
      result.chunk.vector_embedding.clear();
      result.relevance_score = hit.relevance;
      results.push_back(std::move(result));
    }
    return results;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("search_similar_chunks", e));
  }
}

std::vector<JurisdictionCount> ChunkStore::list_jurisdictions(const std::string &region) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<JurisdictionCount> counts;
    *conn << "SELECT jurisdiction, COUNT(*) AS chunk_count FROM chunks WHERE region = ? "
             "GROUP BY jurisdiction ORDER BY chunk_count DESC, jurisdiction ASC"
          << region >>
        [&](std::string jurisdiction, int chunk_count) {
          counts.push_back({std::move(jurisdiction), chunk_count});
        };
    return counts;
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("list_jurisdictions", e));
  }
}

}  // namespace statute_core
