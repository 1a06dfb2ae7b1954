#pragma once
#include "bm25_index.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lunacore {

class Database;
struct KnowledgeConfig;

struct DocumentInfo {
    std::string id;
    std::string source;
    std::string title;
    double created_at = 0.0;
    uint32_t chunk_count = 0;
};

// Chunked document storage plus an in-memory BM25 snapshot.
//
// The snapshot is rebuilt from every persisted chunk on demand and published
// by swapping a shared_ptr, so concurrent retrieve() calls see either the
// old or the new index in full. Ingestion does not touch the published
// snapshot; retrieval reflects new documents only after rebuild_index().
class DocumentIndex {
public:
    DocumentIndex(Database& db, const KnowledgeConfig& cfg);

    // Non-copyable
    DocumentIndex(const DocumentIndex&) = delete;
    DocumentIndex& operator=(const DocumentIndex&) = delete;

    // Chunk and persist text. Returns the new document id.
    // Throws InvalidInput for an empty source label or text without content.
    std::string ingest_text(const std::string& source_label, const std::string& text,
                            const std::string& title = "");

    // Read a text file and ingest it. An empty label uses the path.
    std::string ingest_file(const std::string& path, const std::string& source_label = "",
                            const std::string& title = "");

    // Load every chunk and publish a fresh index.
    void rebuild_index();

    // Empty on an unbuilt or empty index, never an error.
    std::vector<RetrievedChunk> retrieve(const std::string& query, uint32_t k,
                                         double min_score) const;

    // Uses the configured k and minimum score.
    std::vector<RetrievedChunk> retrieve(const std::string& query) const;

    std::vector<DocumentInfo> list_documents();

    // Chunks of one document in sequence order.
    std::vector<IndexedChunk> document_chunks(const std::string& document_id);

    // Clear documents and chunks and publish an empty index.
    void delete_all();

    // True once a document was ingested after the last rebuild.
    bool is_stale() const { return stale_.load(); }

    // Chunks in the published snapshot (0 before the first rebuild).
    size_t indexed_chunks() const;

    std::shared_ptr<const Bm25Index> snapshot() const;

private:
    void publish(std::shared_ptr<const Bm25Index> index);

    Database& db_;
    size_t chunk_chars_;
    uint32_t default_k_;
    double default_min_score_;

    mutable std::mutex index_mutex_;   // guards index_ pointer only
    std::shared_ptr<const Bm25Index> index_;
    std::mutex rebuild_mutex_;         // one rebuild/reset at a time
    std::atomic<bool> stale_{false};
};

} // namespace lunacore
