#include "document_index.hpp"
#include "chunker.hpp"
#include "../config.hpp"
#include "../database.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <iostream>

namespace lunacore {

// Columns: chunk id, document id, source, sequence_no, text
static IndexedChunk chunk_from_stmt(const Statement& stmt) {
    IndexedChunk c;
    c.chunk_id = stmt.column_int64(0);
    c.document_id = stmt.column_text(1);
    c.source = stmt.column_text(2);
    c.sequence_no = stmt.column_int64(3);
    c.text = stmt.column_text(4);
    return c;
}

DocumentIndex::DocumentIndex(Database& db, const KnowledgeConfig& cfg)
    : db_(db),
      chunk_chars_(cfg.chunk_chars),
      default_k_(cfg.retrieve_k),
      default_min_score_(cfg.min_score) {}

std::string DocumentIndex::ingest_text(const std::string& source_label, const std::string& text,
                                       const std::string& title) {
    if (trim(source_label).empty()) throw InvalidInput("document source label must not be empty");

    auto chunks = chunk_text(text, chunk_chars_);
    if (chunks.empty()) throw InvalidInput("document has no text: " + source_label);

    std::string id = generate_id();
    {
        std::lock_guard<std::mutex> lock(db_.mutex());
        Transaction tx(db_);

        Statement doc(db_,
            "INSERT INTO documents (id, source, title, created_at) VALUES (?, ?, ?, ?);");
        doc.bind(1, id).bind(2, source_label).bind(3, title).bind(4, epoch_seconds_precise());
        doc.run();

        for (size_t i = 0; i < chunks.size(); i++) {
            Statement chunk(db_,
                "INSERT INTO chunks (document_id, sequence_no, text) VALUES (?, ?, ?);");
            chunk.bind(1, id).bind(2, static_cast<int64_t>(i)).bind(3, chunks[i]);
            chunk.run();
        }
        tx.commit();
    }

    stale_.store(true);
    std::cerr << "[knowledge] Ingested " << source_label << ": "
              << chunks.size() << " chunk(s)\n";
    return id;
}

std::string DocumentIndex::ingest_file(const std::string& path, const std::string& source_label,
                                       const std::string& title) {
    std::string text;
    if (!read_file(path, text)) throw InvalidInput("cannot read document: " + path);
    return ingest_text(source_label.empty() ? path : source_label, text, title);
}

void DocumentIndex::rebuild_index() {
    std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);

    // Clear before loading so an ingest racing with the load marks it stale again
    stale_.store(false);

    std::vector<IndexedChunk> corpus;
    {
        std::lock_guard<std::mutex> lock(db_.mutex());
        Statement stmt(db_,
            "SELECT c.id, c.document_id, d.source, c.sequence_no, c.text"
            " FROM chunks AS c JOIN documents AS d ON d.id = c.document_id"
            " ORDER BY c.id ASC;");
        while (stmt.step()) {
            corpus.push_back(chunk_from_stmt(stmt));
        }
    }

    // Build outside every lock; readers keep using the old snapshot meanwhile
    publish(std::make_shared<Bm25Index>(std::move(corpus)));
}

void DocumentIndex::publish(std::shared_ptr<const Bm25Index> index) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    index_ = std::move(index);
}

std::shared_ptr<const Bm25Index> DocumentIndex::snapshot() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return index_;
}

size_t DocumentIndex::indexed_chunks() const {
    auto index = snapshot();
    return index ? index->size() : 0;
}

std::vector<RetrievedChunk> DocumentIndex::retrieve(const std::string& query, uint32_t k,
                                                    double min_score) const {
    auto index = snapshot();
    if (!index || index->empty()) return {};
    return index->search(query, k, min_score);
}

std::vector<RetrievedChunk> DocumentIndex::retrieve(const std::string& query) const {
    return retrieve(query, default_k_, default_min_score_);
}

std::vector<DocumentInfo> DocumentIndex::list_documents() {
    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT d.id, d.source, d.title, d.created_at,"
        "       (SELECT COUNT(*) FROM chunks AS c WHERE c.document_id = d.id)"
        " FROM documents AS d ORDER BY d.created_at ASC, d.rowid ASC;");

    std::vector<DocumentInfo> docs;
    while (stmt.step()) {
        DocumentInfo info;
        info.id = stmt.column_text(0);
        info.source = stmt.column_text(1);
        info.title = stmt.column_text(2);
        info.created_at = stmt.column_double(3);
        info.chunk_count = static_cast<uint32_t>(stmt.column_int64(4));
        docs.push_back(std::move(info));
    }
    return docs;
}

std::vector<IndexedChunk> DocumentIndex::document_chunks(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT c.id, c.document_id, d.source, c.sequence_no, c.text"
        " FROM chunks AS c JOIN documents AS d ON d.id = c.document_id"
        " WHERE c.document_id = ? ORDER BY c.sequence_no ASC;");
    stmt.bind(1, document_id);

    std::vector<IndexedChunk> chunks;
    while (stmt.step()) {
        chunks.push_back(chunk_from_stmt(stmt));
    }
    return chunks;
}

void DocumentIndex::delete_all() {
    std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
    {
        std::lock_guard<std::mutex> lock(db_.mutex());
        Transaction tx(db_);
        db_.exec("DELETE FROM chunks;");
        db_.exec("DELETE FROM documents;");
        tx.commit();
    }
    publish(std::make_shared<Bm25Index>(std::vector<IndexedChunk>{}));
    stale_.store(false);
}

} // namespace lunacore
