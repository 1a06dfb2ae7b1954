#include "fact_store.hpp"
#include "../config.hpp"
#include "../database.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <cmath>

namespace lunacore {

static void validate_fact(const std::string& key, const std::string& value, double score) {
    if (trim(key).empty()) throw InvalidInput("memory key must not be empty");
    if (trim(value).empty()) throw InvalidInput("memory value must not be empty (key: " + key + ")");
    if (!std::isfinite(score) || score < 0.0)
        throw InvalidInput("memory score must be a non-negative number (key: " + key + ")");
}

// Columns: id, key, value, score, pinned, created_at, source_session_id
static Memory memory_from_stmt(const Statement& stmt) {
    Memory m;
    m.id = stmt.column_int64(0);
    m.key = stmt.column_text(1);
    m.value = stmt.column_text(2);
    m.score = stmt.column_double(3);
    m.pinned = stmt.column_int64(4) != 0;
    m.created_at = stmt.column_double(5);
    m.source_session_id = stmt.column_text(6);
    return m;
}

FactStore::FactStore(Database& db, const MemoryConfig& cfg, PinnedCache::ClockFn clock)
    : db_(db),
      cap_(cfg.non_pinned_cap),
      cache_(std::chrono::seconds(cfg.pinned_cache_ttl), std::move(clock)) {}

void FactStore::write_row(const std::string& key, const std::string& value, double score,
                          bool pinned, const std::string& session_id, double created_at) {
    // Caller holds mutex_ and the database mutex.
    Statement stmt(db_,
        "INSERT INTO memories (key, value, score, pinned, created_at, source_session_id)"
        " VALUES (?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(key, pinned) DO UPDATE SET"
        "   value = excluded.value,"
        "   score = excluded.score,"
        "   created_at = excluded.created_at,"
        "   source_session_id = excluded.source_session_id;");
    stmt.bind(1, key)
        .bind(2, value)
        .bind(3, score)
        .bind(4, static_cast<int64_t>(pinned ? 1 : 0))
        .bind(5, created_at);
    if (session_id.empty()) {
        stmt.bind_null(6);
    } else {
        stmt.bind(6, session_id);
    }
    stmt.run();
}

uint32_t FactStore::upsert(const std::string& key, const std::string& value,
                           double score, bool pinned, const std::string& session_id) {
    validate_fact(key, value, score);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.invalidate();
    {
        std::lock_guard<std::mutex> db_lock(db_.mutex());
        write_row(key, value, score, pinned, session_id, epoch_seconds_precise());
    }
    // Every non-pinned write is followed by cap enforcement, whoever the caller is
    return pinned ? 0 : enforce_cap_locked(cap_);
}

void FactStore::pin(const std::string& key, const std::string& value, double score) {
    upsert(key, value, score, true);
}

uint32_t FactStore::add_non_pinned(const std::string& key, const std::string& value,
                                   double score, const std::string& session_id) {
    return upsert(key, value, score, false, session_id);
}

uint32_t FactStore::enforce_non_pinned_cap(uint32_t max_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    return enforce_cap_locked(max_count);
}

uint32_t FactStore::enforce_cap_locked(uint32_t max_count) {
    cache_.invalidate();
    std::lock_guard<std::mutex> db_lock(db_.mutex());

    // Newest max_count non-pinned rows survive; pinned rows are never selected.
    Statement stmt(db_,
        "DELETE FROM memories WHERE id IN ("
        "  SELECT id FROM memories WHERE pinned = 0"
        "  ORDER BY created_at DESC, id DESC"
        "  LIMIT -1 OFFSET ?"
        ");");
    stmt.bind(1, static_cast<int64_t>(max_count));
    stmt.run();
    return db_.changes();
}

uint32_t FactStore::upsert_pinned_batch(
        const std::vector<std::pair<std::string, std::string>>& rows, double score) {
    for (const auto& [key, value] : rows) {
        validate_fact(key, value, score);
    }
    if (rows.empty()) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.invalidate();
    std::lock_guard<std::mutex> db_lock(db_.mutex());

    // Rows are stamped one microsecond apart in input order
    double now = epoch_seconds_precise();
    Transaction tx(db_);
    for (size_t i = 0; i < rows.size(); i++) {
        write_row(rows[i].first, rows[i].second, score, true, "",
                  now + static_cast<double>(i) * 1e-6);
    }
    tx.commit();
    return static_cast<uint32_t>(rows.size());
}

std::vector<Memory> FactStore::get_pinned(uint32_t limit) {
    if (limit == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto hit = cache_.get(limit)) {
        return std::move(*hit);
    }

    std::vector<Memory> rows;
    {
        std::lock_guard<std::mutex> db_lock(db_.mutex());
        Statement stmt(db_,
            "SELECT id, key, value, score, pinned, created_at, source_session_id"
            " FROM memories WHERE pinned = 1"
            " ORDER BY created_at ASC, id ASC;");
        while (stmt.step()) {
            rows.push_back(memory_from_stmt(stmt));
        }
    }

    cache_.put(rows);
    if (rows.size() > limit) rows.resize(limit);
    return rows;
}

std::vector<Memory> FactStore::get_all(uint32_t limit) {
    std::lock_guard<std::mutex> db_lock(db_.mutex());
    Statement stmt(db_,
        "SELECT id, key, value, score, pinned, created_at, source_session_id"
        " FROM memories"
        " ORDER BY pinned DESC, score DESC, created_at DESC, id DESC"
        " LIMIT ?;");
    stmt.bind(1, static_cast<int64_t>(limit));

    std::vector<Memory> results;
    while (stmt.step()) {
        results.push_back(memory_from_stmt(stmt));
    }
    return results;
}

bool FactStore::unpin(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.invalidate();
    std::lock_guard<std::mutex> db_lock(db_.mutex());

    Statement stmt(db_, "DELETE FROM memories WHERE key = ? AND pinned = 1;");
    stmt.bind(1, key);
    stmt.run();
    return db_.changes() > 0;
}

uint32_t FactStore::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.invalidate();
    std::lock_guard<std::mutex> db_lock(db_.mutex());

    Statement stmt(db_, "DELETE FROM memories WHERE key = ?;");
    stmt.bind(1, key);
    stmt.run();
    return db_.changes();
}

uint32_t FactStore::count(std::optional<bool> pinned_filter) {
    std::lock_guard<std::mutex> db_lock(db_.mutex());

    if (pinned_filter) {
        Statement stmt(db_, "SELECT COUNT(*) FROM memories WHERE pinned = ?;");
        stmt.bind(1, static_cast<int64_t>(*pinned_filter ? 1 : 0));
        return stmt.step() ? static_cast<uint32_t>(stmt.column_int64(0)) : 0;
    }
    Statement stmt(db_, "SELECT COUNT(*) FROM memories;");
    return stmt.step() ? static_cast<uint32_t>(stmt.column_int64(0)) : 0;
}

void FactStore::delete_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.invalidate();
    std::lock_guard<std::mutex> db_lock(db_.mutex());

    Transaction tx(db_);
    db_.exec("DELETE FROM memories;");
    db_.exec("DELETE FROM turns;");
    db_.exec("DELETE FROM sessions;");
    tx.commit();
}

} // namespace lunacore
