#pragma once
#include "fact_types.hpp"
#include "pinned_cache.hpp"
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lunacore {

class Database;
struct MemoryConfig;

constexpr uint32_t kAllRows = std::numeric_limits<uint32_t>::max();

// Durable key/value facts. Pinned facts are permanent; non-pinned facts are
// bounded by a count cap with oldest-first eviction. Pinned reads go through
// a TTL cache that every write path invalidates.
//
// Writes are mutually exclusive with each other and with cache refills.
// Malformed writes throw InvalidInput; storage failures throw StorageError.
class FactStore {
public:
    FactStore(Database& db, const MemoryConfig& cfg,
              PinnedCache::ClockFn clock = nullptr);

    // Non-copyable
    FactStore(const FactStore&) = delete;
    FactStore& operator=(const FactStore&) = delete;

    // Insert or overwrite the unique (key, pinned) row. A non-pinned write
    // then enforces the cap. Returns rows evicted (always 0 when pinned).
    uint32_t upsert(const std::string& key, const std::string& value,
                double score, bool pinned,
                const std::string& session_id = "");

    void pin(const std::string& key, const std::string& value, double score = 1.0);

    // upsert() with pinned = false. Returns rows evicted.
    // If enforcement fails the write stays in place.
    uint32_t add_non_pinned(const std::string& key, const std::string& value,
                            double score = 1.0,
                            const std::string& session_id = "");

    // Delete the oldest non-pinned rows beyond max_count. Returns rows deleted.
    uint32_t enforce_non_pinned_cap(uint32_t max_count);

    // Seed path: all rows pinned, one transaction, timestamps increasing in
    // input order.
    // Every row is validated before anything is written. Returns rows written.
    uint32_t upsert_pinned_batch(const std::vector<std::pair<std::string, std::string>>& rows,
                                 double score);

    // Pinned facts in creation order (cached).
    std::vector<Memory> get_pinned(uint32_t limit = kAllRows);

    // Every fact, pinned first, then score descending, newest first.
    std::vector<Memory> get_all(uint32_t limit = kAllRows);

    // Remove the pinned row for key. Returns true if a row was removed.
    bool unpin(const std::string& key);

    // Remove pinned and non-pinned rows for key. Returns rows removed.
    uint32_t forget(const std::string& key);

    uint32_t count(std::optional<bool> pinned_filter = std::nullopt);

    // Irreversibly clear memories, turns and sessions.
    void delete_all();

    uint32_t non_pinned_cap() const { return cap_; }

private:
    void write_row(const std::string& key, const std::string& value, double score,
                   bool pinned, const std::string& session_id, double created_at);
    uint32_t enforce_cap_locked(uint32_t max_count);

    Database& db_;
    uint32_t cap_;
    PinnedCache cache_;
    mutable std::mutex mutex_;
};

} // namespace lunacore
