#pragma once
#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3; // forward declare
struct sqlite3_stmt;

namespace lunacore {

// Owns the process-wide SQLite connection. All access goes through mutex(),
// which gives every writer a single-writer discipline.
class Database {
public:
    // Opens (or creates) the database and its schema.
    // Throws ConfigurationError for an unusable location, StorageError otherwise.
    explicit Database(const std::string& path);
    ~Database();

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db_; }
    std::mutex& mutex() const { return mutex_; }
    const std::string& path() const { return path_; }

    // Run one or more statements without results. Throws StorageError.
    void exec(const std::string& sql);

    // Rows changed by the most recent statement
    uint32_t changes() const;

    int64_t last_insert_rowid() const;

    // Compact storage. Caller must not hold an open transaction.
    void vacuum();

private:
    void init_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

// RAII prepared statement. Every failing call throws StorageError.
class Statement {
public:
    Statement(const Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind_null(int index);

    // Returns true while a row is available, false once done.
    bool step();

    // Step a statement that returns no rows.
    void run();

    std::string column_text(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    bool column_is_null(int col) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// RAII transaction: rolls back unless commit() was called.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

} // namespace lunacore
