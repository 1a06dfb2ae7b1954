#include "database.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace lunacore {

static std::string sqlite_message(sqlite3* db, int rc) {
    if (db) return sqlite3_errmsg(db);
    return sqlite3_errstr(rc);
}

Database::Database(const std::string& path) : path_(path) {
    if (trim(path_).empty()) {
        throw ConfigurationError("Database: storage path is empty");
    }

    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw ConfigurationError("Database: cannot create directory " +
                                     parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = sqlite_message(db_, rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw ConfigurationError("Database: failed to open " + path_ + ": " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA temp_store=MEMORY;");
        exec("PRAGMA cache_size=-20000;");
        init_schema();
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StorageError("Database: " + msg + " (in: " + sql + ")");
    }
}

uint32_t Database::changes() const {
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

int64_t Database::last_insert_rowid() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

void Database::vacuum() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("VACUUM;");
}

void Database::init_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  id         TEXT PRIMARY KEY,"
        "  started_at REAL NOT NULL,"
        "  metadata   TEXT NOT NULL DEFAULT '{}'"
        ");");

    exec(
        "CREATE TABLE IF NOT EXISTS turns ("
        "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  session_id     TEXT NOT NULL,"
        "  role           TEXT NOT NULL,"
        "  text           TEXT NOT NULL,"
        "  asr_latency_ms INTEGER NOT NULL DEFAULT 0,"
        "  llm_latency_ms INTEGER NOT NULL DEFAULT 0,"
        "  tts_latency_ms INTEGER NOT NULL DEFAULT 0,"
        "  created_at     REAL NOT NULL"
        ");");
    exec("CREATE INDEX IF NOT EXISTS idx_turns_session ON turns(session_id, id);");

    // One row per (key, pinned); upserts rely on this constraint
    exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id                INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  key               TEXT NOT NULL,"
        "  value             TEXT NOT NULL,"
        "  score             REAL NOT NULL DEFAULT 1.0,"
        "  pinned            INTEGER NOT NULL DEFAULT 0,"
        "  created_at        REAL NOT NULL,"
        "  source_session_id TEXT,"
        "  UNIQUE (key, pinned)"
        ");");
    exec("CREATE INDEX IF NOT EXISTS idx_memories_pinned_created"
         " ON memories(pinned, created_at, id);");

    exec(
        "CREATE TABLE IF NOT EXISTS documents ("
        "  id         TEXT PRIMARY KEY,"
        "  source     TEXT NOT NULL,"
        "  title      TEXT NOT NULL DEFAULT '',"
        "  created_at REAL NOT NULL"
        ");");

    exec(
        "CREATE TABLE IF NOT EXISTS chunks ("
        "  id          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  document_id TEXT NOT NULL,"
        "  sequence_no INTEGER NOT NULL,"
        "  text        TEXT NOT NULL,"
        "  UNIQUE (document_id, sequence_no)"
        ");");
}

// ── Statement ────────────────────────────────────────────────

Statement::Statement(const Database& db, const char* sql)
    : db_(db.handle()), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = sqlite_message(db_, rc);
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
        throw StorageError("prepare failed: " + err + " (in: " + sql_ + ")");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

static void check_bind(sqlite3* db, int rc, const std::string& sql) {
    if (rc != SQLITE_OK) {
        throw StorageError("bind failed: " + sqlite_message(db, rc) + " (in: " + sql + ")");
    }
}

Statement& Statement::bind(int index, const std::string& value) {
    check_bind(db_, sqlite3_bind_text(stmt_, index, value.c_str(),
                                      static_cast<int>(value.size()), SQLITE_TRANSIENT), sql_);
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    check_bind(db_, sqlite3_bind_int64(stmt_, index, value), sql_);
    return *this;
}

Statement& Statement::bind(int index, double value) {
    check_bind(db_, sqlite3_bind_double(stmt_, index, value), sql_);
    return *this;
}

Statement& Statement::bind_null(int index) {
    check_bind(db_, sqlite3_bind_null(stmt_, index), sql_);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError("step failed: " + sqlite_message(db_, rc) + " (in: " + sql_ + ")");
}

void Statement::run() {
    while (step()) {
    }
}

std::string Statement::column_text(int col) const {
    auto* v = sqlite3_column_text(stmt_, col);
    if (!v) return {};
    return std::string(reinterpret_cast<const char*>(v),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ── Transaction ──────────────────────────────────────────────

Transaction::Transaction(Database& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[storage] rollback failed: " << (err ? err : "unknown error") << "\n";
    }
    sqlite3_free(err);
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace lunacore
