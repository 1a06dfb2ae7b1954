#include "turn_ledger.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace lunacore {

// Columns: id, session_id, role, text, asr, llm, tts, created_at
static Turn turn_from_stmt(const Statement& stmt) {
    Turn t;
    t.id = stmt.column_int64(0);
    t.session_id = stmt.column_text(1);
    t.role = stmt.column_text(2);
    t.text = stmt.column_text(3);
    t.latencies.asr_ms = static_cast<uint32_t>(stmt.column_int64(4));
    t.latencies.llm_ms = static_cast<uint32_t>(stmt.column_int64(5));
    t.latencies.tts_ms = static_cast<uint32_t>(stmt.column_int64(6));
    t.created_at = stmt.column_double(7);
    return t;
}

TurnLedger::TurnLedger(Database& db) : db_(db) {}

std::string TurnLedger::start_session(const std::string& id, const nlohmann::json& metadata) {
    std::string session_id = id.empty() ? generate_id() : id;
    nlohmann::json meta = metadata.is_object() ? metadata : nlohmann::json::object();

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_,
        "INSERT OR REPLACE INTO sessions (id, started_at, metadata) VALUES (?, ?, ?);");
    stmt.bind(1, session_id)
        .bind(2, epoch_seconds_precise())
        .bind(3, meta.dump());
    stmt.run();
    return session_id;
}

std::optional<Session> TurnLedger::get_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_, "SELECT id, started_at, metadata FROM sessions WHERE id = ?;");
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;

    Session s;
    s.id = stmt.column_text(0);
    s.started_at = stmt.column_double(1);
    try {
        s.metadata = nlohmann::json::parse(stmt.column_text(2));
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[ledger] Unreadable metadata for session " << s.id
                  << ": " << e.what() << "\n";
        s.metadata = nlohmann::json::object();
    }
    return s;
}

int64_t TurnLedger::add_turn(const std::string& session_id, const std::string& role,
                             const std::string& text, const TurnLatencies& latencies) {
    if (trim(session_id).empty()) throw InvalidInput("turn session id must not be empty");
    if (trim(role).empty()) throw InvalidInput("turn role must not be empty");

    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_,
        "INSERT INTO turns (session_id, role, text, asr_latency_ms, llm_latency_ms,"
        "                   tts_latency_ms, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?);");
    stmt.bind(1, session_id)
        .bind(2, role)
        .bind(3, text)
        .bind(4, static_cast<int64_t>(latencies.asr_ms))
        .bind(5, static_cast<int64_t>(latencies.llm_ms))
        .bind(6, static_cast<int64_t>(latencies.tts_ms))
        .bind(7, epoch_seconds_precise());
    stmt.run();
    return db_.last_insert_rowid();
}

std::vector<Turn> TurnLedger::get_session_turns(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT id, session_id, role, text, asr_latency_ms, llm_latency_ms,"
        "       tts_latency_ms, created_at"
        " FROM turns WHERE session_id = ? ORDER BY id ASC;");
    stmt.bind(1, session_id);

    std::vector<Turn> turns;
    while (stmt.step()) {
        turns.push_back(turn_from_stmt(stmt));
    }
    return turns;
}

std::vector<Turn> TurnLedger::get_recent_turns(const std::string& session_id, uint32_t limit) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    Statement stmt(db_,
        "SELECT id, session_id, role, text, asr_latency_ms, llm_latency_ms,"
        "       tts_latency_ms, created_at"
        " FROM turns WHERE session_id = ? ORDER BY id DESC LIMIT ?;");
    stmt.bind(1, session_id).bind(2, static_cast<int64_t>(limit));

    std::vector<Turn> turns;
    while (stmt.step()) {
        turns.push_back(turn_from_stmt(stmt));
    }
    std::reverse(turns.begin(), turns.end());
    return turns;
}

} // namespace lunacore
