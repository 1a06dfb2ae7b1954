#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lunacore {

class Database;

struct Session {
    std::string id;
    double started_at = 0.0;
    nlohmann::json metadata = nlohmann::json::object();
};

struct TurnLatencies {
    uint32_t asr_ms = 0;
    uint32_t llm_ms = 0;
    uint32_t tts_ms = 0;
};

struct Turn {
    int64_t id = 0;
    std::string session_id;
    std::string role;   // "user" or "assistant"
    std::string text;
    TurnLatencies latencies;
    double created_at = 0.0;
};

// Append-only conversation log. Turns are never mutated; only a full
// reset (FactStore::delete_all) removes them.
class TurnLedger {
public:
    explicit TurnLedger(Database& db);

    // Insert or replace a session row. An empty id generates one.
    // Returns the session id.
    std::string start_session(const std::string& id,
                              const nlohmann::json& metadata = nlohmann::json::object());

    std::optional<Session> get_session(const std::string& id);

    // Append one turn. Throws InvalidInput on empty session id or role.
    // Returns the new turn's row id.
    int64_t add_turn(const std::string& session_id, const std::string& role,
                     const std::string& text, const TurnLatencies& latencies = {});

    // All turns of a session in insertion order.
    std::vector<Turn> get_session_turns(const std::string& session_id);

    // The last `limit` turns of a session, oldest first.
    std::vector<Turn> get_recent_turns(const std::string& session_id, uint32_t limit);

private:
    Database& db_;
};

} // namespace lunacore
