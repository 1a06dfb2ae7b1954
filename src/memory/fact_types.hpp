#pragma once
#include <cstdint>
#include <string>

namespace lunacore {

struct Memory {
    int64_t id = 0;
    std::string key;
    std::string value;
    double score = 1.0;
    bool pinned = false;
    double created_at = 0.0;        // epoch seconds
    std::string source_session_id;  // empty when not captured in a session
};

} // namespace lunacore
