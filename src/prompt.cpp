#include "prompt.hpp"
#include "errors.hpp"
#include "memory/fact_store.hpp"
#include "util.hpp"
#include <iostream>
#include <sstream>

namespace lunacore {

std::string build_pinned_context(const std::vector<Memory>& pinned) {
    if (pinned.empty()) return "";

    std::ostringstream ss;
    ss << kPinnedContextHeader;
    for (const auto& m : pinned) {
        ss << "\n- " << m.key << ": " << m.value;
    }
    return ss.str();
}

std::string load_pinned_context(FactStore& store, uint32_t limit) {
    try {
        return build_pinned_context(store.get_pinned(limit));
    } catch (const StorageError& e) {
        std::cerr << "[memory] Pinned read failed, continuing without context: "
                  << e.what() << "\n";
        return "";
    }
}

std::string build_prompt(const std::string& system_prompt,
                         const std::string& context,
                         const std::string& user_message) {
    std::ostringstream ss;
    if (!system_prompt.empty()) {
        ss << system_prompt << "\n\n";
    }
    if (!context.empty()) {
        ss << context << "\n\n";
    }
    ss << user_message;
    return ss.str();
}

bool is_memory_listing_command(const std::string& utterance) {
    std::string cmd = to_lower(trim(utterance));
    return cmd == "list memories" || cmd == "memories" || cmd == "show memories";
}

std::string format_memory_listing(const std::vector<Memory>& pinned,
                                  const std::vector<Memory>& all) {
    std::vector<const Memory*> recent;
    for (const auto& m : all) {
        if (!m.pinned) recent.push_back(&m);
    }
    if (pinned.empty() && recent.empty()) return "No memories stored yet.";

    std::ostringstream ss;
    bool first = true;
    if (!pinned.empty()) {
        ss << "Pinned memories:";
        for (const auto& m : pinned) {
            ss << "\n- " << m.key << ": " << m.value;
        }
        first = false;
    }
    if (!recent.empty()) {
        if (!first) ss << "\n";
        ss << "Recent memories:";
        for (const auto* m : recent) {
            ss << "\n- " << m->key << ": " << m->value;
        }
    }
    return ss.str();
}

} // namespace lunacore
