#pragma once
#include "memory/fact_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lunacore {

class FactStore;

// Header line of the pinned-facts block injected into the model prompt.
inline constexpr const char* kPinnedContextHeader = "Pinned user facts (trusted):";

// Format pinned facts as the prompt context block:
//   Pinned user facts (trusted):
//   - <key>: <value>
// Returns empty string when there are no facts.
std::string build_pinned_context(const std::vector<Memory>& pinned);

// Read pinned facts and format them. A storage failure degrades to an empty
// context (logged) so the turn can go on without memory.
std::string load_pinned_context(FactStore& store, uint32_t limit);

// System instructions, then the context block (omitted when empty), then
// the user utterance, separated by blank lines.
std::string build_prompt(const std::string& system_prompt,
                         const std::string& context,
                         const std::string& user_message);

// True for "list memories", "memories" or "show memories".
bool is_memory_listing_command(const std::string& utterance);

// Spoken reply for the memory listing command.
std::string format_memory_listing(const std::vector<Memory>& pinned,
                                  const std::vector<Memory>& all);

} // namespace lunacore
