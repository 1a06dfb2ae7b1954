#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lunacore {

class FactStore;

struct SeedResult {
    uint32_t loaded = 0;   // rows upserted as pinned
    uint32_t skipped = 0;  // blank, short, header or empty-after-cleaning rows
    uint32_t pruned = 0;   // non-pinned rows evicted afterwards
};

// Normalize one CSV field: trim, plain quotes for typographic ones, strip one
// pair of wrapping quotes, "|" -> "; ", collapse whitespace runs.
std::string clean_seed_field(const std::string& field);

// Parse RFC 4180 CSV text into records of raw fields.
std::vector<std::vector<std::string>> parse_csv(const std::string& text);

// Cleaned (key, value) rows from CSV text. `skipped` counts rejected records.
std::vector<std::pair<std::string, std::string>> seed_rows_from_csv(const std::string& text,
                                                                    uint32_t& skipped);

// Load a two-column (key, value) CSV as pinned facts with the given trust
// score, then enforce the non-pinned cap. Throws InvalidInput if the file
// cannot be read.
SeedResult load_seed_csv(FactStore& store, const std::string& path, double score);

} // namespace lunacore
