#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace lunacore {

struct StorageConfig {
    std::string path = "~/.lunacore/luna.db";
};

struct MemoryConfig {
    uint32_t pinned_cache_ttl = 15;   // seconds
    uint32_t non_pinned_cap = 500;
    uint32_t pinned_limit = 50;       // rows injected into prompt context
    double seed_score = 3.0;          // trust score for seed-loaded facts
};

struct KnowledgeConfig {
    uint32_t chunk_chars = 1200;
    uint32_t retrieve_k = 5;
    double min_score = 0.0;
};

struct Config {
    StorageConfig storage;
    MemoryConfig memory;
    KnowledgeConfig knowledge;

    // Load from ~/.lunacore/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Storage path with ~ expanded
    std::string db_path() const;

    // Throws ConfigurationError if any setting is unusable
    void validate() const;
};

} // namespace lunacore
