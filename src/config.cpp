#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lunacore {

nlohmann::json Config::defaults_json() {
    return {
        {"storage", {
            {"path", "~/.lunacore/luna.db"}
        }},
        {"memory", {
            {"pinned_cache_ttl", 15},
            {"non_pinned_cap", 500},
            {"pinned_limit", 50},
            {"seed_score", 3.0}
        }},
        {"knowledge", {
            {"chunk_chars", 1200},
            {"retrieve_k", 5},
            {"min_score", 0.0}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Unsigned env override. Malformed values are reported and ignored.
static void env_uint(const char* name, uint32_t& target) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    try {
        size_t pos = 0;
        unsigned long parsed = std::stoul(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(name);
        target = static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring malformed " << name << "=" << v << "\n";
    }
}

static void env_double(const char* name, double& target) {
    const char* v = std::getenv(name);
    if (!v || !*v) return;
    try {
        size_t pos = 0;
        double parsed = std::stod(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(name);
        target = parsed;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring malformed " << name << "=" << v << "\n";
    }
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.lunacore/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                } else {
                    std::cerr << "[config] Could not write migrated config: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } else {
            std::cerr << "[config] Could not write default config: " << config_path << "\n";
        }
    }

    if (j.contains("storage") && j["storage"].is_object()) {
        auto& s = j["storage"];
        if (s.contains("path") && s["path"].is_string())
            cfg.storage.path = s["path"].get<std::string>();
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("pinned_cache_ttl") && m["pinned_cache_ttl"].is_number_unsigned())
            cfg.memory.pinned_cache_ttl = m["pinned_cache_ttl"].get<uint32_t>();
        if (m.contains("non_pinned_cap") && m["non_pinned_cap"].is_number_unsigned())
            cfg.memory.non_pinned_cap = m["non_pinned_cap"].get<uint32_t>();
        if (m.contains("pinned_limit") && m["pinned_limit"].is_number_unsigned())
            cfg.memory.pinned_limit = m["pinned_limit"].get<uint32_t>();
        if (m.contains("seed_score") && m["seed_score"].is_number())
            cfg.memory.seed_score = m["seed_score"].get<double>();
    }

    if (j.contains("knowledge") && j["knowledge"].is_object()) {
        auto& k = j["knowledge"];
        if (k.contains("chunk_chars") && k["chunk_chars"].is_number_unsigned())
            cfg.knowledge.chunk_chars = k["chunk_chars"].get<uint32_t>();
        if (k.contains("retrieve_k") && k["retrieve_k"].is_number_unsigned())
            cfg.knowledge.retrieve_k = k["retrieve_k"].get<uint32_t>();
        if (k.contains("min_score") && k["min_score"].is_number())
            cfg.knowledge.min_score = k["min_score"].get<double>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("LUNACORE_DB_PATH"))
        cfg.storage.path = v;
    env_uint("LUNACORE_PINNED_CACHE_TTL", cfg.memory.pinned_cache_ttl);
    env_uint("LUNACORE_NON_PINNED_CAP", cfg.memory.non_pinned_cap);
    env_uint("LUNACORE_CHUNK_CHARS", cfg.knowledge.chunk_chars);
    env_uint("LUNACORE_RETRIEVE_K", cfg.knowledge.retrieve_k);
    env_double("LUNACORE_MIN_SCORE", cfg.knowledge.min_score);

    return cfg;
}

std::string Config::db_path() const {
    return expand_home(storage.path);
}

void Config::validate() const {
    if (trim(storage.path).empty())
        throw ConfigurationError("storage.path must not be empty");
    if (memory.non_pinned_cap == 0)
        throw ConfigurationError("memory.non_pinned_cap must be at least 1");
    if (memory.seed_score < 0.0)
        throw ConfigurationError("memory.seed_score must not be negative");
    if (knowledge.chunk_chars == 0)
        throw ConfigurationError("knowledge.chunk_chars must be at least 1");
    if (knowledge.min_score < 0.0)
        throw ConfigurationError("knowledge.min_score must not be negative");
}

} // namespace lunacore
