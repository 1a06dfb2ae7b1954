#include "seed_loader.hpp"
#include "errors.hpp"
#include "memory/fact_store.hpp"
#include "util.hpp"
#include <cctype>
#include <iostream>

namespace lunacore {

std::string clean_seed_field(const std::string& field) {
    std::string s = trim(field);

    s = replace_all(s, "\xE2\x80\x9C", "\"");  // left double quote
    s = replace_all(s, "\xE2\x80\x9D", "\"");  // right double quote
    s = replace_all(s, "\xE2\x80\x98", "'");   // left single quote
    s = replace_all(s, "\xE2\x80\x99", "'");   // right single quote

    if (s.size() >= 2 && s.front() == s.back() && (s.front() == '"' || s.front() == '\'')) {
        s = trim(s.substr(1, s.size() - 2));
    }

    s = replace_all(s, "|", "; ");

    std::string collapsed;
    collapsed.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !collapsed.empty()) collapsed += ' ';
        in_space = false;
        collapsed += c;
    }
    return collapsed;
}

std::vector<std::vector<std::string>> parse_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        record.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        if (field_started || !record.empty()) {
            end_field();
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    i++;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                end_field();
                field_started = true;  // a trailing comma still opens a field
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                break;
            default:
                field += c;
                field_started = true;
                break;
        }
    }
    end_record();
    return records;
}

std::vector<std::pair<std::string, std::string>> seed_rows_from_csv(const std::string& text,
                                                                    uint32_t& skipped) {
    std::vector<std::pair<std::string, std::string>> rows;
    for (const auto& record : parse_csv(text)) {
        if (record.size() < 2) {
            skipped++;
            continue;
        }
        std::string key = clean_seed_field(record[0]);
        std::string value = clean_seed_field(record[1]);
        if (key.empty() || value.empty()) {
            skipped++;
            continue;
        }
        if (to_lower(key) == "key" && to_lower(value) == "value") {
            skipped++;
            continue;
        }
        rows.emplace_back(std::move(key), std::move(value));
    }
    return rows;
}

SeedResult load_seed_csv(FactStore& store, const std::string& path, double score) {
    std::string text;
    if (!read_file(path, text)) throw InvalidInput("seed file not found: " + path);

    SeedResult result;
    auto rows = seed_rows_from_csv(text, result.skipped);
    result.loaded = store.upsert_pinned_batch(rows, score);
    result.pruned = store.enforce_non_pinned_cap(store.non_pinned_cap());

    std::cerr << "[seed] Loaded " << result.loaded << " pinned fact(s) from " << path
              << " (skipped " << result.skipped << ", pruned " << result.pruned << ")\n";
    return result;
}

} // namespace lunacore
