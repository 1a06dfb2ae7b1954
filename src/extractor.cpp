#include "extractor.hpp"
#include "memory/fact_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <regex>
#include <set>
#include <utility>

namespace lunacore {

namespace {

const std::regex& remember_re() {
    static const std::regex re(R"(\bremember\b[:\s-]*(.+)$)", std::regex::icase);
    return re;
}

const std::regex& name_re() {
    static const std::regex re(R"(\bmy name is\s+([A-Za-z0-9][A-Za-z0-9 _-]{1,48})\b)",
                               std::regex::icase);
    return re;
}

const std::regex& location_re() {
    static const std::regex re(R"(\bi (?:live|am located)\s+in\s+(.+)$)", std::regex::icase);
    return re;
}

const std::regex& wake_re() {
    static const std::regex re(
        R"(\bwake(?:\s+word|\s+phrase)?\s+is\s+([A-Za-z0-9][A-Za-z0-9 _-]{1,28})\b)",
        std::regex::icase);
    return re;
}

std::string strip_quotes(std::string s) {
    s = trim(s);
    while (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.erase(0, 1);
    while (!s.empty() && (s.back() == '"' || s.back() == '\'')) s.pop_back();
    return trim(s);
}

} // namespace

std::vector<CandidateFact> RuleFactExtractor::extract(const std::string& utterance) const {
    std::string t = trim(utterance);
    if (t.empty()) return {};

    std::vector<CandidateFact> out;
    std::smatch m;

    if (std::regex_search(t, m, remember_re())) {
        std::string val = strip_quotes(m[1].str());
        if (!val.empty()) out.push_back({"remember", val, 0.95});
    }

    if (std::regex_search(t, m, name_re())) {
        out.push_back({"user_name", trim(m[1].str()), 0.95});
    }

    if (std::regex_search(t, m, location_re())) {
        std::string val = trim(m[1].str());
        while (!val.empty() && val.back() == '.') val.pop_back();
        if (val.size() >= 2 && val.size() <= 80) {
            out.push_back({"user_location", val, 0.8});
        }
    }

    if (std::regex_search(t, m, wake_re())) {
        out.push_back({"wake_phrase", trim(m[1].str()), 0.9});
    }

    // Audio routing hints only when they name a concrete device
    bool has_device = t.find("plughw:") != std::string::npos ||
                      t.find("hw:") != std::string::npos ||
                      t.find("AUDIO_OUT") != std::string::npos;
    if (has_device && t.size() <= 160) {
        out.push_back({"audio_hint", t, 0.6});
    }

    return dedupe_candidates(out);
}

std::vector<CandidateFact> dedupe_candidates(const std::vector<CandidateFact>& candidates) {
    std::set<std::pair<std::string, std::string>> seen;
    std::vector<CandidateFact> out;
    for (const auto& c : candidates) {
        std::string key = trim(c.key);
        std::string value = trim(c.value);
        if (key.empty() || value.empty()) continue;
        if (!seen.insert({key, value}).second) continue;
        out.push_back({key, value, std::max(0.0, c.confidence)});
    }
    return out;
}

uint32_t apply_candidates(FactStore& store, const std::vector<CandidateFact>& candidates,
                          const std::string& session_id) {
    uint32_t written = 0;
    for (const auto& c : dedupe_candidates(candidates)) {
        store.add_non_pinned(c.key, c.value, c.confidence, session_id);
        written++;
    }
    return written;
}

} // namespace lunacore
