#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace lunacore {

class FactStore;

struct CandidateFact {
    std::string key;
    std::string value;
    double confidence = 1.0;
};

// Maps one utterance to candidate facts. Implementations never write;
// apply_candidates() is the only path into the FactStore.
class FactExtractor {
public:
    virtual ~FactExtractor() = default;
    virtual std::vector<CandidateFact> extract(const std::string& utterance) const = 0;
};

// Pattern rules for stable, high-signal statements ("my name is ...",
// "remember ...", "I live in ...", wake phrase, audio device hints).
class RuleFactExtractor : public FactExtractor {
public:
    std::vector<CandidateFact> extract(const std::string& utterance) const override;
};

// Drop candidates with an empty key or value and repeated (key, value) pairs.
std::vector<CandidateFact> dedupe_candidates(const std::vector<CandidateFact>& candidates);

// Write candidates as non-pinned facts (confidence becomes the score); the
// cap is enforced after every write. Returns the number written.
uint32_t apply_candidates(FactStore& store, const std::vector<CandidateFact>& candidates,
                          const std::string& session_id = "");

} // namespace lunacore
