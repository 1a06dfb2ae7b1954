#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace lunacore {

struct IndexedChunk {
    int64_t chunk_id = 0;       // global insertion order
    std::string document_id;
    std::string source;
    int64_t sequence_no = 0;
    std::string text;
};

struct RetrievedChunk {
    std::string text;
    double score = 0.0;
    std::string document_id;
    std::string source;
    int64_t sequence_no = 0;
};

// Case-folded alphanumeric runs. Bytes >= 0x80 count as word characters so
// UTF-8 words stay whole.
std::vector<std::string> tokenize(const std::string& text);

// Okapi BM25 over a fixed corpus. Immutable once constructed; a new corpus
// means a new index.
struct Bm25Params {
    double k1 = 1.5;
    double b = 0.75;
};

class Bm25Index {
public:
    using Params = Bm25Params;

    explicit Bm25Index(std::vector<IndexedChunk> chunks, Params params = {});

    // Top `k` chunks by score, descending; ties broken by ascending sequence
    // number, then insertion order. Chunks scoring zero or below min_score
    // are dropped.
    std::vector<RetrievedChunk> search(const std::string& query, uint32_t k,
                                       double min_score) const;

    // Score of every chunk, in corpus order.
    std::vector<double> scores(const std::vector<std::string>& query_tokens) const;

    // ln(1 + (N - n + 0.5) / (n + 0.5)); zero for unknown terms.
    double idf(const std::string& term) const;

    size_t size() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }
    double average_length() const { return avg_length_; }

private:
    std::vector<IndexedChunk> chunks_;
    std::vector<std::unordered_map<std::string, uint32_t>> term_freqs_;
    std::vector<size_t> lengths_;
    std::unordered_map<std::string, double> idf_;
    double avg_length_ = 0.0;
    Params params_;
};

} // namespace lunacore
