#include "bm25_index.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace lunacore {

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string token;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c >= 0x80) {
            token += static_cast<char>(std::tolower(c));
        } else if (!token.empty()) {
            tokens.push_back(std::move(token));
            token.clear();
        }
    }
    if (!token.empty()) tokens.push_back(std::move(token));
    return tokens;
}

Bm25Index::Bm25Index(std::vector<IndexedChunk> chunks, Params params)
    : chunks_(std::move(chunks)), params_(params) {
    term_freqs_.reserve(chunks_.size());
    lengths_.reserve(chunks_.size());

    std::unordered_map<std::string, uint32_t> doc_freq;
    size_t total_length = 0;

    for (const auto& chunk : chunks_) {
        auto tokens = tokenize(chunk.text);
        std::unordered_map<std::string, uint32_t> tf;
        for (auto& t : tokens) {
            tf[std::move(t)]++;
        }
        for (const auto& entry : tf) {
            doc_freq[entry.first]++;
        }
        lengths_.push_back(tokens.size());
        total_length += tokens.size();
        term_freqs_.push_back(std::move(tf));
    }

    if (!chunks_.empty()) {
        avg_length_ = static_cast<double>(total_length) / static_cast<double>(chunks_.size());
    }

    auto n_docs = static_cast<double>(chunks_.size());
    for (const auto& [term, df] : doc_freq) {
        auto n = static_cast<double>(df);
        idf_[term] = std::log(1.0 + (n_docs - n + 0.5) / (n + 0.5));
    }
}

double Bm25Index::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it == idf_.end() ? 0.0 : it->second;
}

std::vector<double> Bm25Index::scores(const std::vector<std::string>& query_tokens) const {
    std::vector<double> out(chunks_.size(), 0.0);
    if (chunks_.empty() || avg_length_ <= 0.0) return out;

    const double k1 = params_.k1;
    const double b = params_.b;

    // Repeated query terms count once per occurrence
    for (const auto& term : query_tokens) {
        double term_idf = idf(term);
        if (term_idf <= 0.0) continue;

        for (size_t i = 0; i < chunks_.size(); i++) {
            auto it = term_freqs_[i].find(term);
            if (it == term_freqs_[i].end()) continue;

            double tf = it->second;
            double norm = 1.0 - b + b * static_cast<double>(lengths_[i]) / avg_length_;
            out[i] += term_idf * (tf * (k1 + 1.0)) / (tf + k1 * norm);
        }
    }
    return out;
}

std::vector<RetrievedChunk> Bm25Index::search(const std::string& query, uint32_t k,
                                              double min_score) const {
    if (chunks_.empty() || k == 0) return {};

    auto query_tokens = tokenize(query);
    if (query_tokens.empty()) return {};

    auto chunk_scores = scores(query_tokens);

    std::vector<size_t> order;
    for (size_t i = 0; i < chunk_scores.size(); i++) {
        if (chunk_scores[i] > 0.0 && chunk_scores[i] >= min_score) {
            order.push_back(i);
        }
    }

    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (chunk_scores[a] != chunk_scores[b]) return chunk_scores[a] > chunk_scores[b];
        if (chunks_[a].sequence_no != chunks_[b].sequence_no)
            return chunks_[a].sequence_no < chunks_[b].sequence_no;
        return chunks_[a].chunk_id < chunks_[b].chunk_id;
    });
    if (order.size() > k) order.resize(k);

    std::vector<RetrievedChunk> results;
    results.reserve(order.size());
    for (size_t i : order) {
        const auto& c = chunks_[i];
        results.push_back({c.text, chunk_scores[i], c.document_id, c.source, c.sequence_no});
    }
    return results;
}

} // namespace lunacore
