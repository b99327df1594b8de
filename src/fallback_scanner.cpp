#include "fallback_scanner.hpp"
#include "record_store.hpp"
#include <algorithm>

namespace engram {

FallbackScanner::FallbackScanner(RecordStore& store, uint32_t window)
    : store_(store), window_(window) {}

std::vector<ScoredCandidate> FallbackScanner::scan(const std::string& collection,
                                                   const Embedding& query,
                                                   const MetadataFilter& filter,
                                                   double min_similarity, uint32_t limit) {
    std::vector<ScoredCandidate> candidates;
    if (limit == 0 || window_ == 0) return candidates;

    auto recent = store_.scan_recent(collection, window_);
    for (const auto& record : recent) {
        if (!filter.matches(record)) continue;
        double sim = cosine_similarity(query, record.embedding);
        if (sim < min_similarity) continue;
        candidates.push_back({record.id, sim, record.created_at});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const ScoredCandidate& a, const ScoredCandidate& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.created_at > b.created_at;
        });

    if (candidates.size() > limit) candidates.resize(limit);
    return candidates;
}

} // namespace engram
