#pragma once
#include "embedder.hpp"
#include "memory_filter.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace engram {

class RecordStore;

struct ScoredCandidate {
    std::string id;
    double score;           // cosine similarity, higher = better
    uint64_t created_at;
};

// Brute-force similarity search over the most recent records of a
// collection. Used when the vector index is absent or failing.
class FallbackScanner {
public:
    FallbackScanner(RecordStore& store, uint32_t window);

    // Candidates with cosine >= min_similarity that pass filter, best
    // first (newer first on ties), at most limit. Throws StoreError.
    std::vector<ScoredCandidate> scan(const std::string& collection,
                                      const Embedding& query,
                                      const MetadataFilter& filter,
                                      double min_similarity, uint32_t limit);

    uint32_t window() const { return window_; }

private:
    RecordStore& store_;
    uint32_t window_;
};

} // namespace engram
