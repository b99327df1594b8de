#pragma once
#include "../vector_index.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

// Exact in-process index: brute-force cosine over every entry of a
// collection. Scores are reported in the configured metric mode
// (cosine similarity, or cosine distance = 1 - similarity).
class FlatVectorIndex : public VectorIndex {
public:
    explicit FlatVectorIndex(MetricMode mode = MetricMode::Similarity);

    std::string index_name() const override { return "flat"; }
    MetricMode metric_mode() const override { return mode_; }

    // Replaces an existing entry with the same id.
    void insert(const std::string& collection, const std::string& id,
                const Embedding& vector, const Metadata& metadata,
                uint32_t timeout_ms) override;

    // Throws VectorIndexError if the scan exceeds timeout_ms.
    std::vector<IndexHit> search(const std::string& collection,
                                 const Embedding& vector, uint32_t top_k,
                                 const MetadataFilter& filter,
                                 uint32_t timeout_ms) override;

    uint32_t remove(const std::string& collection, const MetadataFilter& filter,
                    uint32_t timeout_ms) override;

    uint32_t size(const std::string& collection) const;

private:
    struct Entry {
        std::string id;
        Embedding vector;
        Metadata metadata;
    };

    MetricMode mode_;
    std::unordered_map<std::string, std::vector<Entry>> collections_;
    mutable std::mutex mutex_;
};

} // namespace engram
