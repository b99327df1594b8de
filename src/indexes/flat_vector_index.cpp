#include "flat_vector_index.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <algorithm>

static engram::VectorIndexRegistrar reg_flat("flat",
    [](const engram::Config& config) {
        return std::make_unique<engram::FlatVectorIndex>(config.metric_mode);
    });

namespace engram {

// Entries scored between deadline checks.
static constexpr size_t kDeadlineStride = 256;

FlatVectorIndex::FlatVectorIndex(MetricMode mode) : mode_(mode) {}

void FlatVectorIndex::insert(const std::string& collection, const std::string& id,
                             const Embedding& vector, const Metadata& metadata,
                             uint32_t /*timeout_ms*/) {
    if (vector.empty()) {
        throw VectorIndexError("flat index: refusing empty vector for " + id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entries = collections_[collection];
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&id](const Entry& e) { return e.id == id; });
    if (it != entries.end()) {
        it->vector = vector;
        it->metadata = metadata;
        return;
    }
    entries.push_back({id, vector, metadata});
}

std::vector<IndexHit> FlatVectorIndex::search(const std::string& collection,
                                              const Embedding& vector, uint32_t top_k,
                                              const MetadataFilter& filter,
                                              uint32_t timeout_ms) {
    double deadline = monotonic_ms() + static_cast<double>(timeout_ms);

    std::lock_guard<std::mutex> lock(mutex_);

    auto cit = collections_.find(collection);
    if (cit == collections_.end() || top_k == 0) return {};

    std::vector<IndexHit> hits;
    size_t scanned = 0;
    for (const auto& entry : cit->second) {
        if (++scanned % kDeadlineStride == 0 && monotonic_ms() > deadline) {
            throw VectorIndexError("flat index: search timed out");
        }
        if (!filter.matches(entry.metadata)) continue;
        if (entry.vector.size() != vector.size()) continue;

        double sim = cosine_similarity(vector, entry.vector);
        double score = mode_ == MetricMode::Distance ? 1.0 - sim : sim;
        hits.push_back({entry.id, score});
    }

    auto better = [this](const IndexHit& a, const IndexHit& b) {
        return mode_ == MetricMode::Distance ? a.score < b.score : a.score > b.score;
    };
    size_t k = std::min(static_cast<size_t>(top_k), hits.size());
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k),
                      hits.end(), better);
    hits.resize(k);
    return hits;
}

uint32_t FlatVectorIndex::remove(const std::string& collection, const MetadataFilter& filter,
                                 uint32_t /*timeout_ms*/) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return 0;

    auto& entries = cit->second;
    auto before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&filter](const Entry& e) { return filter.matches(e.metadata); }),
                  entries.end());
    return static_cast<uint32_t>(before - entries.size());
}

uint32_t FlatVectorIndex::size(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return 0;
    return static_cast<uint32_t>(cit->second.size());
}

} // namespace engram
