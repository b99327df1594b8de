#include "surprise_filter.hpp"
#include "memory_filter.hpp"
#include "vector_index.hpp"
#include <iostream>

namespace engram {

SurpriseFilter::SurpriseFilter(const SurpriseConfig& config, MetricMode mode,
                               VectorIndex* index)
    : config_(config),
      threshold_similarity_(to_similarity(config.threshold, mode)),
      index_(index) {}

bool SurpriseFilter::should_store(const std::string& collection, const Embedding& embedding,
                                  const std::string& scope, const std::string& kind,
                                  const Metadata& metadata, uint32_t timeout_ms) {
    if (!config_.enabled) return true;

    if (!index_) {
        std::cerr << "[surprise] No vector index; "
                  << (config_.fail_open ? "storing" : "rejecting")
                  << " without novelty check\n";
        return config_.fail_open;
    }

    MetadataFilter partition;
    partition.equals[meta::kScope] = scope;
    partition.equals[meta::kKind] = kind;
    if (auto user = metadata_string(metadata, meta::kUserId)) {
        partition.equals[meta::kUserId] = *user;
    }

    std::vector<IndexHit> hits;
    try {
        hits = index_->search(collection, embedding, 1, partition, timeout_ms);
    } catch (const std::exception& e) {
        std::cerr << "[surprise] Nearest-neighbour lookup failed: " << e.what()
                  << (config_.fail_open ? " (storing)" : " (rejecting)") << "\n";
        return config_.fail_open;
    }

    if (hits.empty()) return true;

    // similarity mode: store if best < threshold; distance mode: store if
    // best > threshold. Both reduce to this once converted.
    double best = to_similarity(hits.front().score, index_->metric_mode());
    return best < threshold_similarity_;
}

} // namespace engram
