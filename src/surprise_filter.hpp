#pragma once
#include "config.hpp"
#include "embedder.hpp"
#include "metadata.hpp"
#include <string>

namespace engram {

class VectorIndex;

// Novelty gate in front of the store. Looks up the single nearest
// neighbour in the same (scope, kind) partition (and the same user_id when
// the new record has one) and rejects content that is too close to it.
class SurpriseFilter {
public:
    // config.threshold is read in `mode`. index may be null; the filter
    // then follows config.fail_open.
    SurpriseFilter(const SurpriseConfig& config, MetricMode mode, VectorIndex* index);

    // True if the record should be stored.
    bool should_store(const std::string& collection, const Embedding& embedding,
                      const std::string& scope, const std::string& kind,
                      const Metadata& metadata, uint32_t timeout_ms);

private:
    SurpriseConfig config_;
    double threshold_similarity_;
    VectorIndex* index_;
};

} // namespace engram
