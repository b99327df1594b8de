#pragma once
#include "embedder.hpp"
#include "memory_filter.hpp"
#include "metadata.hpp"
#include "metric.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace engram {

struct Config; // forward declaration

struct IndexHit {
    std::string id;
    double score;   // raw score in the index's metric_mode()
};

// Approximate nearest-neighbour index. Optional collaborator: the engine
// runs without one. Any call may throw VectorIndexError (including on
// timeout); callers treat that as "index unavailable for this call".
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual std::string index_name() const = 0;

    // Convention of the scores returned by search().
    virtual MetricMode metric_mode() const = 0;

    virtual void insert(const std::string& collection, const std::string& id,
                        const Embedding& vector, const Metadata& metadata,
                        uint32_t timeout_ms) = 0;

    // Up to top_k hits matching filter, best first.
    virtual std::vector<IndexHit> search(const std::string& collection,
                                         const Embedding& vector, uint32_t top_k,
                                         const MetadataFilter& filter,
                                         uint32_t timeout_ms) = 0;

    // Remove every entry matching filter. Returns the number removed.
    virtual uint32_t remove(const std::string& collection, const MetadataFilter& filter,
                            uint32_t timeout_ms) = 0;
};

// Create the configured vector index through the plugin registry.
// Returns nullptr when the backend is "none" or unknown (index absent).
std::unique_ptr<VectorIndex> create_vector_index(const Config& config);

} // namespace engram
