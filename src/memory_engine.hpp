#pragma once
#include "config.hpp"
#include "embedder.hpp"
#include "fallback_scanner.hpp"
#include "memory.hpp"
#include "metrics.hpp"
#include "recency_ranker.hpp"
#include "record_store.hpp"
#include "surprise_filter.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

class VectorIndex;
class QueryCache;

struct StatsSnapshot {
    std::string collection;
    uint32_t total = 0;
    uint32_t last_24h = 0;
    std::map<ScopeKind, uint32_t> by_scope_kind;
    std::map<std::string, uint32_t> by_user;
    uint32_t expired = 0;       // past expires_at, not yet pruned
    MetricsSnapshot metrics;
};

nlohmann::json stats_to_json(const StatsSnapshot& stats);

// Query results as a JSON array (embeddings only when present and asked for).
nlohmann::json records_to_json(const std::vector<MemoryRecord>& records,
                               bool include_embeddings);

// Multi-tenant memory store/retrieval coordinator.
//
// The record store is authoritative and required; the vector index and the
// query cache are optional and every failure on them degrades gracefully.
// Collaborators are borrowed and must outlive the engine. All methods may be
// called concurrently; no lock is held across collaborator calls.
class MemoryEngine {
public:
    // metrics may be shared between engines; when null the engine keeps its own.
    MemoryEngine(const Config& config, Embedder& embedder, RecordStore& store,
                 VectorIndex* index = nullptr, QueryCache* cache = nullptr,
                 EngineMetrics* metrics = nullptr);

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    // Embed and persist content. Returns the new id, or nullopt when the
    // surprise filter judged it redundant. ttl_hours overrides
    // retention.default_ttl_hours; 0 means the record never expires.
    // Throws EmbeddingError, StoreError.
    std::optional<std::string> store(const std::string& tenant, const std::string& content,
                                     const std::string& scope, const std::string& kind,
                                     const Metadata& metadata = {},
                                     std::optional<uint32_t> ttl_hours = std::nullopt);

    // Ranked records for query, best first, at most top_k.
    // Throws InvalidQueryError, EmbeddingError, StoreError, QueryCancelled.
    std::vector<MemoryRecord> query(const std::string& tenant, const MemoryQuery& query,
                                    const std::atomic<bool>* cancel = nullptr);

    // Returns false if the id is unknown. Throws StoreError.
    bool forget(const std::string& tenant, const std::string& id);

    // Single record without its embedding; nullopt once expired.
    // Throws StoreError.
    std::optional<MemoryRecord> get(const std::string& tenant, const std::string& id);

    StatsSnapshot stats(const std::string& tenant);

    // Load the `limit` most recent unexpired records into the vector index,
    // or the whole collection when no limit is given.
    // Returns the number indexed (0 without an index).
    uint32_t warm_index(const std::string& tenant,
                        std::optional<uint32_t> limit = std::nullopt);

    // Delete expired records from the store, the index and the cache.
    // Returns how many were removed. Throws StoreError.
    uint32_t prune_expired(const std::string& tenant);

    // "tenant_<id with '-' as '_'>_memories". Every operation resolves its
    // collection through here first. Throws InvalidTenantError unless the
    // tenant is 1-128 characters of [A-Za-z0-9-].
    static std::string collection_name(const std::string& tenant);
    static std::string query_cache_key(const std::string& tenant, const MemoryQuery& query);
    static std::string record_cache_key(const std::string& tenant, const std::string& id);

    // Override the wall clock (epoch seconds) used for created_at and ranking.
    void set_clock(std::function<uint64_t()> clock) { clock_ = std::move(clock); }

    EngineMetrics& metrics() { return *metrics_; }

private:
    Embedding embed(const std::string& collection, const std::string& text);
    void validate_embedding(const std::string& collection, const Embedding& embedding);
    uint32_t tenant_dimensions(const std::string& collection, uint32_t observed);

    std::vector<ScoredCandidate> search_index(const std::string& collection,
                                              const Embedding& embedding,
                                              const MetadataFilter& filter,
                                              double min_similarity, uint32_t limit,
                                              bool& ok);

    std::optional<std::string> cache_get(const std::string& key);
    void cache_set(const std::string& key, const std::string& value);
    void cache_invalidate(const std::string& key_or_prefix);

    uint64_t now() const { return clock_(); }

    Config config_;
    Embedder& embedder_;
    RecordStore& store_;
    VectorIndex* index_;
    QueryCache* cache_;
    EngineMetrics own_metrics_;
    EngineMetrics* metrics_;

    SurpriseFilter surprise_;
    FallbackScanner scanner_;
    RecencyRanker ranker_;
    std::function<uint64_t()> clock_;

    std::mutex dims_mutex_;
    std::unordered_map<std::string, uint32_t> dims_;
};

} // namespace engram
