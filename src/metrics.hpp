#pragma once
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct MetricsSnapshot {
    uint64_t queries_total = 0;
    uint64_t queries_cached = 0;
    uint64_t fallback_searches = 0;
    uint64_t index_errors = 0;
    uint64_t embeddings_generated = 0;
    uint64_t memories_stored = 0;
    uint64_t memories_deduplicated = 0;
    uint64_t memories_retrieved = 0;
    uint64_t memories_deleted = 0;
    uint64_t memories_pruned = 0;
    double avg_query_ms = 0.0;
    double avg_embedding_ms = 0.0;
};

nlohmann::json metrics_to_json(const MetricsSnapshot& m);

// Lock-free engine counters. Safe to share between engines and threads.
// Rolling averages use avg = 0.9 * avg + 0.1 * sample, applied with a
// compare-and-swap loop; concurrent samples are never lost, only reordered.
class EngineMetrics {
public:
    void add_query()               { queries_total_.fetch_add(1, std::memory_order_relaxed); }
    void add_cache_hit()           { queries_cached_.fetch_add(1, std::memory_order_relaxed); }
    void add_fallback_search()     { fallback_searches_.fetch_add(1, std::memory_order_relaxed); }
    void add_index_error()         { index_errors_.fetch_add(1, std::memory_order_relaxed); }
    void add_embedding()           { embeddings_generated_.fetch_add(1, std::memory_order_relaxed); }
    void add_stored()              { memories_stored_.fetch_add(1, std::memory_order_relaxed); }
    void add_deduplicated()        { memories_deduplicated_.fetch_add(1, std::memory_order_relaxed); }
    void add_retrieved(uint64_t n) { memories_retrieved_.fetch_add(n, std::memory_order_relaxed); }
    void add_deleted()             { memories_deleted_.fetch_add(1, std::memory_order_relaxed); }
    void add_pruned(uint64_t n)    { memories_pruned_.fetch_add(n, std::memory_order_relaxed); }

    void record_query_latency(double ms)     { update_average(avg_query_ms_, ms); }
    void record_embedding_latency(double ms) { update_average(avg_embedding_ms_, ms); }

    MetricsSnapshot snapshot() const;

    static constexpr double kSmoothing = 0.1;

private:
    static void update_average(std::atomic<double>& avg, double sample);

    std::atomic<uint64_t> queries_total_{0};
    std::atomic<uint64_t> queries_cached_{0};
    std::atomic<uint64_t> fallback_searches_{0};
    std::atomic<uint64_t> index_errors_{0};
    std::atomic<uint64_t> embeddings_generated_{0};
    std::atomic<uint64_t> memories_stored_{0};
    std::atomic<uint64_t> memories_deduplicated_{0};
    std::atomic<uint64_t> memories_retrieved_{0};
    std::atomic<uint64_t> memories_deleted_{0};
    std::atomic<uint64_t> memories_pruned_{0};
    std::atomic<double> avg_query_ms_{0.0};
    std::atomic<double> avg_embedding_ms_{0.0};
};

} // namespace engram
