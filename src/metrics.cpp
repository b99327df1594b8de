#include "metrics.hpp"

namespace engram {

void EngineMetrics::update_average(std::atomic<double>& avg, double sample) {
    double current = avg.load(std::memory_order_relaxed);
    double next;
    do {
        next = current * (1.0 - kSmoothing) + sample * kSmoothing;
    } while (!avg.compare_exchange_weak(current, next, std::memory_order_relaxed));
}

MetricsSnapshot EngineMetrics::snapshot() const {
    MetricsSnapshot s;
    s.queries_total         = queries_total_.load(std::memory_order_relaxed);
    s.queries_cached        = queries_cached_.load(std::memory_order_relaxed);
    s.fallback_searches     = fallback_searches_.load(std::memory_order_relaxed);
    s.index_errors          = index_errors_.load(std::memory_order_relaxed);
    s.embeddings_generated  = embeddings_generated_.load(std::memory_order_relaxed);
    s.memories_stored       = memories_stored_.load(std::memory_order_relaxed);
    s.memories_deduplicated = memories_deduplicated_.load(std::memory_order_relaxed);
    s.memories_retrieved    = memories_retrieved_.load(std::memory_order_relaxed);
    s.memories_deleted      = memories_deleted_.load(std::memory_order_relaxed);
    s.memories_pruned       = memories_pruned_.load(std::memory_order_relaxed);
    s.avg_query_ms          = avg_query_ms_.load(std::memory_order_relaxed);
    s.avg_embedding_ms      = avg_embedding_ms_.load(std::memory_order_relaxed);
    return s;
}

nlohmann::json metrics_to_json(const MetricsSnapshot& m) {
    return {
        {"queries_total", m.queries_total},
        {"queries_cached", m.queries_cached},
        {"fallback_searches", m.fallback_searches},
        {"index_errors", m.index_errors},
        {"embeddings_generated", m.embeddings_generated},
        {"memories_stored", m.memories_stored},
        {"memories_deduplicated", m.memories_deduplicated},
        {"memories_retrieved", m.memories_retrieved},
        {"memories_deleted", m.memories_deleted},
        {"memories_pruned", m.memories_pruned},
        {"avg_query_ms", m.avg_query_ms},
        {"avg_embedding_ms", m.avg_embedding_ms}
    };
}

} // namespace engram
