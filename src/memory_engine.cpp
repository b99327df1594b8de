#include "memory_engine.hpp"
#include "errors.hpp"
#include "memory_filter.hpp"
#include "query_cache.hpp"
#include "record_json.hpp"
#include "util.hpp"
#include "vector_index.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace engram {

static constexpr uint64_t kSecondsPerDay = 86400;
static constexpr uint64_t kSecondsPerHour = 3600;
static constexpr size_t kMaxTenantLength = 128;

MemoryEngine::MemoryEngine(const Config& config, Embedder& embedder, RecordStore& store,
                           VectorIndex* index, QueryCache* cache, EngineMetrics* metrics)
    : config_(config)
    , embedder_(embedder)
    , store_(store)
    , index_(index)
    , cache_(cache)
    , metrics_(metrics ? metrics : &own_metrics_)
    , surprise_(config.surprise, config.metric_mode, index)
    , scanner_(store, config.fallback_window)
    , ranker_(config.recency_alpha)
    , clock_(epoch_seconds)
{}

std::string MemoryEngine::collection_name(const std::string& tenant) {
    // '-' maps to '_', so '_' itself must stay out of tenant ids or two
    // tenants could share a collection. ':' would break cache key scoping.
    if (tenant.empty() || tenant.size() > kMaxTenantLength) {
        throw InvalidTenantError("tenant id must be 1-" + std::to_string(kMaxTenantLength) +
                                 " characters");
    }
    for (char c : tenant) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            throw InvalidTenantError("tenant id '" + tenant +
                                     "' may only contain letters, digits and '-'");
        }
    }
    return "tenant_" + replace_all(tenant, "-", "_") + "_memories";
}

std::string MemoryEngine::query_cache_key(const std::string& tenant, const MemoryQuery& query) {
    return "memory_query:" + tenant + ":" + sha256_hex(query_to_canonical_json(query).dump());
}

std::string MemoryEngine::record_cache_key(const std::string& tenant, const std::string& id) {
    return "memory:" + tenant + ":" + id;
}

// ── Embeddings ──────────────────────────────────────────────────

Embedding MemoryEngine::embed(const std::string& collection, const std::string& text) {
    double start = monotonic_ms();
    Embedding embedding = embedder_.embed(text);
    metrics_->add_embedding();
    metrics_->record_embedding_latency(monotonic_ms() - start);

    validate_embedding(collection, embedding);
    return embedding;
}

void MemoryEngine::validate_embedding(const std::string& collection,
                                      const Embedding& embedding) {
    if (embedding.empty()) {
        throw EmbeddingError(embedder_.embedder_name() + " returned an empty embedding");
    }
    for (float v : embedding) {
        if (!std::isfinite(v)) {
            throw EmbeddingError(embedder_.embedder_name() + " returned non-finite values");
        }
    }
    // Cosine similarity is undefined for a zero vector.
    if (std::all_of(embedding.begin(), embedding.end(), [](float v) { return v == 0.0f; })) {
        throw EmbeddingError(embedder_.embedder_name() + " returned an all-zero embedding");
    }

    auto size = static_cast<uint32_t>(embedding.size());
    uint32_t declared = embedder_.dimensions();
    if (declared != 0 && size != declared) {
        throw EmbeddingError("embedding has " + std::to_string(size) +
                             " dimensions, " + embedder_.embedder_name() +
                             " declares " + std::to_string(declared));
    }

    uint32_t expected = tenant_dimensions(collection, size);
    if (size != expected) {
        throw EmbeddingError("embedding has " + std::to_string(size) +
                             " dimensions, " + collection + " holds " +
                             std::to_string(expected));
    }
}

uint32_t MemoryEngine::tenant_dimensions(const std::string& collection, uint32_t observed) {
    {
        std::lock_guard<std::mutex> lock(dims_mutex_);
        auto it = dims_.find(collection);
        if (it != dims_.end()) return it->second;
    }

    // First use in this process: existing records win over the new vector.
    uint32_t dims = observed;
    auto recent = store_.scan_recent(collection, 1);
    if (!recent.empty() && !recent.front().embedding.empty()) {
        dims = static_cast<uint32_t>(recent.front().embedding.size());
    }

    std::lock_guard<std::mutex> lock(dims_mutex_);
    auto [it, inserted] = dims_.emplace(collection, dims);
    (void)inserted;
    return it->second;
}

// ── Cache (best effort) ─────────────────────────────────────────

std::optional<std::string> MemoryEngine::cache_get(const std::string& key) {
    if (!cache_) return std::nullopt;
    try {
        return cache_->get(key);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Read failed for " << key << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void MemoryEngine::cache_set(const std::string& key, const std::string& value) {
    if (!cache_) return;
    try {
        cache_->set(key, value, config_.cache.ttl);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Write failed for " << key << ": " << e.what() << "\n";
    }
}

void MemoryEngine::cache_invalidate(const std::string& key_or_prefix) {
    if (!cache_) return;
    try {
        cache_->invalidate(key_or_prefix);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Invalidation failed for " << key_or_prefix
                  << ": " << e.what() << "\n";
    }
}

// ── Store ───────────────────────────────────────────────────────

std::optional<std::string> MemoryEngine::store(const std::string& tenant,
                                               const std::string& content,
                                               const std::string& scope,
                                               const std::string& kind,
                                               const Metadata& metadata,
                                               std::optional<uint32_t> ttl_hours) {
    std::string collection = collection_name(tenant);
    Embedding embedding = embed(collection, content);

    if (!surprise_.should_store(collection, embedding, scope, kind, metadata,
                                config_.index_timeout_ms)) {
        metrics_->add_deduplicated();
        if (config_.verbose) {
            std::cerr << "[engine] Skipped redundant memory in " << collection << "\n";
        }
        return std::nullopt;
    }

    MemoryRecord record;
    record.id = generate_id();
    record.content = content;
    record.embedding = std::move(embedding);
    record.metadata = metadata;
    record.metadata[meta::kScope] = scope;
    record.metadata[meta::kKind] = kind;
    record.scope = scope;
    record.kind = kind;
    record.created_at = now();
    uint32_t ttl = ttl_hours.value_or(config_.retention.default_ttl_hours);
    if (ttl > 0) record.expires_at = record.created_at + ttl * kSecondsPerHour;

    store_.insert(collection, record);

    if (index_) {
        try {
            index_->insert(collection, record.id, record.embedding,
                           index_metadata(record), config_.index_timeout_ms);
        } catch (const std::exception& e) {
            metrics_->add_index_error();
            std::cerr << "[engine] Index insert failed for " << record.id
                      << ": " << e.what() << "\n";
        }
    }

    cache_invalidate("memory_query:" + tenant + ":");
    cache_set(record_cache_key(tenant, record.id),
              record_to_json(record, false).dump());

    metrics_->add_stored();
    if (config_.verbose) {
        std::cerr << "[engine] Stored " << record.id << " in " << collection
                  << " (" << scope << "/" << kind << ")\n";
    }
    return record.id;
}

// ── Query ───────────────────────────────────────────────────────

static void check_cancelled(const std::atomic<bool>* cancel) {
    if (cancel && cancel->load()) throw QueryCancelled();
}

std::vector<ScoredCandidate> MemoryEngine::search_index(const std::string& collection,
                                                        const Embedding& embedding,
                                                        const MetadataFilter& filter,
                                                        double min_similarity,
                                                        uint32_t limit, bool& ok) {
    std::vector<ScoredCandidate> candidates;
    ok = false;
    if (!index_) return candidates;

    std::vector<IndexHit> hits;
    try {
        hits = index_->search(collection, embedding, limit, filter,
                              config_.index_timeout_ms);
    } catch (const std::exception& e) {
        metrics_->add_index_error();
        std::cerr << "[engine] Index search failed, scanning recent records: "
                  << e.what() << "\n";
        return candidates;
    }

    MetricMode mode = index_->metric_mode();
    for (auto& hit : hits) {
        double sim = to_similarity(hit.score, mode);
        if (sim >= min_similarity) {
            candidates.push_back({std::move(hit.id), sim, 0});
        }
    }
    ok = true;
    return candidates;
}

std::vector<MemoryRecord> MemoryEngine::query(const std::string& tenant,
                                              const MemoryQuery& query,
                                              const std::atomic<bool>* cancel) {
    if (query.top_k <= 0) {
        throw InvalidQueryError("top_k must be positive, got " + std::to_string(query.top_k));
    }
    if (!threshold_in_range(query.similarity_threshold, config_.metric_mode)) {
        throw InvalidQueryError("similarity_threshold " +
                                std::to_string(query.similarity_threshold) +
                                " is out of range for " +
                                metric_mode_to_string(config_.metric_mode) + " mode");
    }

    std::string collection = collection_name(tenant);
    metrics_->add_query();
    double start = monotonic_ms();
    std::string cache_key = query_cache_key(tenant, query);

    if (auto cached = cache_get(cache_key)) {
        try {
            auto j = nlohmann::json::parse(*cached);
            std::vector<MemoryRecord> results;
            uint64_t t = now();
            for (const auto& item : j) {
                MemoryRecord r = record_from_json(item);
                if (!is_expired(r, t)) results.push_back(std::move(r));
            }
            metrics_->add_cache_hit();
            metrics_->add_retrieved(results.size());
            metrics_->record_query_latency(monotonic_ms() - start);
            return results;
        } catch (const std::exception& e) {
            std::cerr << "[cache] Ignoring malformed entry " << cache_key
                      << ": " << e.what() << "\n";
        }
    }
    check_cancelled(cancel);

    Embedding embedding = embed(collection, query.text);
    check_cancelled(cancel);

    MetadataFilter filter = build_metadata_filter(query);
    double min_similarity = to_similarity(query.similarity_threshold, config_.metric_mode);
    auto fetch_limit = static_cast<uint32_t>(query.top_k) * 2;

    bool index_ok = false;
    auto candidates = search_index(collection, embedding, filter, min_similarity,
                                   fetch_limit, index_ok);
    if (!index_ok) {
        metrics_->add_fallback_search();
        candidates = scanner_.scan(collection, embedding, filter, min_similarity,
                                   fetch_limit);
    }
    check_cancelled(cancel);

    std::vector<MemoryRecord> results;
    if (!candidates.empty()) {
        std::vector<std::string> ids;
        std::unordered_map<std::string, size_t> position;
        std::unordered_map<std::string, double> raw_scores;
        for (const auto& c : candidates) {
            if (position.count(c.id)) continue;
            position[c.id] = ids.size();
            ids.push_back(c.id);
            raw_scores[c.id] = c.score;
        }

        auto records = store_.fetch_by_ids(collection, ids, query.include_embeddings);
        check_cancelled(cancel);

        uint64_t t = now();
        records.erase(std::remove_if(records.begin(), records.end(),
            [&](const MemoryRecord& r) {
                return position.count(r.id) == 0 || is_expired(r, t) || !filter.matches(r);
            }), records.end());

        // Store order is arbitrary; candidate order seeds the stable ranking.
        std::sort(records.begin(), records.end(),
            [&position](const MemoryRecord& a, const MemoryRecord& b) {
                return position.at(a.id) < position.at(b.id);
            });

        results = ranker_.rank(std::move(records), raw_scores, t);
        if (results.size() > static_cast<size_t>(query.top_k)) {
            results.resize(static_cast<size_t>(query.top_k));
        }
        if (!query.include_embeddings) {
            for (auto& r : results) r.embedding.clear();
        }
    }

    check_cancelled(cancel);
    cache_set(cache_key, records_to_json(results, query.include_embeddings).dump());

    metrics_->add_retrieved(results.size());
    metrics_->record_query_latency(monotonic_ms() - start);
    if (config_.verbose) {
        std::cerr << "[engine] Query in " << collection << " returned "
                  << results.size() << " of " << candidates.size() << " candidates"
                  << (index_ok ? "" : " (fallback scan)") << "\n";
    }
    return results;
}

// ── Forget / get ────────────────────────────────────────────────

bool MemoryEngine::forget(const std::string& tenant, const std::string& id) {
    std::string collection = collection_name(tenant);

    if (index_) {
        try {
            index_->remove(collection, memory_id_filter(id), config_.index_timeout_ms);
        } catch (const std::exception& e) {
            metrics_->add_index_error();
            std::cerr << "[engine] Index delete failed for " << id
                      << ": " << e.what() << "\n";
        }
    }

    bool existed = store_.remove(collection, id);

    cache_invalidate(record_cache_key(tenant, id));
    cache_invalidate("memory_query:" + tenant + ":");

    if (existed) metrics_->add_deleted();
    return existed;
}

std::optional<MemoryRecord> MemoryEngine::get(const std::string& tenant,
                                              const std::string& id) {
    std::string collection = collection_name(tenant);
    std::string key = record_cache_key(tenant, id);
    if (auto cached = cache_get(key)) {
        try {
            MemoryRecord record = record_from_json(nlohmann::json::parse(*cached));
            if (is_expired(record, now())) return std::nullopt;
            return record;
        } catch (const std::exception& e) {
            std::cerr << "[cache] Ignoring malformed entry " << key
                      << ": " << e.what() << "\n";
        }
    }

    auto records = store_.fetch_by_ids(collection, {id}, false);
    if (records.empty() || is_expired(records.front(), now())) return std::nullopt;

    MemoryRecord record = std::move(records.front());
    record.embedding.clear();
    cache_set(key, record_to_json(record, false).dump());
    return record;
}

// ── Stats / index warm-up ───────────────────────────────────────

StatsSnapshot MemoryEngine::stats(const std::string& tenant) {
    StatsSnapshot s;
    s.collection = collection_name(tenant);
    s.total = store_.count(s.collection);

    uint64_t t = now();
    s.last_24h = store_.count_since(s.collection, t > kSecondsPerDay ? t - kSecondsPerDay : 0);
    s.by_scope_kind = store_.count_by_scope_kind(s.collection);
    s.by_user = store_.count_by_user(s.collection);
    s.expired = store_.count_expired(s.collection, t);
    s.metrics = metrics_->snapshot();
    return s;
}

uint32_t MemoryEngine::warm_index(const std::string& tenant, std::optional<uint32_t> limit) {
    std::string collection = collection_name(tenant);
    if (!index_) return 0;

    uint32_t n = limit ? *limit : store_.count(collection);
    if (n == 0) return 0;
    auto records = store_.scan_recent(collection, n);

    uint64_t t = now();
    uint32_t indexed = 0;
    for (const auto& record : records) {
        if (record.embedding.empty() || is_expired(record, t)) continue;
        try {
            index_->insert(collection, record.id, record.embedding,
                           index_metadata(record), config_.index_timeout_ms);
        } catch (const std::exception& e) {
            metrics_->add_index_error();
            std::cerr << "[engine] Index warm-up stopped after " << indexed
                      << " records: " << e.what() << "\n";
            break;
        }
        indexed++;
    }
    return indexed;
}

uint32_t MemoryEngine::prune_expired(const std::string& tenant) {
    std::string collection = collection_name(tenant);
    auto removed = store_.remove_expired(collection, now());
    if (removed.empty()) return 0;

    for (const auto& id : removed) {
        if (index_) {
            try {
                index_->remove(collection, memory_id_filter(id), config_.index_timeout_ms);
            } catch (const std::exception& e) {
                metrics_->add_index_error();
                std::cerr << "[engine] Index delete failed for expired " << id
                          << ": " << e.what() << "\n";
            }
        }
        cache_invalidate(record_cache_key(tenant, id));
    }
    cache_invalidate("memory_query:" + tenant + ":");

    metrics_->add_pruned(removed.size());
    if (config_.verbose) {
        std::cerr << "[engine] Pruned " << removed.size() << " expired memories from "
                  << collection << "\n";
    }
    return static_cast<uint32_t>(removed.size());
}

// ── JSON helpers ────────────────────────────────────────────────

nlohmann::json records_to_json(const std::vector<MemoryRecord>& records,
                               bool include_embeddings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : records) arr.push_back(record_to_json(r, include_embeddings));
    return arr;
}

nlohmann::json stats_to_json(const StatsSnapshot& stats) {
    nlohmann::json by_scope_kind = nlohmann::json::array();
    for (const auto& [sk, n] : stats.by_scope_kind) {
        by_scope_kind.push_back({{"scope", sk.first}, {"kind", sk.second}, {"count", n}});
    }
    nlohmann::json by_user = nlohmann::json::object();
    for (const auto& [user, n] : stats.by_user) by_user[user] = n;

    return {
        {"collection", stats.collection},
        {"total_memories", stats.total},
        {"recent_24h", stats.last_24h},
        {"by_scope_kind", by_scope_kind},
        {"by_user", by_user},
        {"expired_memories", stats.expired},
        {"metrics", metrics_to_json(stats.metrics)}
    };
}

} // namespace engram
