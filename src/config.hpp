#pragma once
#include "metric.hpp"
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

struct SurpriseConfig {
    bool enabled = true;
    double threshold = 0.85;    // in the configured metric mode
    bool fail_open = true;      // store when novelty cannot be evaluated
};

struct StoreConfig {
#ifdef ENGRAM_HAS_SQLITE_STORE
    std::string backend = "sqlite";
#else
    std::string backend = "json";
#endif
    std::string path;           // empty = ~/.engram/memory.db (or .json)
};

struct IndexConfig {
    std::string backend = "flat";   // "flat" or "none"
};

struct CacheConfig {
    bool enabled = true;
    uint32_t ttl = 300;             // seconds
    uint32_t max_entries = 1000;
    std::string path;               // empty = in-process only
};

struct RetentionConfig {
    uint32_t default_ttl_hours = 0;     // 0 = memories never expire
};

struct EmbeddingsConfig {
    std::string provider;           // "openai", "ollama", or empty = auto-detect
    std::string api_key;
    std::string base_url;
    std::string model;
    uint32_t timeout_seconds = 30;
};

struct Config {
    MetricMode metric_mode = MetricMode::Similarity;
    double recency_alpha = 0.05;        // per day; 0 disables decay
    uint32_t fallback_window = 200;     // records scanned without an index
    uint32_t index_timeout_ms = 2000;
    bool verbose = false;

    SurpriseConfig surprise;
    StoreConfig store;
    IndexConfig index;
    CacheConfig cache;
    RetentionConfig retention;
    EmbeddingsConfig embeddings;

    // Load from ~/.engram/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (defaults-merged) JSON document. Unknown or mistyped keys
    // keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Human-readable problems; empty when the config is usable.
    std::vector<std::string> validate() const;
};

// Config file location (~/.engram/config.json)
std::string config_path();

} // namespace engram
