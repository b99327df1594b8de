#include "config.hpp"
#include "util.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace engram {

std::string config_path() {
    return expand_home("~/.engram/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"metric_mode", "similarity"},
        {"recency_alpha", 0.05},
        {"fallback_window", 200},
        {"index_timeout_ms", 2000},
        {"verbose", false},
        {"surprise", {
            {"enabled", true},
            {"threshold", 0.85},
            {"fail_open", true}
        }},
        {"store", {
#ifdef ENGRAM_HAS_SQLITE_STORE
            {"backend", "sqlite"},
#else
            {"backend", "json"},
#endif
            {"path", ""}
        }},
        {"index", {
            {"backend", "flat"}
        }},
        {"cache", {
            {"enabled", true},
            {"ttl", 300},
            {"max_entries", 1000},
            {"path", ""}
        }},
        {"retention", {
            {"default_ttl_hours", 0}
        }},
        {"embeddings", {
            {"provider", ""},
            {"api_key", ""},
            {"base_url", ""},
            {"model", ""},
            {"timeout_seconds", 30}
        }}
    };
}

// Accepts both parsed (unsigned) and literal (signed) non-negative integers.
static bool is_unsigned(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0;
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("metric_mode") && j["metric_mode"].is_string()) {
        auto name = j["metric_mode"].get<std::string>();
        if (auto mode = metric_mode_from_string(name)) {
            cfg.metric_mode = *mode;
        } else {
            std::cerr << "[config] Unknown metric_mode '" << name
                      << "', using similarity\n";
        }
    }
    if (j.contains("recency_alpha") && j["recency_alpha"].is_number())
        cfg.recency_alpha = j["recency_alpha"].get<double>();
    if (j.contains("fallback_window") && is_unsigned(j["fallback_window"]))
        cfg.fallback_window = j["fallback_window"].get<uint32_t>();
    if (j.contains("index_timeout_ms") && is_unsigned(j["index_timeout_ms"]))
        cfg.index_timeout_ms = j["index_timeout_ms"].get<uint32_t>();
    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();

    if (j.contains("surprise") && j["surprise"].is_object()) {
        auto& s = j["surprise"];
        if (s.contains("enabled") && s["enabled"].is_boolean())
            cfg.surprise.enabled = s["enabled"].get<bool>();
        if (s.contains("threshold") && s["threshold"].is_number())
            cfg.surprise.threshold = s["threshold"].get<double>();
        if (s.contains("fail_open") && s["fail_open"].is_boolean())
            cfg.surprise.fail_open = s["fail_open"].get<bool>();
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("backend") && s["backend"].is_string())
            cfg.store.backend = s["backend"].get<std::string>();
        if (s.contains("path") && s["path"].is_string())
            cfg.store.path = s["path"].get<std::string>();
    }

    if (j.contains("index") && j["index"].is_object()) {
        auto& i = j["index"];
        if (i.contains("backend") && i["backend"].is_string())
            cfg.index.backend = i["backend"].get<std::string>();
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("ttl") && is_unsigned(c["ttl"]))
            cfg.cache.ttl = c["ttl"].get<uint32_t>();
        if (c.contains("max_entries") && is_unsigned(c["max_entries"]))
            cfg.cache.max_entries = c["max_entries"].get<uint32_t>();
        if (c.contains("path") && c["path"].is_string())
            cfg.cache.path = c["path"].get<std::string>();
    }

    if (j.contains("retention") && j["retention"].is_object()) {
        auto& r = j["retention"];
        if (r.contains("default_ttl_hours") && is_unsigned(r["default_ttl_hours"]))
            cfg.retention.default_ttl_hours = r["default_ttl_hours"].get<uint32_t>();
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embeddings.provider = e["provider"].get<std::string>();
        if (e.contains("api_key") && e["api_key"].is_string())
            cfg.embeddings.api_key = e["api_key"].get<std::string>();
        if (e.contains("base_url") && e["base_url"].is_string())
            cfg.embeddings.base_url = e["base_url"].get<std::string>();
        if (e.contains("model") && e["model"].is_string())
            cfg.embeddings.model = e["model"].get<std::string>();
        if (e.contains("timeout_seconds") && is_unsigned(e["timeout_seconds"]))
            cfg.embeddings.timeout_seconds = e["timeout_seconds"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (cfg.embeddings.api_key.empty()) {
        if (const char* v = std::getenv("OPENAI_API_KEY"))
            cfg.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("ENGRAM_EMBEDDINGS_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("ENGRAM_EMBEDDINGS_BASE_URL"))
        cfg.embeddings.base_url = v;
    if (const char* v = std::getenv("ENGRAM_STORE_PATH"))
        cfg.store.path = v;
    if (const char* v = std::getenv("ENGRAM_INDEX_BACKEND"))
        cfg.index.backend = v;
    if (const char* v = std::getenv("ENGRAM_METRIC_MODE")) {
        if (auto mode = metric_mode_from_string(v)) {
            cfg.metric_mode = *mode;
        } else {
            std::cerr << "[config] Ignoring unknown ENGRAM_METRIC_MODE: " << v << "\n";
        }
    }

    return cfg;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;
    if (!threshold_in_range(surprise.threshold, metric_mode)) {
        errors.push_back("surprise.threshold " + std::to_string(surprise.threshold) +
                         " is out of range for metric_mode " +
                         metric_mode_to_string(metric_mode));
    }
    if (!std::isfinite(recency_alpha) || recency_alpha < 0.0) {
        errors.push_back("recency_alpha must be a non-negative number");
    }
    if (fallback_window == 0) {
        errors.push_back("fallback_window must be at least 1");
    }
    if (index_timeout_ms == 0) {
        errors.push_back("index_timeout_ms must be at least 1");
    }
    if (cache.enabled && cache.max_entries == 0) {
        errors.push_back("cache.max_entries must be at least 1 when the cache is enabled");
    }
    if (index.backend != "flat" && index.backend != "none") {
        errors.push_back("index.backend must be \"flat\" or \"none\"");
    }
    return errors;
}

} // namespace engram
