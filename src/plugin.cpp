#include "plugin.hpp"
#include "record_store.hpp"
#include "vector_index.hpp"
#include "query_cache.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace engram {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_record_store(const std::string& name, RecordStoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_stores_[name] = std::move(factory);
}

void PluginRegistry::register_vector_index(const std::string& name, VectorIndexFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    vector_indexes_[name] = std::move(factory);
}

void PluginRegistry::register_query_cache(const std::string& name, QueryCacheFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    query_caches_[name] = std::move(factory);
}

std::unique_ptr<RecordStore> PluginRegistry::create_record_store(const std::string& name,
                                                                 const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = record_stores_.find(name);
    if (it == record_stores_.end()) {
        throw std::invalid_argument("Unknown record store: " + name);
    }
    return it->second(config);
}

std::unique_ptr<VectorIndex> PluginRegistry::create_vector_index(const std::string& name,
                                                                 const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vector_indexes_.find(name);
    if (it == vector_indexes_.end()) {
        throw std::invalid_argument("Unknown vector index: " + name);
    }
    return it->second(config);
}

std::unique_ptr<QueryCache> PluginRegistry::create_query_cache(const std::string& name,
                                                               const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = query_caches_.find(name);
    if (it == query_caches_.end()) {
        throw std::invalid_argument("Unknown query cache: " + name);
    }
    return it->second(config);
}

std::vector<std::string> PluginRegistry::record_store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(record_stores_.size());
    for (const auto& [name, _] : record_stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::vector_index_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(vector_indexes_.size());
    for (const auto& [name, _] : vector_indexes_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_record_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_stores_.count(name) > 0;
}

bool PluginRegistry::has_vector_index(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vector_indexes_.count(name) > 0;
}

bool PluginRegistry::has_query_cache(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_caches_.count(name) > 0;
}

// ── Config-driven construction ──────────────────────────────────

std::unique_ptr<RecordStore> create_record_store(const Config& config) {
    const auto& backend = config.store.backend;
    auto& registry = PluginRegistry::instance();

    if (!registry.has_record_store(backend)) {
        std::cerr << "[plugin] Record store '" << backend
                  << "' is not available, falling back to json\n";
        if (registry.has_record_store("json")) {
            return registry.create_record_store("json", config);
        }
        return nullptr;
    }

    return registry.create_record_store(backend, config);
}

std::unique_ptr<VectorIndex> create_vector_index(const Config& config) {
    const auto& backend = config.index.backend;
    if (backend.empty() || backend == "none") return nullptr;

    auto& registry = PluginRegistry::instance();
    if (!registry.has_vector_index(backend)) {
        std::cerr << "[plugin] Unknown vector index '" << backend
                  << "', running without an index\n";
        return nullptr;
    }
    return registry.create_vector_index(backend, config);
}

std::unique_ptr<QueryCache> create_query_cache(const Config& config) {
    if (!config.cache.enabled) return nullptr;

    auto& registry = PluginRegistry::instance();
    if (!registry.has_query_cache("local")) return nullptr;
    return registry.create_query_cache("local", config);
}

} // namespace engram
