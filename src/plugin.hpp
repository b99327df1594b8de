#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace engram {

class RecordStore;
class VectorIndex;
class QueryCache;

// Factory function types
using RecordStoreFactory = std::function<std::unique_ptr<RecordStore>(const Config& config)>;
using VectorIndexFactory = std::function<std::unique_ptr<VectorIndex>(const Config& config)>;
using QueryCacheFactory  = std::function<std::unique_ptr<QueryCache>(const Config& config)>;

// Central registry for self-registering backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_record_store(const std::string& name, RecordStoreFactory factory);
    void register_vector_index(const std::string& name, VectorIndexFactory factory);
    void register_query_cache(const std::string& name, QueryCacheFactory factory);

    // Creation. Throws std::invalid_argument for unknown names.
    std::unique_ptr<RecordStore> create_record_store(const std::string& name,
                                                     const Config& config) const;
    std::unique_ptr<VectorIndex> create_vector_index(const std::string& name,
                                                     const Config& config) const;
    std::unique_ptr<QueryCache> create_query_cache(const std::string& name,
                                                   const Config& config) const;

    // Query
    std::vector<std::string> record_store_names() const;
    std::vector<std::string> vector_index_names() const;
    bool has_record_store(const std::string& name) const;
    bool has_vector_index(const std::string& name) const;
    bool has_query_cache(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RecordStoreFactory> record_stores_;
    std::unordered_map<std::string, VectorIndexFactory> vector_indexes_;
    std::unordered_map<std::string, QueryCacheFactory> query_caches_;
};

// ── Self-registrar helpers (used at file scope in each backend .cpp) ──

struct RecordStoreRegistrar {
    RecordStoreRegistrar(const std::string& name, RecordStoreFactory factory) {
        PluginRegistry::instance().register_record_store(name, std::move(factory));
    }
};

struct VectorIndexRegistrar {
    VectorIndexRegistrar(const std::string& name, VectorIndexFactory factory) {
        PluginRegistry::instance().register_vector_index(name, std::move(factory));
    }
};

struct QueryCacheRegistrar {
    QueryCacheRegistrar(const std::string& name, QueryCacheFactory factory) {
        PluginRegistry::instance().register_query_cache(name, std::move(factory));
    }
};

} // namespace engram
