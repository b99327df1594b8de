#pragma once
#include "../query_cache.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace engram {

struct CacheEntry {
    std::string value;
    uint64_t expires_at;
    uint64_t last_access;
};

// In-process TTL cache with least-recently-used eviction. When path is
// non-empty, entries survive restarts through a JSON file.
class LocalQueryCache : public QueryCache {
public:
    LocalQueryCache(const std::string& path, uint32_t max_entries);

    std::string cache_name() const override { return "local"; }

    std::optional<std::string> get(const std::string& key) override;

    // A ttl of 0 stores nothing.
    void set(const std::string& key, const std::string& value,
             uint32_t ttl_seconds) override;

    uint32_t invalidate(const std::string& key_or_prefix) override;

    uint32_t size() const;
    void clear();

private:
    void evict();
    void load();
    void save();

    std::string path_;
    uint32_t max_entries_;
    std::unordered_map<std::string, CacheEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace engram
