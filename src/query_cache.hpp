#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace engram {

struct Config; // forward declaration

// Key -> serialized result cache with per-entry TTL. Optional collaborator.
// Implementations may throw std::runtime_error; the engine treats every
// cache failure as a miss or a skipped write.
class QueryCache {
public:
    virtual ~QueryCache() = default;

    virtual std::string cache_name() const = 0;

    // Returns nullopt on miss or expiry.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const std::string& value,
                     uint32_t ttl_seconds) = 0;

    // Remove the exact key, or every key starting with a prefix ending in ':'.
    // Returns the number of entries removed.
    virtual uint32_t invalidate(const std::string& key_or_prefix) = 0;
};

// Create the configured cache through the plugin registry.
// Returns nullptr when caching is disabled.
std::unique_ptr<QueryCache> create_query_cache(const Config& config);

} // namespace engram
