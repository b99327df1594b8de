#include "local_query_cache.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

static engram::QueryCacheRegistrar reg_local("local",
    [](const engram::Config& config) {
        std::string path = config.cache.path.empty()
            ? std::string{} : engram::expand_home(config.cache.path);
        return std::make_unique<engram::LocalQueryCache>(path, config.cache.max_entries);
    });

namespace engram {

LocalQueryCache::LocalQueryCache(const std::string& path, uint32_t max_entries)
    : path_(path), max_entries_(max_entries) {
    load();
}

std::optional<std::string> LocalQueryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    uint64_t now = epoch_seconds();
    if (now >= it->second.expires_at) {
        entries_.erase(it);
        return std::nullopt;
    }

    it->second.last_access = now;
    return it->second.value;
}

void LocalQueryCache::set(const std::string& key, const std::string& value,
                          uint32_t ttl_seconds) {
    if (ttl_seconds == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = epoch_seconds();
    entries_[key] = CacheEntry{value, now + ttl_seconds, now};

    evict();
    save();
}

uint32_t LocalQueryCache::invalidate(const std::string& key_or_prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t removed = 0;
    bool is_prefix = !key_or_prefix.empty() && key_or_prefix.back() == ':';
    if (is_prefix) {
        for (auto it = entries_.begin(); it != entries_.end(); ) {
            if (it->first.compare(0, key_or_prefix.size(), key_or_prefix) == 0) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    } else {
        removed = static_cast<uint32_t>(entries_.erase(key_or_prefix));
    }

    if (removed > 0) save();
    return removed;
}

void LocalQueryCache::evict() {
    // Must be called with mutex_ already held.

    uint64_t now = epoch_seconds();

    // Remove TTL-expired entries first.
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    // If still over capacity, evict by oldest last_access.
    if (entries_.size() > max_entries_) {
        std::vector<std::pair<uint64_t, std::string>> key_access; // {last_access, key}
        key_access.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            key_access.emplace_back(entry.last_access, key);
        }

        std::sort(key_access.begin(), key_access.end());

        size_t to_remove = entries_.size() - max_entries_;
        for (size_t i = 0; i < to_remove; ++i) {
            entries_.erase(key_access[i].second);
        }
    }
}

uint32_t LocalQueryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

void LocalQueryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    save();
}

void LocalQueryCache::load() {
    if (path_.empty()) return;

    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) return;

        entries_.clear();
        for (const auto& item : j) {
            std::string key  = item.value("key",         std::string{});
            std::string val  = item.value("value",       std::string{});
            uint64_t exp     = item.value("expires_at",  uint64_t{0});
            uint64_t la      = item.value("last_access", uint64_t{0});

            if (key.empty()) continue;
            entries_[key] = CacheEntry{std::move(val), exp, la};
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[cache] Ignoring unreadable " << path_ << ": " << e.what() << "\n";
        entries_.clear();
    }
}

void LocalQueryCache::save() {
    // Must be called with mutex_ already held.
    if (path_.empty()) return;

    nlohmann::json j = nlohmann::json::array();
    for (const auto& [key, entry] : entries_) {
        j.push_back({
            {"key",         key},
            {"value",       entry.value},
            {"expires_at",  entry.expires_at},
            {"last_access", entry.last_access}
        });
    }

    if (!atomic_write_file(path_, j.dump(2))) {
        throw std::runtime_error("LocalQueryCache: failed to write " + path_);
    }
}

} // namespace engram
