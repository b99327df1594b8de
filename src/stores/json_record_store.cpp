#include "json_record_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../record_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

static engram::RecordStoreRegistrar reg_json("json",
    [](const engram::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = engram::expand_home("~/.engram/memory.json");
        }
        return std::make_unique<engram::JsonRecordStore>(path);
    });

namespace engram {

JsonRecordStore::JsonRecordStore(const std::string& path) : path_(path) {
    load();
}

void JsonRecordStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object() || !j.contains("collections") || !j["collections"].is_object()) {
            return;
        }

        collections_.clear();
        for (const auto& [name, items] : j["collections"].items()) {
            if (!items.is_array()) continue;
            auto& c = collections_[name];
            c.records.reserve(items.size());
            for (const auto& item : items) {
                c.records.push_back(record_from_json(item));
            }
            rebuild_index(c);
        }
    } catch (const nlohmann::json::exception& e) {
        // Corrupt file: start fresh, the next write replaces it.
        std::cerr << "[json_store] Ignoring unreadable " << path_ << ": " << e.what() << "\n";
        collections_.clear();
    }
}

void JsonRecordStore::save() {
    // Must be called with mutex_ already held.
    nlohmann::json cols = nlohmann::json::object();
    for (const auto& [name, c] : collections_) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& record : c.records) {
            arr.push_back(record_to_json(record));
        }
        cols[name] = std::move(arr);
    }
    nlohmann::json j = {{"collections", std::move(cols)}};

    if (!atomic_write_file(path_, j.dump(2))) {
        throw StoreError("JsonRecordStore: failed to write " + path_);
    }
}

void JsonRecordStore::rebuild_index(Collection& c) {
    c.id_index.clear();
    c.id_index.reserve(c.records.size());
    for (size_t i = 0; i < c.records.size(); ++i) {
        c.id_index[c.records[i].id] = i;
    }
}

void JsonRecordStore::insert(const std::string& collection, const MemoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& c = collections_[collection];
    if (c.id_index.count(record.id) > 0) {
        throw StoreError("JsonRecordStore: duplicate id " + record.id);
    }

    MemoryRecord stored = record;
    stored.similarity_score.reset();
    c.records.push_back(std::move(stored));
    c.id_index[record.id] = c.records.size() - 1;

    try {
        save();
    } catch (const StoreError&) {
        // Keep memory and disk consistent: the write did not happen.
        c.records.pop_back();
        c.id_index.erase(record.id);
        throw;
    }
}

std::vector<MemoryRecord> JsonRecordStore::fetch_by_ids(const std::string& collection,
                                                        const std::vector<std::string>& ids,
                                                        bool include_embeddings) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<MemoryRecord> results;
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return results;

    const auto& c = cit->second;
    for (const auto& id : ids) {
        auto it = c.id_index.find(id);
        if (it == c.id_index.end()) continue;
        MemoryRecord record = c.records[it->second];
        if (!include_embeddings) record.embedding.clear();
        results.push_back(std::move(record));
    }
    return results;
}

bool JsonRecordStore::remove(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return false;

    auto& c = cit->second;
    auto it = c.id_index.find(id);
    if (it == c.id_index.end()) return false;

    MemoryRecord removed = std::move(c.records[it->second]);
    size_t pos = it->second;
    c.records.erase(c.records.begin() + static_cast<std::ptrdiff_t>(pos));
    rebuild_index(c);

    try {
        save();
    } catch (const StoreError&) {
        c.records.insert(c.records.begin() + static_cast<std::ptrdiff_t>(pos), std::move(removed));
        rebuild_index(c);
        throw;
    }
    return true;
}

std::vector<MemoryRecord> JsonRecordStore::scan_recent(const std::string& collection,
                                                       uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return {};

    // Later insertions win ties, matching the SQLite rowid ordering.
    std::vector<const MemoryRecord*> ordered;
    ordered.reserve(cit->second.records.size());
    for (auto it = cit->second.records.rbegin(); it != cit->second.records.rend(); ++it) {
        ordered.push_back(&*it);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const MemoryRecord* a, const MemoryRecord* b) {
                         return a->created_at > b->created_at;
                     });

    size_t n = std::min(static_cast<size_t>(limit), ordered.size());
    std::vector<MemoryRecord> results;
    results.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        results.push_back(*ordered[i]);
    }
    return results;
}

uint32_t JsonRecordStore::count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return 0;
    return static_cast<uint32_t>(cit->second.records.size());
}

uint32_t JsonRecordStore::count_since(const std::string& collection, uint64_t since) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return 0;
    return static_cast<uint32_t>(std::count_if(
        cit->second.records.begin(), cit->second.records.end(),
        [since](const MemoryRecord& r) { return r.created_at > since; }));
}

std::map<ScopeKind, uint32_t> JsonRecordStore::count_by_scope_kind(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<ScopeKind, uint32_t> counts;
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return counts;
    for (const auto& r : cit->second.records) {
        counts[{r.scope, r.kind}]++;
    }
    return counts;
}

std::map<std::string, uint32_t> JsonRecordStore::count_by_user(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, uint32_t> counts;
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return counts;
    for (const auto& r : cit->second.records) {
        counts[metadata_string(r.metadata, meta::kUserId).value_or("")]++;
    }
    return counts;
}

std::vector<std::string> JsonRecordStore::remove_expired(const std::string& collection,
                                                         uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> removed;
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return removed;

    auto& c = cit->second;
    std::vector<MemoryRecord> kept;
    kept.reserve(c.records.size());
    for (auto& r : c.records) {
        if (is_expired(r, now)) removed.push_back(r.id);
        else kept.push_back(r);
    }
    if (removed.empty()) return removed;

    std::swap(c.records, kept);
    rebuild_index(c);
    try {
        save();
    } catch (const StoreError&) {
        std::swap(c.records, kept);
        rebuild_index(c);
        throw;
    }
    return removed;
}

uint32_t JsonRecordStore::count_expired(const std::string& collection, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cit = collections_.find(collection);
    if (cit == collections_.end()) return 0;
    return static_cast<uint32_t>(std::count_if(
        cit->second.records.begin(), cit->second.records.end(),
        [now](const MemoryRecord& r) { return is_expired(r, now); }));
}

} // namespace engram
