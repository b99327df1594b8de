#pragma once
#include "../record_store.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

// Single-file JSON record store. Every mutation rewrites the file
// atomically, so it suits small collections and builds without SQLite.
class JsonRecordStore : public RecordStore {
public:
    explicit JsonRecordStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    void insert(const std::string& collection, const MemoryRecord& record) override;

    std::vector<MemoryRecord> fetch_by_ids(const std::string& collection,
                                           const std::vector<std::string>& ids,
                                           bool include_embeddings) override;

    bool remove(const std::string& collection, const std::string& id) override;

    std::vector<MemoryRecord> scan_recent(const std::string& collection,
                                          uint32_t limit) override;

    uint32_t count(const std::string& collection) override;
    uint32_t count_since(const std::string& collection, uint64_t since) override;
    std::map<ScopeKind, uint32_t> count_by_scope_kind(const std::string& collection) override;
    std::map<std::string, uint32_t> count_by_user(const std::string& collection) override;
    std::vector<std::string> remove_expired(const std::string& collection,
                                            uint64_t now) override;
    uint32_t count_expired(const std::string& collection, uint64_t now) override;

private:
    struct Collection {
        std::vector<MemoryRecord> records;                  // insertion order
        std::unordered_map<std::string, size_t> id_index;   // id -> records index
    };

    void load();
    void save();
    static void rebuild_index(Collection& c);

    std::string path_;
    std::unordered_map<std::string, Collection> collections_;
    mutable std::mutex mutex_;
};

} // namespace engram
