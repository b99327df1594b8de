#pragma once
#include "../record_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

class SqliteRecordStore : public RecordStore {
public:
    // Opens (creating if needed) the database at path. ":memory:" works.
    // Throws StoreError if the database cannot be opened.
    explicit SqliteRecordStore(const std::string& path);
    ~SqliteRecordStore() override;

    // Non-copyable
    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

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
    void init_schema();
    void exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace engram
