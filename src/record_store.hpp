#pragma once
#include "memory.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace engram {

struct Config; // forward declaration

using ScopeKind = std::pair<std::string, std::string>;

// Authoritative durable storage of memory records, partitioned by
// collection. Every method throws StoreError when the backend fails.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::string backend_name() const = 0;

    // Insert a new record. Ids are unique within a collection.
    virtual void insert(const std::string& collection, const MemoryRecord& record) = 0;

    // Fetch records by id. Unknown ids are skipped; result order is not
    // guaranteed. Embeddings are loaded only when requested.
    virtual std::vector<MemoryRecord> fetch_by_ids(const std::string& collection,
                                                   const std::vector<std::string>& ids,
                                                   bool include_embeddings) = 0;

    // Delete a record. Returns true if it existed.
    virtual bool remove(const std::string& collection, const std::string& id) = 0;

    // Most recent records (created_at descending), embeddings included.
    virtual std::vector<MemoryRecord> scan_recent(const std::string& collection,
                                                  uint32_t limit) = 0;

    virtual uint32_t count(const std::string& collection) = 0;

    // Records with created_at strictly after `since`.
    virtual uint32_t count_since(const std::string& collection, uint64_t since) = 0;

    virtual std::map<ScopeKind, uint32_t> count_by_scope_kind(const std::string& collection) = 0;

    // Records grouped by metadata user_id ("" for records without one).
    virtual std::map<std::string, uint32_t> count_by_user(const std::string& collection) = 0;

    // Delete every record whose expires_at is set and <= now.
    // Returns the ids removed.
    virtual std::vector<std::string> remove_expired(const std::string& collection,
                                                    uint64_t now) = 0;

    virtual uint32_t count_expired(const std::string& collection, uint64_t now) = 0;
};

// Create the configured record store through the plugin registry.
// Falls back to the "json" backend when the configured one is not built in.
std::unique_ptr<RecordStore> create_record_store(const Config& config);

} // namespace engram
