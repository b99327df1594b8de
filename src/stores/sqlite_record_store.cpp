#include "sqlite_record_store.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>

static engram::RecordStoreRegistrar reg_sqlite("sqlite",
    [](const engram::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = engram::expand_home("~/.engram/memory.db");
        }
        return std::make_unique<engram::SqliteRecordStore>(path);
    });

namespace engram {

// Ids per IN (...) clause; stays under SQLITE_MAX_VARIABLE_NUMBER on old builds.
static constexpr size_t kIdBatch = 500;

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::string db_error(sqlite3* db, const std::string& what) {
    return "SqliteRecordStore: " + what + ": " + (db ? sqlite3_errmsg(db) : "no database");
}

static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(db_error(db, "prepare failed"));
    }
}

SqliteRecordStore::SqliteRecordStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("SqliteRecordStore: failed to open database: " + err);
    }

    // Performance pragmas (best effort)
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteRecordStore::~SqliteRecordStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteRecordStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SqliteRecordStore: " + msg);
    }
}

void SqliteRecordStore::init_schema() {
    // user_id is denormalized out of metadata for the per-user breakdown.
    exec("CREATE TABLE IF NOT EXISTS memory_records ("
         "  collection TEXT NOT NULL,"
         "  id         TEXT NOT NULL,"
         "  content    TEXT NOT NULL,"
         "  scope      TEXT NOT NULL,"
         "  kind       TEXT NOT NULL,"
         "  user_id    TEXT NOT NULL DEFAULT '',"
         "  metadata   TEXT NOT NULL,"
         "  embedding  BLOB,"
         "  created_at INTEGER NOT NULL,"
         "  expires_at INTEGER NOT NULL DEFAULT 0,"
         "  PRIMARY KEY (collection, id)"
         ");");

    // Add expires_at to databases created before it existed (silently
    // ignored if it already exists)
    sqlite3_exec(db_, "ALTER TABLE memory_records ADD COLUMN expires_at INTEGER NOT NULL DEFAULT 0;",
                 nullptr, nullptr, nullptr);

    exec("CREATE INDEX IF NOT EXISTS memory_records_recent "
         "ON memory_records(collection, created_at DESC);");
}

// Helper: read embedding BLOB from a column into a vector<float>
static Embedding read_embedding_blob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) return {};

    size_t count = static_cast<size_t>(bytes) / sizeof(float);
    Embedding emb(count);
    std::memcpy(emb.data(), blob, static_cast<size_t>(bytes));
    return emb;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : std::string{};
}

// Helper: read a record from a statement selecting
// id, content, scope, kind, metadata, created_at, expires_at[, embedding]
// (columns 0-7).
static MemoryRecord record_from_stmt(sqlite3_stmt* stmt, bool with_embedding) {
    MemoryRecord record;
    record.id      = column_text(stmt, 0);
    record.content = column_text(stmt, 1);
    record.scope   = column_text(stmt, 2);
    record.kind    = column_text(stmt, 3);

    auto md = nlohmann::json::parse(column_text(stmt, 4), nullptr, false);
    if (md.is_discarded()) {
        std::cerr << "[sqlite] Unreadable metadata on record " << record.id << "\n";
    } else {
        record.metadata = metadata_from_json(md);
    }

    record.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    record.expires_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    if (with_embedding) {
        record.embedding = read_embedding_blob(stmt, 7);
    }
    return record;
}

void SqliteRecordStore::insert(const std::string& collection, const MemoryRecord& record) {
    std::string metadata = metadata_to_json(record.metadata).dump();
    std::string user_id = metadata_string(record.metadata, meta::kUserId).value_or("");

    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "INSERT INTO memory_records"
        " (collection, id, content, scope, kind, user_id, metadata, embedding,"
        "  created_at, expires_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(),     -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, record.id.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, record.content.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, record.scope.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, record.kind.c_str(),    -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, user_id.c_str(),        -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 7, metadata.c_str(),       -1, SQLITE_STATIC);
    if (record.embedding.empty()) {
        sqlite3_bind_null(g.stmt, 8);
    } else {
        sqlite3_bind_blob(g.stmt, 8, record.embedding.data(),
                          static_cast<int>(record.embedding.size() * sizeof(float)),
                          SQLITE_STATIC);
    }
    sqlite3_bind_int64(g.stmt, 9, static_cast<int64_t>(record.created_at));
    sqlite3_bind_int64(g.stmt, 10, static_cast<int64_t>(record.expires_at));

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(db_error(db_, "insert of " + record.id + " failed"));
    }
}

std::vector<MemoryRecord> SqliteRecordStore::fetch_by_ids(const std::string& collection,
                                                          const std::vector<std::string>& ids,
                                                          bool include_embeddings) {
    std::vector<MemoryRecord> results;
    if (ids.empty()) return results;

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t start = 0; start < ids.size(); start += kIdBatch) {
        size_t end = std::min(ids.size(), start + kIdBatch);

        std::string sql = "SELECT id, content, scope, kind, metadata, created_at, expires_at";
        if (include_embeddings) sql += ", embedding";
        sql += " FROM memory_records WHERE collection = ? AND id IN (";
        for (size_t i = start; i < end; i++) {
            if (i > start) sql += ',';
            sql += '?';
        }
        sql += ");";

        StmtGuard g;
        prepare(db_, sql, g);
        sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
        for (size_t i = start; i < end; i++) {
            sqlite3_bind_text(g.stmt, static_cast<int>(i - start + 2),
                              ids[i].c_str(), -1, SQLITE_STATIC);
        }

        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            results.push_back(record_from_stmt(g.stmt, include_embeddings));
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) {
            throw StoreError(db_error(db_, "fetch failed"));
        }
    }
    return results;
}

bool SqliteRecordStore::remove(const std::string& collection, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "DELETE FROM memory_records WHERE collection = ? AND id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, id.c_str(),         -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(db_error(db_, "delete of " + id + " failed"));
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<MemoryRecord> SqliteRecordStore::scan_recent(const std::string& collection,
                                                         uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "SELECT id, content, scope, kind, metadata, created_at, expires_at, embedding"
        " FROM memory_records WHERE collection = ?"
        " ORDER BY created_at DESC, rowid DESC LIMIT ?;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(limit));

    std::vector<MemoryRecord> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back(record_from_stmt(g.stmt, true));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(db_error(db_, "scan failed"));
    }
    return results;
}

uint32_t SqliteRecordStore::count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM memory_records WHERE collection = ?;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError(db_error(db_, "count failed"));
    }
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

uint32_t SqliteRecordStore::count_since(const std::string& collection, uint64_t since) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM memory_records"
                 " WHERE collection = ? AND created_at > ?;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(since));
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError(db_error(db_, "count failed"));
    }
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

std::map<ScopeKind, uint32_t> SqliteRecordStore::count_by_scope_kind(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT scope, kind, COUNT(*) FROM memory_records"
                 " WHERE collection = ? GROUP BY scope, kind;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);

    std::map<ScopeKind, uint32_t> counts;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        counts[{column_text(g.stmt, 0), column_text(g.stmt, 1)}] =
            static_cast<uint32_t>(sqlite3_column_int(g.stmt, 2));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(db_error(db_, "count failed"));
    }
    return counts;
}

std::map<std::string, uint32_t> SqliteRecordStore::count_by_user(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT user_id, COUNT(*) FROM memory_records"
                 " WHERE collection = ? GROUP BY user_id;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);

    std::map<std::string, uint32_t> counts;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        counts[column_text(g.stmt, 0)] = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 1));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(db_error(db_, "count failed"));
    }
    return counts;
}

std::vector<std::string> SqliteRecordStore::remove_expired(const std::string& collection,
                                                           uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> expired;
    {
        StmtGuard sg;
        prepare(db_, "SELECT id FROM memory_records"
                     " WHERE collection = ? AND expires_at != 0 AND expires_at <= ?;", sg);
        sqlite3_bind_text(sg.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(sg.stmt, 2, static_cast<int64_t>(now));
        int rc = sqlite3_step(sg.stmt);
        while (rc == SQLITE_ROW) {
            expired.push_back(column_text(sg.stmt, 0));
            rc = sqlite3_step(sg.stmt);
        }
        if (rc != SQLITE_DONE) {
            throw StoreError(db_error(db_, "expiry scan failed"));
        }
    }

    std::vector<std::string> removed;
    for (const auto& id : expired) {
        StmtGuard dg;
        prepare(db_, "DELETE FROM memory_records WHERE collection = ? AND id = ?;", dg);
        sqlite3_bind_text(dg.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(dg.stmt, 2, id.c_str(),         -1, SQLITE_STATIC);
        if (sqlite3_step(dg.stmt) != SQLITE_DONE) {
            throw StoreError(db_error(db_, "delete of " + id + " failed"));
        }
        if (sqlite3_changes(db_) > 0) removed.push_back(id);
    }
    return removed;
}

uint32_t SqliteRecordStore::count_expired(const std::string& collection, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM memory_records"
                 " WHERE collection = ? AND expires_at != 0 AND expires_at <= ?;", g);
    sqlite3_bind_text(g.stmt, 1, collection.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(now));
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError(db_error(db_, "count failed"));
    }
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

} // namespace engram
