#pragma once
#include "embedder.hpp"
#include "metadata.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

struct MemoryRecord {
    std::string id;
    std::string content;
    Embedding embedding;
    Metadata metadata;          // scope and kind are mirrored here
    std::string scope;
    std::string kind;
    uint64_t created_at = 0;    // epoch seconds, assigned once at store time
    uint64_t expires_at = 0;    // epoch seconds; 0 = never expires

    // Combined relevance score. Only set on query results, never persisted.
    std::optional<double> similarity_score;
};

// Expired once the clock reaches expires_at.
inline bool is_expired(const MemoryRecord& record, uint64_t now) {
    return record.expires_at != 0 && record.expires_at <= now;
}

// Inclusive bounds on created_at (epoch seconds).
struct TimeRange {
    uint64_t start = 0;
    uint64_t end = 0;
};

struct QueryFilters {
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    std::optional<std::string> conversation_id;
    std::optional<std::string> scope;
    std::optional<std::string> kind;
    std::vector<std::string> tags;  // every tag must be present
    Metadata metadata;              // exact-equality terms
};

struct MemoryQuery {
    std::string text;
    QueryFilters filters;
    std::optional<TimeRange> time_range;
    int32_t top_k = 10;
    double similarity_threshold = 0.7;  // interpreted in the configured metric mode
    bool include_embeddings = false;
};

// Canonical JSON form of a query: every field present, tags sorted,
// object keys ordered. Two queries that differ only in tag order produce
// identical output.
nlohmann::json query_to_canonical_json(const MemoryQuery& query);

} // namespace engram
