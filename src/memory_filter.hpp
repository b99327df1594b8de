#pragma once
#include "memory.hpp"
#include "metadata.hpp"
#include <optional>
#include <string>
#include <vector>

namespace engram {

// Declarative filter shared by the vector index (pushed down) and the
// post-fetch pass over full records. All terms are conjunctive.
struct MetadataFilter {
    Metadata equals;                     // key present and value type-exactly equal
    std::vector<std::string> all_tags;   // each must appear in the "tags" list
    std::optional<TimeRange> created;    // inclusive bounds on created_at

    bool empty() const { return equals.empty() && all_tags.empty() && !created; }

    // Evaluate against index-side metadata, where created_at is mirrored
    // as a number under "created_at".
    bool matches(const Metadata& md) const;

    // Evaluate against a full record.
    bool matches(const MemoryRecord& record) const;

private:
    bool matches_terms(const Metadata& md) const;
};

// Build the filter for a query: user/session/conversation/scope/kind and
// the open metadata map become equality terms, tags become required tags,
// the time range becomes the created bound.
MetadataFilter build_metadata_filter(const MemoryQuery& query);

// Filter that selects a single record by id in the vector index.
MetadataFilter memory_id_filter(const std::string& id);

// Metadata written to the vector index for a record: the record's metadata
// plus memory_id, scope, kind and created_at.
Metadata index_metadata(const MemoryRecord& record);

} // namespace engram
