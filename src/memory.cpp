#include "memory.hpp"
#include <algorithm>

namespace engram {

static nlohmann::json optional_string(const std::optional<std::string>& v) {
    if (!v) return nullptr;
    return *v;
}

nlohmann::json query_to_canonical_json(const MemoryQuery& query) {
    std::vector<std::string> tags = query.filters.tags;
    std::sort(tags.begin(), tags.end());
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());

    nlohmann::json time_range = nullptr;
    if (query.time_range) {
        time_range = {query.time_range->start, query.time_range->end};
    }

    // nlohmann::json objects are key-ordered, so dump() is canonical.
    return {
        {"text", query.text},
        {"user_id", optional_string(query.filters.user_id)},
        {"session_id", optional_string(query.filters.session_id)},
        {"conversation_id", optional_string(query.filters.conversation_id)},
        {"scope", optional_string(query.filters.scope)},
        {"kind", optional_string(query.filters.kind)},
        {"tags", tags},
        {"metadata_filter", metadata_to_json(query.filters.metadata)},
        {"time_range", time_range},
        {"top_k", query.top_k},
        {"similarity_threshold", query.similarity_threshold},
        {"include_embeddings", query.include_embeddings}
    };
}

} // namespace engram
