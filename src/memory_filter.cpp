#include "memory_filter.hpp"
#include <algorithm>

namespace engram {

bool MetadataFilter::matches_terms(const Metadata& md) const {
    for (const auto& [key, expected] : equals) {
        auto it = md.find(key);
        if (it == md.end() || it->second != expected) return false;
    }

    if (!all_tags.empty()) {
        auto tags = metadata_list(md, meta::kTags);
        for (const auto& tag : all_tags) {
            if (std::find(tags.begin(), tags.end(), tag) == tags.end()) return false;
        }
    }
    return true;
}

bool MetadataFilter::matches(const Metadata& md) const {
    if (!matches_terms(md)) return false;
    if (!created) return true;

    auto it = md.find(meta::kCreatedAt);
    if (it == md.end()) return false;
    const auto* ts = std::get_if<double>(&it->second);
    if (!ts) return false;
    return *ts >= static_cast<double>(created->start) &&
           *ts <= static_cast<double>(created->end);
}

bool MetadataFilter::matches(const MemoryRecord& record) const {
    if (!matches_terms(record.metadata)) return false;
    if (!created) return true;
    return record.created_at >= created->start && record.created_at <= created->end;
}

MetadataFilter build_metadata_filter(const MemoryQuery& query) {
    MetadataFilter filter;
    const auto& f = query.filters;

    // Open map first so the first-class fields win on a key clash.
    filter.equals = f.metadata;

    if (f.user_id)         filter.equals[meta::kUserId] = *f.user_id;
    if (f.session_id)      filter.equals[meta::kSessionId] = *f.session_id;
    if (f.conversation_id) filter.equals[meta::kConversationId] = *f.conversation_id;
    if (f.scope)           filter.equals[meta::kScope] = *f.scope;
    if (f.kind)            filter.equals[meta::kKind] = *f.kind;

    filter.all_tags = f.tags;
    std::sort(filter.all_tags.begin(), filter.all_tags.end());
    filter.all_tags.erase(std::unique(filter.all_tags.begin(), filter.all_tags.end()),
                          filter.all_tags.end());

    filter.created = query.time_range;
    return filter;
}

MetadataFilter memory_id_filter(const std::string& id) {
    MetadataFilter filter;
    filter.equals[meta::kMemoryId] = id;
    return filter;
}

Metadata index_metadata(const MemoryRecord& record) {
    Metadata md = record.metadata;
    md[meta::kMemoryId] = record.id;
    md[meta::kScope] = record.scope;
    md[meta::kKind] = record.kind;
    md[meta::kCreatedAt] = static_cast<double>(record.created_at);
    return md;
}

} // namespace engram
