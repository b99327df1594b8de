#pragma once
#include "memory.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// Shared JSON <-> MemoryRecord conversion used by JsonRecordStore, the
// query cache payloads and the CLI.

inline MemoryRecord record_from_json(const nlohmann::json& item) {
    MemoryRecord record;
    record.id = item.value("id", "");
    record.content = item.value("content", "");
    record.scope = item.value("scope", "");
    record.kind = item.value("kind", "");
    record.created_at = item.value("created_at", uint64_t{0});
    record.expires_at = item.value("expires_at", uint64_t{0});
    if (item.contains("metadata")) {
        record.metadata = metadata_from_json(item["metadata"]);
    }
    if (item.contains("embedding") && item["embedding"].is_array()) {
        record.embedding.reserve(item["embedding"].size());
        for (const auto& v : item["embedding"]) {
            if (v.is_number()) record.embedding.push_back(v.get<float>());
        }
    }
    if (item.contains("similarity_score") && item["similarity_score"].is_number()) {
        record.similarity_score = item["similarity_score"].get<double>();
    }
    return record;
}

inline nlohmann::json record_to_json(const MemoryRecord& record,
                                     bool include_embedding = true) {
    nlohmann::json item = {
        {"id", record.id},
        {"content", record.content},
        {"scope", record.scope},
        {"kind", record.kind},
        {"created_at", record.created_at},
        {"expires_at", record.expires_at},
        {"metadata", metadata_to_json(record.metadata)}
    };
    if (include_embedding && !record.embedding.empty()) {
        item["embedding"] = record.embedding;
    }
    if (record.similarity_score) {
        item["similarity_score"] = *record.similarity_score;
    }
    return item;
}

} // namespace engram
