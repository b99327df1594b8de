#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

// Scalar or string-list value stored in record metadata.
using MetadataValue = std::variant<std::string, double, bool, std::vector<std::string>>;

// Ordered so that serialization (and therefore cache keys) is deterministic.
using Metadata = std::map<std::string, MetadataValue>;

// Well-known metadata keys
namespace meta {
inline constexpr const char* kUserId         = "user_id";
inline constexpr const char* kSessionId      = "session_id";
inline constexpr const char* kConversationId = "conversation_id";
inline constexpr const char* kTags           = "tags";
inline constexpr const char* kScope          = "scope";
inline constexpr const char* kKind           = "kind";
inline constexpr const char* kMemoryId       = "memory_id";
inline constexpr const char* kCreatedAt      = "created_at";
} // namespace meta

nlohmann::json metadata_value_to_json(const MetadataValue& value);

// Numbers become double, arrays keep only their string elements.
// Returns nullopt for null, objects and other unsupported shapes.
std::optional<MetadataValue> metadata_value_from_json(const nlohmann::json& j);

nlohmann::json metadata_to_json(const Metadata& md);

// Unsupported values are skipped.
Metadata metadata_from_json(const nlohmann::json& j);

// Returns the string value for key, or nullopt if absent or not a string.
std::optional<std::string> metadata_string(const Metadata& md, const std::string& key);

// Returns the string list for key (empty if absent or not a list).
std::vector<std::string> metadata_list(const Metadata& md, const std::string& key);

// Parse a "key=value" CLI argument. "true"/"false" become bool,
// numeric text becomes double, anything else stays a string.
std::optional<std::pair<std::string, MetadataValue>> parse_metadata_arg(const std::string& arg);

} // namespace engram
