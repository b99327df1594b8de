#pragma once
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace engram {

// Unix epoch seconds
uint64_t epoch_seconds();

// Milliseconds from a monotonic clock (for latency measurement only)
double monotonic_ms();

// Trim whitespace
std::string trim(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Strict numeric parsing: the whole string must be consumed and in range.
// parse_uint64 rejects a leading '-'; parse_double rejects inf and nan.
std::optional<int64_t> parse_int64(const std::string& s);
std::optional<uint64_t> parse_uint64(const std::string& s);
std::optional<double> parse_double(const std::string& s);

// Generate a unique ID (32 hex chars, 128 random bits)
std::string generate_id();

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Returns false if the file could not be written.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace engram
