#pragma once
#include <optional>
#include <string>

namespace engram {

// How a vector index reports closeness.
// Similarity: cosine similarity, higher = more alike, range [-1, 1].
// Distance:   cosine distance (1 - cosine), lower = more alike, range [0, 2].
enum class MetricMode { Similarity, Distance };

std::string metric_mode_to_string(MetricMode mode);
std::optional<MetricMode> metric_mode_from_string(const std::string& s);

// Convert a raw score in `mode` to similarity (higher = better).
double to_similarity(double score, MetricMode mode);

// Whether a threshold is meaningful for `mode`.
bool threshold_in_range(double threshold, MetricMode mode);

} // namespace engram
