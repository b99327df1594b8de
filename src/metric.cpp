#include "metric.hpp"
#include <cmath>

namespace engram {

std::string metric_mode_to_string(MetricMode mode) {
    switch (mode) {
        case MetricMode::Similarity: return "similarity";
        case MetricMode::Distance:   return "distance";
    }
    return "similarity";
}

std::optional<MetricMode> metric_mode_from_string(const std::string& s) {
    if (s == "similarity") return MetricMode::Similarity;
    if (s == "distance")   return MetricMode::Distance;
    return std::nullopt;
}

double to_similarity(double score, MetricMode mode) {
    return mode == MetricMode::Distance ? 1.0 - score : score;
}

bool threshold_in_range(double threshold, MetricMode mode) {
    if (!std::isfinite(threshold)) return false;
    if (mode == MetricMode::Distance) return threshold >= 0.0 && threshold <= 2.0;
    return threshold >= -1.0 && threshold <= 1.0;
}

} // namespace engram
