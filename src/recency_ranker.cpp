#include "recency_ranker.hpp"
#include <algorithm>
#include <cmath>

namespace engram {

static constexpr double kSecondsPerDay = 86400.0;

double RecencyRanker::recency_weight(uint64_t created_at, uint64_t now) const {
    // Clock skew can put created_at in the future; treat it as age 0.
    double age_days = 0.0;
    if (now > created_at) {
        age_days = static_cast<double>(now - created_at) / kSecondsPerDay;
    }
    return std::exp(-alpha_ * age_days);
}

std::vector<MemoryRecord> RecencyRanker::rank(
        std::vector<MemoryRecord> records,
        const std::unordered_map<std::string, double>& raw_scores,
        uint64_t now) const {
    for (auto& record : records) {
        auto it = raw_scores.find(record.id);
        double raw = it != raw_scores.end() ? it->second : 0.0;
        // Anti-correlated candidates carry no relevance; a negative score
        // would shrink toward zero with age and favour older records.
        raw = std::max(0.0, raw);
        record.similarity_score = raw * recency_weight(record.created_at, now);
    }

    std::stable_sort(records.begin(), records.end(),
        [](const MemoryRecord& a, const MemoryRecord& b) {
            if (*a.similarity_score != *b.similarity_score) {
                return *a.similarity_score > *b.similarity_score;
            }
            return a.created_at > b.created_at;
        });
    return records;
}

} // namespace engram
