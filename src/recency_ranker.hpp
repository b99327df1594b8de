#pragma once
#include "memory.hpp"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace engram {

// Re-ranks candidates by similarity decayed with age:
//   combined = max(0, similarity) * exp(-alpha * age_days)
// The result carries the combined score in similarity_score. Equal combined
// scores rank the newer record first, then keep their input order.
class RecencyRanker {
public:
    explicit RecencyRanker(double alpha) : alpha_(alpha) {}

    // raw_scores maps record id to its similarity; missing ids score 0.
    std::vector<MemoryRecord> rank(std::vector<MemoryRecord> records,
                                   const std::unordered_map<std::string, double>& raw_scores,
                                   uint64_t now) const;

    double recency_weight(uint64_t created_at, uint64_t now) const;

    double alpha() const { return alpha_; }

private:
    double alpha_;
};

} // namespace engram
