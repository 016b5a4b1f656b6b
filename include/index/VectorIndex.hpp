#pragma once
#include "core/Types.hpp"
#include "index/Distance.hpp"

#include <chrono>
#include <vector>

namespace labelsearch {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

inline Deadline no_deadline() { return Deadline::max(); }

struct SearchResult {
    std::vector<SearchHit> hits;  // ascending distance, size <= k
    bool timed_out = false;       // deadline hit, hits are what was found so far
};

// Read-only once built; search() may be called from any number of threads.
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual SearchResult search(const std::vector<float>& query, size_t k, size_t ef_search,
                                Deadline deadline) const = 0;

    virtual size_t size() const = 0;
    virtual size_t dim() const = 0;
    virtual Metric metric() const = 0;

    virtual const CorpusEntry& entry(size_t id) const = 0;
    virtual const std::vector<CorpusEntry>& entries() const = 0;
};

}  // namespace labelsearch
