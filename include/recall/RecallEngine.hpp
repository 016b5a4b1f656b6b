#pragma once
#include "core/Types.hpp"
#include "index/ActiveIndex.hpp"
#include "index/VectorIndex.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace labelsearch {

struct RecallConfig {
    size_t k = 10;
    size_t ef_search = 64;   // beam width on layer 0, raised to k when smaller
    int64_t timeout_ms = 0;  // 0 = no deadline
};

// Top-K corpus entries for a query vector against whatever index is active.
class RecallEngine {
public:
    RecallEngine(const ActiveIndex& active, RecallConfig cfg) : m_active(active), m_cfg(cfg) {}

    // Empty result when no index is installed.
    QueryResult recall(const std::vector<float>& query, const std::string& query_id = "") const;

    const RecallConfig& config() const { return m_cfg; }

    // Pin the active index for a run of queries; may be null.
    std::shared_ptr<const VectorIndex> snapshot() const { return m_active.snapshot(); }

    // Search on an explicit snapshot.
    static QueryResult recall_on(const VectorIndex& idx, const std::vector<float>& query,
                                 const RecallConfig& cfg, const std::string& query_id);

private:
    const ActiveIndex& m_active;
    RecallConfig m_cfg;
};

}  // namespace labelsearch
