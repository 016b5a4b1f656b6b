#include "recall/RecallEngine.hpp"

#include <chrono>

namespace labelsearch {

QueryResult RecallEngine::recall_on(const VectorIndex& idx, const std::vector<float>& query,
                                    const RecallConfig& cfg, const std::string& query_id) {
    QueryResult out;
    out.query_id = query_id;

    const Deadline deadline = cfg.timeout_ms > 0
        ? Clock::now() + std::chrono::milliseconds(cfg.timeout_ms)
        : no_deadline();

    SearchResult sr = idx.search(query, cfg.k, cfg.ef_search, deadline);
    out.timed_out = sr.timed_out;
    out.neighbors.reserve(sr.hits.size());

    for (const auto& h : sr.hits) {
        Neighbor n;
        n.entry_id = h.id;
        n.label_path = idx.entry(h.id).label_path;
        n.distance = h.distance;
        n.score = score_from_distance(idx.metric(), h.distance);
        out.neighbors.push_back(std::move(n));
    }
    return out;
}

QueryResult RecallEngine::recall(const std::vector<float>& query, const std::string& query_id) const {
    auto idx = m_active.snapshot();
    if (!idx) {
        QueryResult empty;
        empty.query_id = query_id;
        return empty;
    }
    return recall_on(*idx, query, m_cfg, query_id);
}

}  // namespace labelsearch
