#include "index/HnswIndex.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <stdexcept>
#include <utility>

namespace labelsearch {

static constexpr int kMaxLevel = 16;
static constexpr size_t kDeadlineCheckEvery = 32;  // expansions between clock reads

HnswIndex::HnswIndex(HnswConfig cfg) : m_cfg(cfg), m_rng(cfg.seed) {
    if (m_cfg.M < 2) throw std::invalid_argument("HnswIndex: M must be at least 2");
    if (m_cfg.ef_construction == 0) m_cfg.ef_construction = 1;
    m_ml = 1.0 / std::log((double)m_cfg.M);
}

std::shared_ptr<const HnswIndex> HnswIndex::build(std::vector<CorpusEntry> entries, const HnswConfig& cfg) {
    auto idx = std::make_shared<HnswIndex>(cfg);
    for (auto& e : entries) idx->insert(std::move(e));
    return idx;
}

const std::vector<uint32_t>& HnswIndex::links(size_t id, int layer) const {
    return m_links.at(id).at((size_t)layer);
}

int HnswIndex::random_level() {
    // 1 - U lies in (0, 1]
    const double u = 1.0 - m_uniform(m_rng);
    const int level = (int)std::floor(-std::log(u) * m_ml);
    return std::min(level, kMaxLevel);
}

std::vector<HnswIndex::Candidate> HnswIndex::search_layer(const float* q, uint32_t entry, size_t ef, int layer,
                                                          Deadline deadline, bool& timed_out) const {
    std::vector<uint8_t> visited(m_entries.size(), 0);
    visited[entry] = 1;

    // candidates: closest first; results: farthest first
    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> candidates;
    std::priority_queue<Candidate> results;

    const float d0 = dist(q, entry);
    candidates.push({d0, entry});
    results.push({d0, entry});

    const bool has_deadline = deadline != no_deadline();
    size_t expansions = 0;

    while (!candidates.empty()) {
        if (has_deadline && (++expansions % kDeadlineCheckEvery) == 0 && Clock::now() >= deadline) {
            timed_out = true;
            break;
        }

        const Candidate c = candidates.top();
        if (c.first > results.top().first && results.size() >= ef) break;
        candidates.pop();

        const auto& node_links = m_links[c.second];
        if ((size_t)layer >= node_links.size()) continue;

        for (uint32_t nb : node_links[(size_t)layer]) {
            if (visited[nb]) continue;
            visited[nb] = 1;

            const float d = dist(q, nb);
            if (results.size() < ef || d < results.top().first) {
                candidates.push({d, nb});
                results.push({d, nb});
                if (results.size() > ef) results.pop();
            }
        }
    }

    std::vector<Candidate> out;
    out.reserve(results.size());
    while (!results.empty()) {
        out.push_back(results.top());
        results.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

void HnswIndex::prune(uint32_t node, int layer, size_t cap) {
    auto& adj = m_links[node][(size_t)layer];
    if (adj.size() <= cap) return;

    std::vector<Candidate> scored;
    scored.reserve(adj.size());
    for (uint32_t nb : adj) scored.push_back({dist(vec(node), nb), nb});
    std::sort(scored.begin(), scored.end());

    adj.clear();
    for (size_t i = 0; i < cap; ++i) adj.push_back(scored[i].second);
}

size_t HnswIndex::insert(CorpusEntry entry) {
    const auto& v = entry.embedding.vector;
    if (v.empty()) throw std::invalid_argument("HnswIndex: empty embedding for " + entry.embedding.owner_id);
    if (m_dim == 0) m_dim = v.size();
    if (v.size() != m_dim) {
        throw std::invalid_argument("HnswIndex: embedding dim " + std::to_string(v.size()) +
                                    " does not match index dim " + std::to_string(m_dim));
    }

    std::vector<float> stored = v;
    if (m_cfg.metric == Metric::Cosine) normalize(stored);

    const uint32_t id = (uint32_t)m_entries.size();
    m_entries.push_back(std::move(entry));
    m_vecs.insert(m_vecs.end(), stored.begin(), stored.end());

    const int level = random_level();
    m_links.emplace_back((size_t)level + 1);

    if (m_max_level < 0) {
        m_entry_point = id;
        m_max_level = level;
        return id;
    }

    const float* q = vec(id);
    bool unused_timeout = false;
    uint32_t cur = m_entry_point;

    // greedy descent through layers above the new node's level
    for (int l = m_max_level; l > level; --l) {
        auto nearest = search_layer(q, cur, 1, l, no_deadline(), unused_timeout);
        if (!nearest.empty()) cur = nearest[0].second;
    }

    const size_t ef = std::max(m_cfg.ef_construction, m_cfg.M);
    for (int l = std::min(level, m_max_level); l >= 0; --l) {
        auto cands = search_layer(q, cur, ef, l, no_deadline(), unused_timeout);
        const size_t cap = (l == 0) ? 2 * m_cfg.M : m_cfg.M;
        const size_t take = std::min(m_cfg.M, cands.size());

        auto& own = m_links[id][(size_t)l];
        for (size_t i = 0; i < take; ++i) {
            const uint32_t nb = cands[i].second;
            own.push_back(nb);
            m_links[nb][(size_t)l].push_back(id);
            prune(nb, l, cap);
        }

        if (!cands.empty()) cur = cands[0].second;
    }

    if (level > m_max_level) {
        m_entry_point = id;
        m_max_level = level;
    }
    return id;
}

SearchResult HnswIndex::search(const std::vector<float>& query, size_t k, size_t ef_search,
                               Deadline deadline) const {
    SearchResult res;
    if (m_entries.empty() || k == 0) return res;
    if (query.size() != m_dim) {
        throw std::invalid_argument("HnswIndex: query dim " + std::to_string(query.size()) +
                                    " does not match index dim " + std::to_string(m_dim));
    }

    std::vector<float> q = query;
    if (m_cfg.metric == Metric::Cosine) normalize(q);

    const size_t ef = std::max(ef_search, k);
    if (ef >= m_entries.size()) {
        res.hits = exact_topk(m_vecs, m_dim, m_cfg.metric, q.data(), k);
        return res;
    }

    uint32_t cur = m_entry_point;
    std::vector<Candidate> found;

    for (int l = m_max_level; l > 0 && !res.timed_out; --l) {
        found = search_layer(q.data(), cur, 1, l, deadline, res.timed_out);
        if (!found.empty()) cur = found[0].second;
    }
    if (!res.timed_out) {
        found = search_layer(q.data(), cur, ef, 0, deadline, res.timed_out);
    }

    if (found.size() > k) found.resize(k);
    res.hits.reserve(found.size());
    for (const auto& c : found) res.hits.push_back({(size_t)c.second, c.first});
    return res;
}

}  // namespace labelsearch
