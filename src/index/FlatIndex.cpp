#include "index/FlatIndex.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace labelsearch {

std::shared_ptr<const FlatIndex> FlatIndex::build(std::vector<CorpusEntry> entries, Metric metric) {
    auto idx = std::make_shared<FlatIndex>(metric);
    for (auto& e : entries) idx->add(std::move(e));
    return idx;
}

size_t FlatIndex::add(CorpusEntry entry) {
    const auto& v = entry.embedding.vector;
    if (v.empty()) throw std::invalid_argument("FlatIndex: empty embedding for " + entry.embedding.owner_id);
    if (m_dim == 0) m_dim = v.size();
    if (v.size() != m_dim) {
        throw std::invalid_argument("FlatIndex: embedding dim " + std::to_string(v.size()) +
                                    " does not match index dim " + std::to_string(m_dim));
    }

    std::vector<float> stored = v;
    if (m_metric == Metric::Cosine) normalize(stored);
    m_vecs.insert(m_vecs.end(), stored.begin(), stored.end());

    m_entries.push_back(std::move(entry));
    return m_entries.size() - 1;
}

SearchResult FlatIndex::search(const std::vector<float>& query, size_t k, size_t /*ef_search*/,
                               Deadline /*deadline*/) const {
    SearchResult res;
    if (m_entries.empty() || k == 0) return res;
    if (query.size() != m_dim) {
        throw std::invalid_argument("FlatIndex: query dim " + std::to_string(query.size()) +
                                    " does not match index dim " + std::to_string(m_dim));
    }

    std::vector<float> q = query;
    if (m_metric == Metric::Cosine) normalize(q);
    res.hits = exact_topk(m_vecs, m_dim, m_metric, q.data(), k);
    return res;
}

}  // namespace labelsearch
