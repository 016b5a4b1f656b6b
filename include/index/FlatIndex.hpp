#pragma once
#include "index/VectorIndex.hpp"

#include <memory>
#include <vector>

namespace labelsearch {

// Exact brute-force index. Ground truth for recall measurement; ef_search and
// deadlines are ignored.
class FlatIndex final : public VectorIndex {
public:
    explicit FlatIndex(Metric metric = Metric::Cosine) : m_metric(metric) {}

    static std::shared_ptr<const FlatIndex> build(std::vector<CorpusEntry> entries, Metric metric);

    // Throws std::invalid_argument on a dim mismatch or an empty vector.
    size_t add(CorpusEntry entry);

    SearchResult search(const std::vector<float>& query, size_t k, size_t ef_search,
                        Deadline deadline) const override;

    size_t size() const override { return m_entries.size(); }
    size_t dim() const override { return m_dim; }
    Metric metric() const override { return m_metric; }

    const CorpusEntry& entry(size_t id) const override { return m_entries.at(id); }
    const std::vector<CorpusEntry>& entries() const override { return m_entries; }

private:
    Metric m_metric;
    size_t m_dim = 0;
    std::vector<CorpusEntry> m_entries;
    std::vector<float> m_vecs; // packed: size = size()*dim()
};

}  // namespace labelsearch
