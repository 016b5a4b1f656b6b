#pragma once
#include "index/VectorIndex.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace labelsearch {

struct HnswConfig {
    size_t M = 16;                 // max links per node on upper layers, 2*M on layer 0
    size_t ef_construction = 200;  // beam width while inserting
    Metric metric = Metric::Cosine;
    uint64_t seed = 42;            // level draws; with insertion order fixes the graph
};

/**
 * Hierarchical navigable small-world graph over corpus entries.
 *
 * Layer 0 holds every node; each higher layer holds an exponentially
 * thinner subset (level ~ floor(-ln(U) / ln(M))). A query descends greedily
 * through the upper layers and finishes with a beam search of width
 * max(ef_search, k) on layer 0.
 *
 * The beam only stops once its result set is full, so on a connected graph a
 * width >= size() visits everything; such searches skip the graph and scan
 * exhaustively. With M >= size() every insertion links to every earlier
 * node and the graph is complete.
 *
 * Mutable only through insert(); share as shared_ptr<const HnswIndex> once
 * built.
 */
class HnswIndex final : public VectorIndex {
public:
    explicit HnswIndex(HnswConfig cfg = {});

    // Inserts in input order. Empty input gives an empty index.
    static std::shared_ptr<const HnswIndex> build(std::vector<CorpusEntry> entries, const HnswConfig& cfg);

    // Returns the new entry id. Throws std::invalid_argument on a dim mismatch
    // or an empty vector.
    size_t insert(CorpusEntry entry);

    SearchResult search(const std::vector<float>& query, size_t k, size_t ef_search,
                        Deadline deadline) const override;

    size_t size() const override { return m_entries.size(); }
    size_t dim() const override { return m_dim; }
    Metric metric() const override { return m_cfg.metric; }

    const CorpusEntry& entry(size_t id) const override { return m_entries.at(id); }
    const std::vector<CorpusEntry>& entries() const override { return m_entries; }

    const HnswConfig& config() const { return m_cfg; }
    int max_level() const { return m_max_level; }
    const std::vector<uint32_t>& links(size_t id, int layer) const;

private:
    using Candidate = std::pair<float, uint32_t>;  // (distance, id)

    HnswConfig m_cfg;
    double m_ml = 0.0;
    size_t m_dim = 0;

    std::vector<CorpusEntry> m_entries;
    std::vector<float> m_vecs;  // packed, normalized for cosine
    std::vector<std::vector<std::vector<uint32_t>>> m_links;  // [node][layer] -> neighbors

    uint32_t m_entry_point = 0;
    int m_max_level = -1;

    std::mt19937_64 m_rng;
    std::uniform_real_distribution<double> m_uniform{0.0, 1.0};

    const float* vec(uint32_t id) const { return &m_vecs[(size_t)id * m_dim]; }
    float dist(const float* q, uint32_t id) const { return distance(m_cfg.metric, q, vec(id), m_dim); }

    int random_level();

    // Beam search on one layer. Ascending by distance, at most ef entries.
    std::vector<Candidate> search_layer(const float* q, uint32_t entry, size_t ef, int layer,
                                        Deadline deadline, bool& timed_out) const;

    void prune(uint32_t node, int layer, size_t cap);
};

}  // namespace labelsearch
