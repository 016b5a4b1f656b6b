#pragma once
#include "index/HnswIndex.hpp"
#include "index/VectorIndex.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace labelsearch {

// Holder of the index queries currently run against.
//
//   install()  -> active
//   rebuild()  -> a new graph is built off to the side, then swapped in
//   teardown() -> released once the last reader drops its snapshot
//
// Readers take snapshot() and keep it for the duration of their query, so
// they see either the whole old index or the whole new one.
class ActiveIndex {
public:
    // Process-wide instance used by the CLI commands.
    static ActiveIndex& process();

    void install(std::shared_ptr<const VectorIndex> idx);

    std::shared_ptr<const VectorIndex> snapshot() const;

    // Current entries plus `extra`, reinserted into a fresh HNSW graph. Throws
    // (and leaves the current index live) on a dim mismatch.
    std::shared_ptr<const HnswIndex> rebuild(std::vector<CorpusEntry> extra, const HnswConfig& cfg);

    void teardown();

    bool active() const;
    uint64_t generation() const;  // bumps on every install/rebuild

private:
    mutable std::mutex m_mu;
    std::mutex m_rebuild_mu;  // one rebuild at a time
    std::shared_ptr<const VectorIndex> m_current;
    uint64_t m_generation = 0;
};

}  // namespace labelsearch
