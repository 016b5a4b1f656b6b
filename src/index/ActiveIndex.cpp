#include "index/ActiveIndex.hpp"

#include <utility>

namespace labelsearch {

ActiveIndex& ActiveIndex::process() {
    static ActiveIndex instance;
    return instance;
}

void ActiveIndex::install(std::shared_ptr<const VectorIndex> idx) {
    std::lock_guard<std::mutex> lock(m_mu);
    m_current = std::move(idx);
    ++m_generation;
}

std::shared_ptr<const VectorIndex> ActiveIndex::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_current;
}

std::shared_ptr<const HnswIndex> ActiveIndex::rebuild(std::vector<CorpusEntry> extra, const HnswConfig& cfg) {
    std::lock_guard<std::mutex> rebuild_lock(m_rebuild_mu);

    std::vector<CorpusEntry> entries;
    if (auto cur = snapshot()) {
        entries.reserve(cur->size() + extra.size());
        entries.assign(cur->entries().begin(), cur->entries().end());
    }
    for (auto& e : extra) entries.push_back(std::move(e));

    // built outside m_mu: readers keep using the old index meanwhile
    auto fresh = HnswIndex::build(std::move(entries), cfg);
    install(fresh);
    return fresh;
}

void ActiveIndex::teardown() {
    std::lock_guard<std::mutex> lock(m_mu);
    m_current.reset();
}

bool ActiveIndex::active() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return (bool)m_current;
}

uint64_t ActiveIndex::generation() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_generation;
}

}  // namespace labelsearch
