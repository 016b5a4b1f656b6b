#pragma once
#include "core/Types.hpp"

#include <string>
#include <vector>

namespace labelsearch {

// Embedded corpus on disk, so `embed` and `classify` can run separately.
class CorpusStore {
public:
    // Throws std::invalid_argument when entries disagree on dim.
    void set(std::vector<CorpusEntry> entries);

    // cache I/O (binary)
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    const std::vector<CorpusEntry>& entries() const { return m_entries; }
    std::vector<CorpusEntry> take() { return std::move(m_entries); }

    size_t dim() const { return m_dim; }
    size_t size() const { return m_entries.size(); }

private:
    size_t m_dim = 0;
    std::vector<CorpusEntry> m_entries;
};

}  // namespace labelsearch
