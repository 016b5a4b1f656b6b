#include "corpus/CorpusStore.hpp"
#include "core/LabelPath.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace labelsearch {

static constexpr char kMagic[4] = {'L', 'S', 'C', 'E'};
static constexpr uint32_t kVersion = 1;

void CorpusStore::set(std::vector<CorpusEntry> entries) {
    size_t dim = entries.empty() ? 0 : entries[0].embedding.dim();
    for (const auto& e : entries) {
        if (e.embedding.dim() != dim) {
            throw std::invalid_argument("CorpusStore: entry " + e.embedding.owner_id + " has dim " +
                                        std::to_string(e.embedding.dim()) + ", expected " + std::to_string(dim));
        }
    }
    m_entries = std::move(entries);
    m_dim = dim;
}

static void write_str(std::ofstream& out, const std::string& s) {
    uint32_t len = (uint32_t)s.size();
    out.write((char*)&len, sizeof(len));
    out.write(s.data(), len);
}

static bool read_str(std::ifstream& in, std::string& s) {
    uint32_t len = 0;
    in.read((char*)&len, sizeof(len));
    if (!in) return false;
    s.assign(len, '\0');
    in.read(s.data(), len);
    return (bool)in;
}

bool CorpusStore::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    uint32_t version = kVersion;
    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_entries.size();
    out.write(kMagic, sizeof(kMagic));
    out.write((char*)&version, sizeof(version));
    out.write((char*)&dim, sizeof(dim));
    out.write((char*)&n, sizeof(n));

    for (const auto& e : m_entries) {
        write_str(out, e.embedding.owner_id);
        write_str(out, labels::join(e.label_path));
        write_str(out, e.text);
        out.write((char*)e.embedding.vector.data(), (std::streamsize)(sizeof(float) * m_dim));
    }
    return (bool)out;
}

bool CorpusStore::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    char magic[4] = {};
    uint32_t version = 0, dim = 0, n = 0;
    in.read(magic, sizeof(magic));
    in.read((char*)&version, sizeof(version));
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0 || version != kVersion) return false;
    if (dim == 0 && n > 0) return false;

    std::vector<CorpusEntry> entries;
    entries.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        CorpusEntry e;
        std::string joined;
        if (!read_str(in, e.embedding.owner_id)) return false;
        if (!read_str(in, joined)) return false;
        if (!read_str(in, e.text)) return false;

        try {
            e.label_path = labels::parse(joined);
        } catch (const std::invalid_argument&) {
            return false;
        }

        e.embedding.vector.resize(dim);
        in.read((char*)e.embedding.vector.data(), (std::streamsize)(sizeof(float) * dim));
        if (!in) return false;
        entries.push_back(std::move(e));
    }

    m_dim = dim;
    m_entries = std::move(entries);
    return true;
}

}  // namespace labelsearch
