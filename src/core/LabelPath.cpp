#include "core/LabelPath.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace labelsearch {
namespace labels {

LabelPath parse(const std::string& joined) {
    if (joined.empty()) throw std::invalid_argument("empty label path");

    const size_t sep_len = std::strlen(kSeparator);
    LabelPath out;

    size_t start = 0;
    while (true) {
        const size_t pos = joined.find(kSeparator, start);
        const std::string level = joined.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (level.empty()) throw std::invalid_argument("empty level in label path: " + joined);
        out.push_back(level);
        if (pos == std::string::npos) break;
        start = pos + sep_len;
    }
    return out;
}

std::string join(const LabelPath& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += kSeparator;
        out += path[i];
    }
    return out;
}

std::string render_text(const LabelPath& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += path[i];
    }
    return out;
}

LabelPath truncate(const LabelPath& path, size_t depth) {
    if (depth == 0 || depth >= path.size()) return path;
    return LabelPath(path.begin(), path.begin() + depth);
}

bool equal_at_depth(const LabelPath& a, const LabelPath& b, size_t depth) {
    return truncate(a, depth) == truncate(b, depth);
}

}  // namespace labels
}  // namespace labelsearch
