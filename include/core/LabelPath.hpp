#pragma once
#include "core/Types.hpp"

#include <string>

namespace labelsearch {
namespace labels {

// Reserved level separator in every external representation.
inline constexpr const char* kSeparator = "##";

// "体育##篮球" -> {"体育", "篮球"}. Throws std::invalid_argument on an empty
// string or an empty level.
LabelPath parse(const std::string& joined);

std::string join(const LabelPath& path);

// Text used when a label itself is the corpus entry: levels joined by a space.
std::string render_text(const LabelPath& path);

// depth 0 means the full path.
LabelPath truncate(const LabelPath& path, size_t depth);

// Equality of the first `depth` levels (0 = full path). Paths shorter than
// `depth` compare on what they have, so {"a"} != {"a","b"} at depth 2.
bool equal_at_depth(const LabelPath& a, const LabelPath& b, size_t depth);

}  // namespace labels
}  // namespace labelsearch
