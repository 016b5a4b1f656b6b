#pragma once
#include "core/Types.hpp"
#include "emb/Encoder.hpp"

#include <vector>

namespace labelsearch {

// One CorpusEntry per example, owner ids "c<first_id + index>", through the
// same encoder queries use. Entries appended to an existing corpus pass its
// size as first_id so ids stay unique. Does not touch encoder weights. Throws std::invalid_argument
// when the encoder returns a vector whose dim differs from encoder.dim().
std::vector<CorpusEntry> embed_corpus(const Encoder& encoder, const std::vector<Example>& examples,
                                      size_t batch_size = 64, size_t first_id = 0);

}  // namespace labelsearch
