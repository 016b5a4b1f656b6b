#include "corpus/CorpusEmbedder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace labelsearch {

std::vector<CorpusEntry> embed_corpus(const Encoder& encoder, const std::vector<Example>& examples,
                                      size_t batch_size, size_t first_id) {
    if (batch_size == 0) batch_size = 1;
    const size_t dim = encoder.dim();

    std::vector<CorpusEntry> out;
    out.reserve(examples.size());

    for (size_t start = 0; start < examples.size(); start += batch_size) {
        const size_t end = std::min(examples.size(), start + batch_size);

        std::vector<std::string> texts;
        texts.reserve(end - start);
        for (size_t i = start; i < end; ++i) texts.push_back(examples[i].text);

        Matrix vecs = encoder.encode_batch(texts);
        if (vecs.size() != texts.size()) {
            throw std::invalid_argument("embed_corpus: encoder returned " + std::to_string(vecs.size()) +
                                        " vectors for " + std::to_string(texts.size()) + " texts");
        }

        for (size_t i = start; i < end; ++i) {
            auto& v = vecs[i - start];
            if (v.size() != dim) {
                throw std::invalid_argument("embed_corpus: inconsistent embedding dim " + std::to_string(v.size()) +
                                            " (expected " + std::to_string(dim) + ")");
            }

            CorpusEntry e;
            e.embedding.owner_id = "c" + std::to_string(first_id + i);
            e.embedding.vector = std::move(v);
            e.label_path = examples[i].label_path;
            e.text = examples[i].text;
            out.push_back(std::move(e));
        }
    }
    return out;
}

}  // namespace labelsearch
