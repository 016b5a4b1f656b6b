#pragma once
#include "emb/Encoder.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace labelsearch {

struct HashingEncoderConfig {
    size_t dim = 128;
    size_t num_buckets = 1u << 15;  // hashed feature table rows
    bool use_bigrams = true;        // adjacent-token features on top of unigrams
    uint64_t seed = 7;              // weight init
};

// Twin encoder with a hashed bag-of-features embedding table:
//   u = mean(W[h(f)] for f in features(text)),  out = u / |u|
// Features are basic tokens (CJK characters, lowercased words) and, when
// enabled, adjacent token pairs. A text with no features encodes to zeros.
class HashingEncoder final : public TrainableEncoder {
public:
    explicit HashingEncoder(HashingEncoderConfig cfg = {});

    size_t dim() const override { return m_cfg.dim; }
    std::vector<float> encode(const std::string& text) const override;

    std::unique_ptr<EncoderTape> forward(const std::vector<std::string>& texts, Matrix& out) const override;
    void backward_and_update(const EncoderTape& tape, const Matrix& grad_out, float learning_rate) override;

    const HashingEncoderConfig& config() const { return m_cfg; }

    // feature bucket ids for a text, in token order
    std::vector<uint32_t> features(const std::string& text) const;

    // weights I/O (binary)
    bool save(const std::string& path) const;
    bool load(const std::string& path);

private:
    HashingEncoderConfig m_cfg;
    std::vector<float> m_weights;  // packed: num_buckets * dim

    std::vector<float> pooled(const std::vector<uint32_t>& feats, float& norm) const;
};

}  // namespace labelsearch
