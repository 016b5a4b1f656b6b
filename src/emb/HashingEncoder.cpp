#include "emb/HashingEncoder.hpp"
#include "emb/BasicTokenizer.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>
#include <unordered_map>

namespace labelsearch {

namespace {

struct HashingTape final : EncoderTape {
    std::vector<std::vector<uint32_t>> features;
    Matrix outputs;
    std::vector<float> norms;
};

constexpr char kMagic[4] = {'L', 'S', 'H', 'E'};
constexpr uint32_t kVersion = 1;

// FNV-1a, stable across platforms and runs
uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

}  // namespace

HashingEncoder::HashingEncoder(HashingEncoderConfig cfg) : m_cfg(cfg) {
    if (m_cfg.dim == 0 || m_cfg.num_buckets == 0) {
        throw std::invalid_argument("HashingEncoder: dim and num_buckets must be positive");
    }

    m_weights.resize(m_cfg.num_buckets * m_cfg.dim);
    std::mt19937_64 rng(m_cfg.seed);
    std::normal_distribution<float> dist(0.0f, 1.0f / std::sqrt((float)m_cfg.dim));
    for (float& w : m_weights) w = dist(rng);
}

std::vector<uint32_t> HashingEncoder::features(const std::string& text) const {
    const auto toks = tokenize::basic_tokenize(text, /*drop_punct=*/true);

    std::vector<uint32_t> out;
    out.reserve(toks.size() * 2);

    for (size_t i = 0; i < toks.size(); ++i) {
        out.push_back((uint32_t)(fnv1a("u\x1f" + toks[i]) % m_cfg.num_buckets));
        if (m_cfg.use_bigrams && i + 1 < toks.size()) {
            out.push_back((uint32_t)(fnv1a("b\x1f" + toks[i] + "\x1f" + toks[i + 1]) % m_cfg.num_buckets));
        }
    }
    return out;
}

std::vector<float> HashingEncoder::pooled(const std::vector<uint32_t>& feats, float& norm) const {
    const size_t dim = m_cfg.dim;
    std::vector<float> v(dim, 0.0f);
    norm = 0.0f;
    if (feats.empty()) return v;

    for (uint32_t b : feats) {
        const float* row = &m_weights[(size_t)b * dim];
        for (size_t j = 0; j < dim; ++j) v[j] += row[j];
    }

    const float inv_n = 1.0f / (float)feats.size();
    double ss = 0.0;
    for (float& x : v) {
        x *= inv_n;
        ss += (double)x * (double)x;
    }

    norm = (float)std::sqrt(ss);
    if (norm > 0.0f) {
        const float inv = 1.0f / norm;
        for (float& x : v) x *= inv;
    }
    return v;
}

std::vector<float> HashingEncoder::encode(const std::string& text) const {
    float norm = 0.0f;
    return pooled(features(text), norm);
}

std::unique_ptr<EncoderTape> HashingEncoder::forward(const std::vector<std::string>& texts, Matrix& out) const {
    auto tape = std::make_unique<HashingTape>();
    tape->features.reserve(texts.size());
    tape->norms.reserve(texts.size());

    out.clear();
    out.reserve(texts.size());

    for (const auto& t : texts) {
        tape->features.push_back(features(t));
        float norm = 0.0f;
        out.push_back(pooled(tape->features.back(), norm));
        tape->norms.push_back(norm);
    }
    tape->outputs = out;
    return tape;
}

void HashingEncoder::backward_and_update(const EncoderTape& tape_base, const Matrix& grad_out, float learning_rate) {
    const auto* tape = dynamic_cast<const HashingTape*>(&tape_base);
    if (!tape) throw std::invalid_argument("HashingEncoder: tape from a different encoder");
    if (grad_out.size() != tape->outputs.size()) {
        throw std::invalid_argument("HashingEncoder: gradient rows do not match forward pass");
    }

    const size_t dim = m_cfg.dim;
    std::unordered_map<uint32_t, std::vector<float>> grads;

    for (size_t r = 0; r < grad_out.size(); ++r) {
        const auto& feats = tape->features[r];
        const float norm = tape->norms[r];
        if (feats.empty() || norm <= 0.0f) continue;
        if (grad_out[r].size() != dim) {
            throw std::invalid_argument("HashingEncoder: gradient row has wrong dim");
        }

        // back through out = u / |u|
        const auto& y = tape->outputs[r];
        const auto& g = grad_out[r];
        double yg = 0.0;
        for (size_t j = 0; j < dim; ++j) yg += (double)y[j] * (double)g[j];

        // and through u = mean(W[b])
        const float scale = 1.0f / (norm * (float)feats.size());
        for (uint32_t b : feats) {
            auto& acc = grads[b];
            if (acc.empty()) acc.assign(dim, 0.0f);
            for (size_t j = 0; j < dim; ++j) {
                acc[j] += (g[j] - (float)yg * y[j]) * scale;
            }
        }
    }

    for (const auto& kv : grads) {
        float* row = &m_weights[(size_t)kv.first * dim];
        for (size_t j = 0; j < dim; ++j) row[j] -= learning_rate * kv.second[j];
    }
}

bool HashingEncoder::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    uint32_t version = kVersion;
    uint64_t dim = m_cfg.dim;
    uint64_t buckets = m_cfg.num_buckets;
    uint8_t bigrams = m_cfg.use_bigrams ? 1 : 0;
    uint64_t seed = m_cfg.seed;

    out.write(kMagic, sizeof(kMagic));
    out.write((char*)&version, sizeof(version));
    out.write((char*)&dim, sizeof(dim));
    out.write((char*)&buckets, sizeof(buckets));
    out.write((char*)&bigrams, sizeof(bigrams));
    out.write((char*)&seed, sizeof(seed));
    out.write((char*)m_weights.data(), (std::streamsize)(sizeof(float) * m_weights.size()));
    return (bool)out;
}

bool HashingEncoder::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    char magic[4] = {};
    uint32_t version = 0;
    uint64_t dim = 0, buckets = 0, seed = 0;
    uint8_t bigrams = 0;

    in.read(magic, sizeof(magic));
    in.read((char*)&version, sizeof(version));
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&buckets, sizeof(buckets));
    in.read((char*)&bigrams, sizeof(bigrams));
    in.read((char*)&seed, sizeof(seed));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0 || version != kVersion) return false;
    if (dim == 0 || buckets == 0) return false;

    std::vector<float> weights((size_t)(dim * buckets));
    in.read((char*)weights.data(), (std::streamsize)(sizeof(float) * weights.size()));
    if (!in) return false;

    m_cfg.dim = (size_t)dim;
    m_cfg.num_buckets = (size_t)buckets;
    m_cfg.use_bigrams = bigrams != 0;
    m_cfg.seed = seed;
    m_weights = std::move(weights);
    return true;
}

}  // namespace labelsearch
