#include "emb/OnnxEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace labelsearch {

bool OnnxEncoder::init(const std::string& model_path, const std::string& vocab_path, size_t max_len) {
    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "OnnxEncoder: failed to load vocab: " << vocab_path << "\n";
        return false;
    }
    m_max_len = std::max<size_t>(max_len, 2);

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        auto name_alloc = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = name_alloc.get();

        // some exports drop token_type_ids
        m_num_inputs = std::min<size_t>(m_session->GetInputCount(), 3);
        if (m_num_inputs < 2) {
            std::cerr << "OnnxEncoder: model needs input_ids and attention_mask inputs\n";
            return false;
        }
        auto in0 = m_session->GetInputNameAllocated(0, allocator);
        auto in1 = m_session->GetInputNameAllocated(1, allocator);
        m_in_ids = in0.get();
        m_in_mask = in1.get();
        if (m_num_inputs == 3) {
            auto in2 = m_session->GetInputNameAllocated(2, allocator);
            m_in_type = in2.get();
        }

        // hidden size is often symbolic in the graph; measure it on a sample
        m_dim = 0;
        std::vector<float> sample = encode("sample");
        if (sample.empty()) {
            std::cerr << "OnnxEncoder: unexpected output shape from " << model_path << "\n";
            return false;
        }
        m_dim = sample.size();
        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "OnnxEncoder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        return false;
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<float> OnnxEncoder::encode(const std::string& text) const {
    Matrix m = encode_batch({text});
    if (m.empty()) return {};
    return std::move(m[0]);
}

Matrix OnnxEncoder::encode_batch(const std::vector<std::string>& texts) const {
    if (!m_session || texts.empty()) return {};

    std::vector<std::vector<int64_t>> tok_ids;
    tok_ids.reserve(texts.size());
    size_t seq_len = 0;
    for (const auto& t : texts) {
        tok_ids.push_back(m_tok.encode(t, m_max_len));
        seq_len = std::max(seq_len, tok_ids.back().size());
    }

    const size_t batch = texts.size();
    std::vector<int64_t> ids(batch * seq_len, 0);
    std::vector<int64_t> mask(batch * seq_len, 0);
    std::vector<int64_t> type_ids(batch * seq_len, 0);
    for (size_t b = 0; b < batch; ++b) {
        for (size_t t = 0; t < tok_ids[b].size(); ++t) {
            ids[b * seq_len + t] = tok_ids[b][t];
            mask[b * seq_len + t] = 1;
        }
    }

    std::vector<int64_t> shape{(int64_t)batch, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> in_vals;
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    if (m_num_inputs == 3) {
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }

    const char* in_names[3] = { m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, in_vals.data(), in_vals.size(), out_names, 1);

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [batch, seq_len, hidden]
    if (shp.size() != 3 || shp[0] != (int64_t)batch || shp[1] != (int64_t)seq_len) return {};

    const size_t hidden = (size_t)shp[2];
    if (m_dim != 0 && hidden != m_dim) return {};
    const float* data = out.GetTensorData<float>();

    Matrix result;
    result.reserve(batch);

    for (size_t b = 0; b < batch; ++b) {
        std::vector<float> pooled(hidden, 0.0f);
        double denom = 0.0;

        for (size_t t = 0; t < seq_len; ++t) {
            if (mask[b * seq_len + t] == 0) continue;
            denom += 1.0;
            const float* row = data + ((b * seq_len + t) * hidden);
            for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
        }

        if (denom > 0.0) {
            float inv = (float)(1.0 / denom);
            for (float& x : pooled) x *= inv;
        }

        l2_normalize(pooled);
        result.push_back(std::move(pooled));
    }
    return result;
}

}  // namespace labelsearch
