#pragma once
#include "emb/Encoder.hpp"
#include "emb/WordPieceTokenizer.hpp"

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace labelsearch {

// BERT-style sentence encoder exported to ONNX (input_ids, attention_mask,
// token_type_ids -> [batch, seq, hidden]). Mean-pooled over the mask and
// L2-normalized. Inference only.
class OnnxEncoder final : public Encoder {
public:
    bool init(const std::string& model_path, const std::string& vocab_path, size_t max_len = 128);

    size_t dim() const override { return m_dim; }
    std::vector<float> encode(const std::string& text) const override;

    // one padded session run per call
    Matrix encode_batch(const std::vector<std::string>& texts) const override;

private:
    WordPieceTokenizer m_tok;
    size_t m_max_len = 128;
    size_t m_dim = 0;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "label-search"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    std::string m_out_name;
    size_t m_num_inputs = 3;
};

}  // namespace labelsearch
