#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace labelsearch {

using Matrix = std::vector<std::vector<float>>;  // row-major, one row per text

// Text -> fixed-length vector. Implementations must be deterministic for
// fixed weights and safe to call concurrently through a const reference.
class Encoder {
public:
    virtual ~Encoder() = default;

    virtual size_t dim() const = 0;
    virtual std::vector<float> encode(const std::string& text) const = 0;

    virtual Matrix encode_batch(const std::vector<std::string>& texts) const {
        Matrix out;
        out.reserve(texts.size());
        for (const auto& t : texts) out.push_back(encode(t));
        return out;
    }
};

// Whatever a forward pass has to remember for its backward pass.
class EncoderTape {
public:
    virtual ~EncoderTape() = default;
};

class TrainableEncoder : public Encoder {
public:
    // Encodes `texts` into `out` and records the pass on the returned tape.
    virtual std::unique_ptr<EncoderTape> forward(const std::vector<std::string>& texts, Matrix& out) const = 0;

    // grad_out[i] is dLoss/d(out[i]) for the pass recorded on `tape`.
    // Applies one SGD update to the encoder weights.
    virtual void backward_and_update(const EncoderTape& tape, const Matrix& grad_out, float learning_rate) = 0;
};

}  // namespace labelsearch
