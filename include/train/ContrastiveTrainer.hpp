#pragma once
#include "core/Types.hpp"
#include "emb/Encoder.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace labelsearch {

struct LossConfig {
    float margin = 0.2f;     // subtracted from every positive (diagonal) similarity
    float scale = 20.0f;     // logits = scale * (S - margin * I)
    bool symmetric = false;  // also average in the column-wise loss
};

struct TrainConfig {
    LossConfig loss;
    float learning_rate = 0.5f;
    size_t batch_size = 32;
    size_t epochs = 3;
    uint64_t seed = 13;            // batch shuffling
    size_t max_nonfinite_steps = 3;  // beyond this the run is reported degraded
};

struct LossResult {
    float loss = 0.0f;
    Matrix grad_q;  // dLoss/dQ
    Matrix grad_p;  // dLoss/dP
};

// In-batch negative loss on Q (N x d) and P (N x d); row i of P is the
// positive for row i of Q and every other row is a negative. S = Q * P^T.
// Throws std::invalid_argument on mismatched shapes.
LossResult in_batch_loss(const Matrix& q, const Matrix& p, const LossConfig& cfg, bool with_grad = true);

enum class StepStatus {
    Ok,
    Skipped,     // fewer than two pairs: no negatives
    NonFinite    // NaN/Inf loss or gradient: weights untouched
};

struct StepResult {
    StepStatus status = StepStatus::Skipped;
    float loss = 0.0f;
};

struct TrainReport {
    size_t steps = 0;
    size_t skipped_small = 0;
    size_t skipped_nonfinite = 0;
    std::vector<float> epoch_loss;  // mean loss of the Ok steps of each epoch
    bool cancelled = false;
    bool degraded = false;
};

// Owns the only mutable path to the encoder weights during training.
class ContrastiveTrainer {
public:
    ContrastiveTrainer(TrainableEncoder& encoder, TrainConfig cfg);

    // One mini-batch. `margin` overrides cfg.loss.margin for this step.
    StepResult train_step(const std::vector<TrainPair>& batch, float margin);
    StepResult train_step(const std::vector<TrainPair>& batch) { return train_step(batch, m_cfg.loss.margin); }

    // Loss of a batch at the current weights, no update.
    float evaluate_loss(const std::vector<TrainPair>& batch) const;

    // Runs cfg.epochs epochs. `cancel` is polled between steps only.
    TrainReport fit(const std::vector<TrainPair>& pairs, const std::atomic<bool>* cancel = nullptr);

    const TrainConfig& config() const { return m_cfg; }

private:
    TrainableEncoder& m_encoder;
    TrainConfig m_cfg;
    size_t m_nonfinite = 0;
};

}  // namespace labelsearch
