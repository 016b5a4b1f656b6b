// =============================================================================
// In-batch negative loss and the contrastive trainer
// =============================================================================

#include <gtest/gtest.h>
#include "emb/HashingEncoder.hpp"
#include "train/ContrastiveTrainer.hpp"

#include <atomic>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

using namespace labelsearch;

namespace {

Matrix identity(size_t n) {
    Matrix m(n, std::vector<float>(n, 0.0f));
    for (size_t i = 0; i < n; ++i) m[i][i] = 1.0f;
    return m;
}

// Emits fixed rows regardless of input; counts updates.
class FixedEncoder final : public TrainableEncoder {
public:
    FixedEncoder(size_t dim, float fill, size_t out_dim) : m_dim(dim), m_fill(fill), m_out_dim(out_dim) {}

    size_t dim() const override { return m_dim; }
    std::vector<float> encode(const std::string&) const override { return std::vector<float>(m_out_dim, m_fill); }

    std::unique_ptr<EncoderTape> forward(const std::vector<std::string>& texts, Matrix& out) const override {
        out.assign(texts.size(), std::vector<float>(m_out_dim, m_fill));
        return std::make_unique<EncoderTape>();
    }

    void backward_and_update(const EncoderTape&, const Matrix&, float) override { ++updates; }

    size_t updates = 0;

private:
    size_t m_dim;
    float m_fill;
    size_t m_out_dim;
};

std::vector<TrainPair> four_pairs() {
    return {
        {"lakers win the final game", "basketball"},
        {"new school term starts monday", "education"},
        {"stock market falls sharply", "finance"},
        {"heavy rain expected tomorrow", "weather"},
    };
}

}  // namespace

class InBatchLossTest : public ::testing::Test {
protected:
    LossConfig cfg;
};

TEST_F(InBatchLossTest, AlignedPairsNearMinimum) {
    Matrix q = identity(4);
    Matrix p = identity(4);
    LossResult r = in_batch_loss(q, p, cfg);
    // logits: 20 * (1 - 0.2) on the diagonal, 0 elsewhere
    EXPECT_NEAR(r.loss, std::log(1.0 + 3.0 * std::exp(-16.0)), 1e-6);
}

TEST_F(InBatchLossTest, PermutedPositivesRaiseLoss) {
    Matrix q = identity(4);
    Matrix p = {q[1], q[2], q[3], q[0]};
    const float aligned = in_batch_loss(q, identity(4), cfg).loss;
    const float permuted = in_batch_loss(q, p, cfg).loss;
    EXPECT_GT(permuted, aligned);
    EXPECT_GT(permuted, 10.0f);
}

TEST_F(InBatchLossTest, LargerMarginStrictlyLarger) {
    Matrix q = identity(3);
    LossConfig lo = cfg, hi = cfg;
    lo.margin = 0.1f;
    hi.margin = 0.4f;
    EXPECT_LT(in_batch_loss(q, q, lo).loss, in_batch_loss(q, q, hi).loss);
}

TEST_F(InBatchLossTest, SymmetricMatchesRowLossOnSymmetricScores) {
    Matrix q = {{0.6f, 0.8f}, {1.0f, 0.0f}, {0.0f, 1.0f}};
    LossConfig sym = cfg;
    sym.symmetric = true;
    EXPECT_NEAR(in_batch_loss(q, q, cfg).loss, in_batch_loss(q, q, sym).loss, 1e-5);
}

TEST_F(InBatchLossTest, GradientMatchesFiniteDifference) {
    std::mt19937 rng(3);
    std::normal_distribution<float> nd(0.0f, 0.5f);
    Matrix q(3, std::vector<float>(2)), p(3, std::vector<float>(2));
    for (auto& row : q) for (float& x : row) x = nd(rng);
    for (auto& row : p) for (float& x : row) x = nd(rng);

    LossConfig c = cfg;
    c.scale = 1.0f;
    c.symmetric = true;
    LossResult r = in_batch_loss(q, p, c);

    const float eps = 1e-3f;
    for (size_t i = 0; i < q.size(); ++i) {
        for (size_t k = 0; k < q[i].size(); ++k) {
            Matrix qp = q, qm = q;
            qp[i][k] += eps;
            qm[i][k] -= eps;
            const double fd = ((double)in_batch_loss(qp, p, c, false).loss -
                               (double)in_batch_loss(qm, p, c, false).loss) / (2.0 * eps);
            EXPECT_NEAR(r.grad_q[i][k], fd, 1e-3);

            Matrix pp = p, pm = p;
            pp[i][k] += eps;
            pm[i][k] -= eps;
            const double fdp = ((double)in_batch_loss(q, pp, c, false).loss -
                                (double)in_batch_loss(q, pm, c, false).loss) / (2.0 * eps);
            EXPECT_NEAR(r.grad_p[i][k], fdp, 1e-3);
        }
    }
}

TEST_F(InBatchLossTest, ShapeMismatchThrows) {
    EXPECT_THROW(in_batch_loss(identity(2), identity(3), cfg), std::invalid_argument);
    Matrix ragged = {{1.0f, 0.0f}, {1.0f}};
    EXPECT_THROW(in_batch_loss(ragged, identity(2), cfg), std::invalid_argument);
}

class ContrastiveTrainerTest : public ::testing::Test {
protected:
    void SetUp() override {
        enc_cfg.dim = 32;
        enc_cfg.num_buckets = 4096;
        train_cfg.batch_size = 4;
        train_cfg.learning_rate = 0.02f;
    }

    HashingEncoderConfig enc_cfg;
    TrainConfig train_cfg;
};

TEST_F(ContrastiveTrainerTest, OneStepLowersLossOnSameBatch) {
    HashingEncoder enc(enc_cfg);
    ContrastiveTrainer trainer(enc, train_cfg);
    const auto batch = four_pairs();

    const float before = trainer.evaluate_loss(batch);
    StepResult sr = trainer.train_step(batch);
    ASSERT_EQ(sr.status, StepStatus::Ok);
    EXPECT_NEAR(sr.loss, before, 1e-5);

    const float after = trainer.evaluate_loss(batch);
    EXPECT_LT(after, before);
}

TEST_F(ContrastiveTrainerTest, SinglePairIsSkipped) {
    HashingEncoder enc(enc_cfg);
    ContrastiveTrainer trainer(enc, train_cfg);
    const auto v0 = enc.encode("lakers win the final game");

    std::vector<TrainPair> one = {four_pairs()[0]};
    EXPECT_EQ(trainer.train_step(one).status, StepStatus::Skipped);
    EXPECT_EQ(trainer.train_step({}).status, StepStatus::Skipped);
    EXPECT_EQ(enc.encode("lakers win the final game"), v0);
}

TEST_F(ContrastiveTrainerTest, BatchSizeBelowTwoRejected) {
    HashingEncoder enc(enc_cfg);
    train_cfg.batch_size = 1;
    EXPECT_THROW(ContrastiveTrainer trainer(enc, train_cfg), std::invalid_argument);
}

TEST_F(ContrastiveTrainerTest, EncoderShapeMismatchIsFatal) {
    FixedEncoder enc(4, 0.5f, 3);  // claims dim 4, emits 3
    ContrastiveTrainer trainer(enc, train_cfg);
    EXPECT_THROW(trainer.train_step(four_pairs()), std::invalid_argument);
    EXPECT_EQ(enc.updates, 0u);
}

TEST_F(ContrastiveTrainerTest, NonFiniteStepSkippedAndDegrades) {
    FixedEncoder enc(4, std::numeric_limits<float>::quiet_NaN(), 4);
    train_cfg.max_nonfinite_steps = 0;
    train_cfg.epochs = 1;
    ContrastiveTrainer trainer(enc, train_cfg);

    EXPECT_EQ(trainer.train_step(four_pairs()).status, StepStatus::NonFinite);
    EXPECT_EQ(enc.updates, 0u);

    TrainReport rep = trainer.fit(four_pairs());
    EXPECT_EQ(rep.skipped_nonfinite, 1u);
    EXPECT_EQ(rep.steps, 0u);
    EXPECT_TRUE(rep.degraded);
}

TEST_F(ContrastiveTrainerTest, FitReducesLoss) {
    HashingEncoder enc(enc_cfg);
    train_cfg.epochs = 10;
    train_cfg.learning_rate = 0.05f;
    ContrastiveTrainer trainer(enc, train_cfg);

    const auto pairs = four_pairs();
    const float before = trainer.evaluate_loss(pairs);
    TrainReport rep = trainer.fit(pairs);

    EXPECT_EQ(rep.steps, 10u);
    EXPECT_EQ(rep.epoch_loss.size(), 10u);
    EXPECT_FALSE(rep.cancelled);
    EXPECT_FALSE(rep.degraded);
    EXPECT_LT(trainer.evaluate_loss(pairs), before);
}

TEST_F(ContrastiveTrainerTest, TrailingSingletonBatchCounted) {
    HashingEncoder enc(enc_cfg);
    train_cfg.epochs = 1;
    ContrastiveTrainer trainer(enc, train_cfg);

    auto pairs = four_pairs();
    pairs.push_back({"a fifth query", "misc"});
    TrainReport rep = trainer.fit(pairs);
    EXPECT_EQ(rep.steps, 1u);
    EXPECT_EQ(rep.skipped_small, 1u);
}

TEST_F(ContrastiveTrainerTest, CancelStopsBeforeFirstStep) {
    HashingEncoder enc(enc_cfg);
    ContrastiveTrainer trainer(enc, train_cfg);
    const auto v0 = enc.encode("heavy rain expected tomorrow");

    std::atomic<bool> cancel{true};
    TrainReport rep = trainer.fit(four_pairs(), &cancel);
    EXPECT_TRUE(rep.cancelled);
    EXPECT_EQ(rep.steps, 0u);
    EXPECT_EQ(enc.encode("heavy rain expected tomorrow"), v0);
}
