#include "train/ContrastiveTrainer.hpp"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

namespace labelsearch {

static size_t check_shape(const Matrix& q, const Matrix& p) {
    if (q.size() != p.size()) {
        throw std::invalid_argument("in_batch_loss: query/positive row counts differ");
    }
    if (q.empty()) return 0;

    const size_t d = q[0].size();
    for (size_t i = 0; i < q.size(); ++i) {
        if (q[i].size() != d || p[i].size() != d) {
            throw std::invalid_argument("in_batch_loss: rows of differing dim");
        }
    }
    return d;
}

// softmax cross-entropy over row `i` of z (or column `i` when by_column),
// target index i. Writes the probabilities into probs and returns the loss.
static double softmax_xent(const std::vector<std::vector<double>>& z, size_t i, bool by_column, std::vector<double>& probs) {
    const size_t n = z.size();
    auto at = [&](size_t j) { return by_column ? z[j][i] : z[i][j]; };

    double mx = at(0);
    for (size_t j = 1; j < n; ++j) mx = std::max(mx, at(j));

    double sum = 0.0;
    for (size_t j = 0; j < n; ++j) sum += std::exp(at(j) - mx);
    const double lse = mx + std::log(sum);

    probs.resize(n);
    for (size_t j = 0; j < n; ++j) probs[j] = std::exp(at(j) - lse);
    return lse - at(i);
}

LossResult in_batch_loss(const Matrix& q, const Matrix& p, const LossConfig& cfg, bool with_grad) {
    const size_t d = check_shape(q, p);
    const size_t n = q.size();

    LossResult r;
    if (n == 0) return r;

    // logits
    std::vector<std::vector<double>> z(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            double s = 0.0;
            for (size_t k = 0; k < d; ++k) s += (double)q[i][k] * (double)p[j][k];
            if (i == j) s -= cfg.margin;
            z[i][j] = cfg.scale * s;
        }
    }

    // dLoss/dZ
    std::vector<std::vector<double>> gz(n, std::vector<double>(n, 0.0));
    const double row_w = cfg.symmetric ? 0.5 : 1.0;
    std::vector<double> probs;
    double loss = 0.0;

    for (size_t i = 0; i < n; ++i) {
        loss += row_w * softmax_xent(z, i, false, probs) / (double)n;
        for (size_t j = 0; j < n; ++j) {
            gz[i][j] += row_w * (probs[j] - (i == j ? 1.0 : 0.0)) / (double)n;
        }
    }

    if (cfg.symmetric) {
        for (size_t j = 0; j < n; ++j) {
            loss += 0.5 * softmax_xent(z, j, true, probs) / (double)n;
            for (size_t i = 0; i < n; ++i) {
                gz[i][j] += 0.5 * (probs[i] - (i == j ? 1.0 : 0.0)) / (double)n;
            }
        }
    }

    r.loss = (float)loss;
    if (!with_grad) return r;

    // through Z = scale * S and S = Q * P^T
    r.grad_q.assign(n, std::vector<float>(d, 0.0f));
    r.grad_p.assign(n, std::vector<float>(d, 0.0f));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            const double gs = cfg.scale * gz[i][j];
            if (gs == 0.0) continue;
            for (size_t k = 0; k < d; ++k) {
                r.grad_q[i][k] += (float)(gs * p[j][k]);
                r.grad_p[j][k] += (float)(gs * q[i][k]);
            }
        }
    }
    return r;
}

static bool all_finite(const Matrix& m) {
    for (const auto& row : m) {
        for (float x : row) {
            if (!std::isfinite(x)) return false;
        }
    }
    return true;
}

ContrastiveTrainer::ContrastiveTrainer(TrainableEncoder& encoder, TrainConfig cfg)
    : m_encoder(encoder), m_cfg(std::move(cfg)) {
    if (m_cfg.batch_size < 2) {
        throw std::invalid_argument("ContrastiveTrainer: batch_size must be at least 2");
    }
}

static std::vector<std::string> batch_texts(const std::vector<TrainPair>& batch) {
    std::vector<std::string> texts;
    texts.reserve(batch.size() * 2);
    for (const auto& pr : batch) texts.push_back(pr.query_text);
    for (const auto& pr : batch) texts.push_back(pr.positive_text);
    return texts;
}

static void split_rows(const Matrix& out, size_t n, size_t dim, Matrix& q, Matrix& p) {
    if (out.size() != 2 * n) {
        throw std::invalid_argument("ContrastiveTrainer: encoder returned wrong number of rows");
    }
    for (const auto& row : out) {
        if (row.size() != dim) {
            throw std::invalid_argument("ContrastiveTrainer: encoder output dim mismatch");
        }
    }
    q.assign(out.begin(), out.begin() + (std::ptrdiff_t)n);
    p.assign(out.begin() + (std::ptrdiff_t)n, out.end());
}

StepResult ContrastiveTrainer::train_step(const std::vector<TrainPair>& batch, float margin) {
    StepResult res;
    if (batch.size() < 2) {
        res.status = StepStatus::Skipped;
        return res;
    }

    const size_t n = batch.size();
    Matrix out;
    auto tape = m_encoder.forward(batch_texts(batch), out);

    Matrix q, p;
    split_rows(out, n, m_encoder.dim(), q, p);

    LossConfig lcfg = m_cfg.loss;
    lcfg.margin = margin;
    LossResult lr = in_batch_loss(q, p, lcfg);

    res.loss = lr.loss;
    if (!std::isfinite(lr.loss) || !all_finite(lr.grad_q) || !all_finite(lr.grad_p)) {
        ++m_nonfinite;
        std::cerr << "ContrastiveTrainer: non-finite loss in batch of " << n << ", step skipped\n";
        res.status = StepStatus::NonFinite;
        return res;
    }

    Matrix grad_out;
    grad_out.reserve(2 * n);
    for (auto& g : lr.grad_q) grad_out.push_back(std::move(g));
    for (auto& g : lr.grad_p) grad_out.push_back(std::move(g));

    m_encoder.backward_and_update(*tape, grad_out, m_cfg.learning_rate);
    res.status = StepStatus::Ok;
    return res;
}

float ContrastiveTrainer::evaluate_loss(const std::vector<TrainPair>& batch) const {
    if (batch.size() < 2) return 0.0f;

    const size_t n = batch.size();
    Matrix out = m_encoder.encode_batch(batch_texts(batch));

    Matrix q, p;
    split_rows(out, n, m_encoder.dim(), q, p);
    return in_batch_loss(q, p, m_cfg.loss, false).loss;
}

TrainReport ContrastiveTrainer::fit(const std::vector<TrainPair>& pairs, const std::atomic<bool>* cancel) {
    TrainReport rep;
    const size_t nonfinite_before = m_nonfinite;

    std::vector<size_t> order(pairs.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937_64 rng(m_cfg.seed);

    for (size_t epoch = 0; epoch < m_cfg.epochs && !rep.cancelled; ++epoch) {
        std::shuffle(order.begin(), order.end(), rng);

        double loss_sum = 0.0;
        size_t ok_steps = 0;

        for (size_t start = 0; start < order.size(); start += m_cfg.batch_size) {
            if (cancel && cancel->load()) {
                rep.cancelled = true;
                break;
            }

            const size_t end = std::min(order.size(), start + m_cfg.batch_size);
            std::vector<TrainPair> batch;
            batch.reserve(end - start);
            for (size_t i = start; i < end; ++i) batch.push_back(pairs[order[i]]);

            StepResult sr = train_step(batch);
            switch (sr.status) {
                case StepStatus::Ok:
                    ++rep.steps;
                    ++ok_steps;
                    loss_sum += sr.loss;
                    break;
                case StepStatus::Skipped:
                    ++rep.skipped_small;
                    break;
                case StepStatus::NonFinite:
                    ++rep.skipped_nonfinite;
                    break;
            }
        }

        const float mean = ok_steps ? (float)(loss_sum / (double)ok_steps) : 0.0f;
        rep.epoch_loss.push_back(mean);
        std::cout << "epoch " << (epoch + 1) << "/" << m_cfg.epochs
                  << " steps=" << ok_steps << " loss=" << mean << "\n";
    }

    if (m_nonfinite - nonfinite_before > m_cfg.max_nonfinite_steps) {
        rep.degraded = true;
        std::cerr << "ContrastiveTrainer: " << (m_nonfinite - nonfinite_before)
                  << " steps skipped on non-finite loss, training degraded\n";
    }
    return rep;
}

}  // namespace labelsearch
