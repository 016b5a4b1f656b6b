#include "eval/Evaluator.hpp"
#include "core/LabelPath.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace labelsearch {

double accuracy_at_depth(const std::vector<EvalRecord>& records, size_t depth) {
    if (records.empty()) return 0.0;

    size_t ok = 0;
    for (const auto& r : records) {
        if (r.prediction.classified && labels::equal_at_depth(r.prediction.label_path, r.gold, depth)) ++ok;
    }
    return (double)ok / (double)records.size();
}

EvalReport evaluate(const std::vector<Example>& golden, const Encoder& encoder, const RecallEngine& engine,
                    const ClassifierConfig& classifier, const EvalConfig& cfg) {
    EvalReport rep;
    rep.total = golden.size();
    rep.records.resize(golden.size());
    if (golden.empty()) return rep;

    // encoding first, in batches, on the calling thread
    Matrix queries;
    queries.reserve(golden.size());
    const size_t batch = std::max<size_t>(cfg.encode_batch, 1);
    for (size_t start = 0; start < golden.size(); start += batch) {
        const size_t end = std::min(golden.size(), start + batch);
        std::vector<std::string> texts;
        for (size_t i = start; i < end; ++i) texts.push_back(golden[i].text);
        Matrix vecs = encoder.encode_batch(texts);
        for (auto& v : vecs) queries.push_back(std::move(v));
    }
    if (queries.size() != golden.size()) {
        throw std::invalid_argument("evaluate: encoder returned " + std::to_string(queries.size()) +
                                    " vectors for " + std::to_string(golden.size()) + " texts");
    }

    RecallConfig rcfg = engine.config();
    rcfg.k = cfg.recall_k;

    // one snapshot for every worker
    const auto idx = engine.snapshot();

    auto run_one = [&](size_t i) {
        EvalRecord& rec = rep.records[i];
        rec.text = golden[i].text;
        rec.gold = golden[i].label_path;

        QueryResult qr;
        qr.query_id = std::to_string(i);
        if (idx) qr = RecallEngine::recall_on(*idx, queries[i], rcfg, qr.query_id);

        rec.timed_out = qr.timed_out;
        for (const auto& n : qr.neighbors) {
            if (n.label_path == rec.gold) { rec.hit_at_k = true; break; }
        }
        rec.prediction = classify(qr, classifier);
    };

    const size_t workers = std::max<size_t>(1, std::min(cfg.num_threads, golden.size()));
    if (workers == 1) {
        for (size_t i = 0; i < golden.size(); ++i) run_one(i);
    } else {
        std::atomic<size_t> next{0};
        std::exception_ptr first_error;
        std::mutex err_mu;

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                try {
                    for (size_t i = next++; i < golden.size(); i = next++) run_one(i);
                } catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(err_mu);
                    if (!first_error) first_error = std::current_exception();
                    next = golden.size();
                }
            });
        }
        for (auto& t : pool) t.join();
        if (first_error) std::rethrow_exception(first_error);
    }

    size_t max_depth = 0;
    for (const auto& r : rep.records) {
        max_depth = std::max(max_depth, r.gold.size());
        if (r.hit_at_k) ++rep.hits_at_k;
        if (!r.prediction.classified) ++rep.unclassified;
        else if (r.prediction.label_path == r.gold) ++rep.correct;
        if (r.timed_out) ++rep.timed_out;
    }

    rep.recall_at_k = (double)rep.hits_at_k / (double)rep.total;
    rep.accuracy = (double)rep.correct / (double)rep.total;
    for (size_t d = 1; d <= max_depth; ++d) {
        rep.accuracy_by_depth.push_back(accuracy_at_depth(rep.records, d));
    }
    return rep;
}

}  // namespace labelsearch
