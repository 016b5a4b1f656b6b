#pragma once
#include "classify/VotingClassifier.hpp"
#include "core/Types.hpp"
#include "emb/Encoder.hpp"
#include "recall/RecallEngine.hpp"

#include <vector>

namespace labelsearch {

struct EvalConfig {
    size_t recall_k = 10;     // neighbors fetched per query, for recall@K and voting
    size_t num_threads = 1;   // query workers over the immutable index
    size_t encode_batch = 64;
};

struct EvalRecord {
    std::string text;
    LabelPath gold;
    Prediction prediction;
    bool hit_at_k = false;  // some top-K neighbor carries the full gold path
    bool timed_out = false;
};

struct EvalReport {
    size_t total = 0;
    size_t hits_at_k = 0;
    size_t correct = 0;
    size_t unclassified = 0;
    size_t timed_out = 0;

    double recall_at_k = 0.0;
    double accuracy = 0.0;                   // full label path
    std::vector<double> accuracy_by_depth;   // [d-1] compares the first d levels

    std::vector<EvalRecord> records;         // one per golden example, input order
};

// recall@K measures the index; accuracy measures retrieval + voting. Both
// read the same index snapshot for the whole run.
EvalReport evaluate(const std::vector<Example>& golden, const Encoder& encoder, const RecallEngine& engine,
                    const ClassifierConfig& classifier, const EvalConfig& cfg);

// Accuracy of already computed records at `depth` (0 = full path).
double accuracy_at_depth(const std::vector<EvalRecord>& records, size_t depth);

}  // namespace labelsearch
