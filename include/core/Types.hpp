#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace labelsearch {

// Root-to-leaf label levels, e.g. {"体育", "篮球"}. Never empty once parsed.
using LabelPath = std::vector<std::string>;

struct Example {
    std::string text;
    LabelPath label_path;
};

struct TrainPair {
    std::string query_text;
    std::string positive_text;
};

struct Embedding {
    std::string owner_id;
    std::vector<float> vector;

    size_t dim() const { return vector.size(); }
};

struct CorpusEntry {
    Embedding embedding;
    LabelPath label_path;
    std::string text;  // source text, kept for recall dumps
};

struct Neighbor {
    size_t entry_id = 0;
    LabelPath label_path;
    float score = 0.0f;     // higher is better, whatever the metric
    float distance = 0.0f;  // metric distance, lower is better
};

struct QueryResult {
    std::string query_id;
    std::vector<Neighbor> neighbors;  // rank order, best first
    bool timed_out = false;
};

struct Prediction {
    std::string query_id;
    bool classified = false;
    LabelPath label_path;     // empty when !classified
    double confidence = 0.0;  // winning group weight
    double vote_share = 0.0;  // winning weight / total weight

    static Prediction unclassified(std::string query_id) {
        Prediction p;
        p.query_id = std::move(query_id);
        return p;
    }
};

}  // namespace labelsearch
