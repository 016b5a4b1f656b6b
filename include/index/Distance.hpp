#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace labelsearch {

enum class Metric {
    Cosine,  // 1 - cos(a, b); vectors are normalized on insert
    L2,      // squared euclidean
    Dot      // -a.b
};

Metric parse_metric(const std::string& name);  // "cosine" | "l2" | "dot"
const char* metric_name(Metric m);

float distance(Metric m, const float* a, const float* b, size_t dim);

// Higher-is-better score reported to the classifier:
// cosine -> cos, dot -> a.b, l2 -> 1 / (1 + d).
float score_from_distance(Metric m, float d);

// In-place L2 normalization; zero vectors are left as is.
void normalize(std::vector<float>& v);

struct SearchHit {
    size_t id = 0;
    float distance = 0.0f;
};

// Exhaustive top-k over packed vectors (n * dim), ascending distance, ties by id.
std::vector<SearchHit> exact_topk(const std::vector<float>& packed, size_t dim, Metric m,
                                  const float* query, size_t k);

}  // namespace labelsearch
