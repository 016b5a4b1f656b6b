#include "index/Distance.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace labelsearch {

Metric parse_metric(const std::string& name) {
    if (name == "cosine") return Metric::Cosine;
    if (name == "l2") return Metric::L2;
    if (name == "dot") return Metric::Dot;
    throw std::invalid_argument("unknown distance metric: " + name);
}

const char* metric_name(Metric m) {
    switch (m) {
        case Metric::Cosine: return "cosine";
        case Metric::L2: return "l2";
        case Metric::Dot: return "dot";
        default: return "unknown";
    }
}

float distance(Metric m, const float* a, const float* b, size_t dim) {
    double s = 0.0;
    switch (m) {
        case Metric::L2:
            for (size_t i = 0; i < dim; ++i) {
                double d = (double)a[i] - (double)b[i];
                s += d * d;
            }
            return (float)s;
        case Metric::Cosine:
            for (size_t i = 0; i < dim; ++i) s += (double)a[i] * (double)b[i];
            return (float)(1.0 - s);
        case Metric::Dot:
        default:
            for (size_t i = 0; i < dim; ++i) s += (double)a[i] * (double)b[i];
            return (float)(-s);
    }
}

float score_from_distance(Metric m, float d) {
    switch (m) {
        case Metric::Cosine: return 1.0f - d;
        case Metric::L2: return 1.0f / (1.0f + d);
        case Metric::Dot:
        default: return -d;
    }
}

void normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<SearchHit> exact_topk(const std::vector<float>& packed, size_t dim, Metric m,
                                  const float* query, size_t k) {
    std::vector<SearchHit> hits;
    if (dim == 0) return hits;

    const size_t n = packed.size() / dim;
    hits.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        hits.push_back({i, distance(m, query, &packed[i * dim], dim)});
    }

    auto by_dist = [](const SearchHit& a, const SearchHit& b){
        return a.distance < b.distance || (a.distance == b.distance && a.id < b.id);
    };
    const size_t top = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + (std::ptrdiff_t)top, hits.end(), by_dist);

    hits.resize(top);
    return hits;
}

}  // namespace labelsearch
