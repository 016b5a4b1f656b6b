#include "classify/VotingClassifier.hpp"
#include "core/LabelPath.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace labelsearch {

Strategy parse_strategy(const std::string& s) {
    if (s == "best_match") return Strategy::BestMatch;
    if (s == "vote") return Strategy::Vote;
    throw std::invalid_argument("unknown strategy: " + s);
}

Weighting parse_weighting(const std::string& s) {
    if (s == "count") return Weighting::Count;
    if (s == "score") return Weighting::Score;
    if (s == "inverse_rank") return Weighting::InverseRank;
    throw std::invalid_argument("unknown weighting: " + s);
}

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::BestMatch: return "best_match";
        case Strategy::Vote: return "vote";
        default: return "unknown";
    }
}

const char* weighting_name(Weighting w) {
    switch (w) {
        case Weighting::Count: return "count";
        case Weighting::Score: return "score";
        case Weighting::InverseRank: return "inverse_rank";
        default: return "unknown";
    }
}

namespace {

struct Group {
    LabelPath key;
    double weight = 0.0;
    float best_score = 0.0f;
    size_t first_rank = 0;
};

double vote_weight(Weighting w, const Neighbor& n, size_t rank) {
    switch (w) {
        case Weighting::Count: return 1.0;
        case Weighting::InverseRank: return 1.0 / (double)(rank + 1);
        case Weighting::Score:
        default: return (double)n.score;
    }
}

bool same_weight(double a, double b) {
    return std::fabs(a - b) <= 1e-9 * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

// true when a should win over b
bool beats(const Group& a, const Group& b) {
    if (!same_weight(a.weight, b.weight)) return a.weight > b.weight;
    if (a.best_score != b.best_score) return a.best_score > b.best_score;
    if (a.key.size() != b.key.size()) return a.key.size() > b.key.size();
    return a.first_rank < b.first_rank;
}

Prediction finish(const std::string& query_id, LabelPath label, double weight, double total,
                  const ClassifierConfig& cfg) {
    Prediction p;
    p.query_id = query_id;
    p.confidence = weight;
    p.vote_share = total != 0.0 ? weight / total : 0.0;

    if (cfg.min_confidence && weight < *cfg.min_confidence) {
        p.classified = false;
        return p;
    }
    p.classified = true;
    p.label_path = std::move(label);
    return p;
}

}  // namespace

Prediction classify(const std::vector<Neighbor>& neighbors, const ClassifierConfig& cfg,
                    const std::string& query_id) {
    if (neighbors.empty()) return Prediction::unclassified(query_id);

    if (cfg.strategy == Strategy::BestMatch) {
        const Neighbor& top = neighbors.front();
        return finish(query_id, labels::truncate(top.label_path, cfg.comparison_depth),
                      (double)top.score, (double)top.score, cfg);
    }

    std::vector<Group> groups;
    std::map<LabelPath, size_t> by_key;
    double total = 0.0;

    for (size_t rank = 0; rank < neighbors.size(); ++rank) {
        const Neighbor& n = neighbors[rank];
        LabelPath key = labels::truncate(n.label_path, cfg.comparison_depth);

        auto it = by_key.find(key);
        if (it == by_key.end()) {
            Group g;
            g.key = key;
            g.best_score = n.score;
            g.first_rank = rank;
            it = by_key.emplace(std::move(key), groups.size()).first;
            groups.push_back(std::move(g));
        }

        Group& g = groups[it->second];
        const double w = vote_weight(cfg.weighting, n, rank);
        g.weight += w;
        g.best_score = std::max(g.best_score, n.score);
        total += w;
    }

    const Group* best = &groups.front();
    for (const auto& g : groups) {
        if (beats(g, *best)) best = &g;
    }

    return finish(query_id, best->key, best->weight, total, cfg);
}

}  // namespace labelsearch
