#pragma once
#include "core/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace labelsearch {

enum class Strategy {
    BestMatch,  // label of the top-ranked neighbor
    Vote        // weighted vote over label groups
};

enum class Weighting {
    Count,       // 1 per neighbor
    Score,       // neighbor score (similarity)
    InverseRank  // 1 / (rank + 1)
};

struct ClassifierConfig {
    Strategy strategy = Strategy::Vote;
    Weighting weighting = Weighting::Score;

    // Levels a label path is cut to before grouping; 0 = full path.
    size_t comparison_depth = 0;

    // Winning weight below this -> unclassified.
    std::optional<double> min_confidence;
};

Strategy parse_strategy(const std::string& s);    // "best_match" | "vote"
Weighting parse_weighting(const std::string& s);  // "count" | "score" | "inverse_rank"
const char* strategy_name(Strategy s);
const char* weighting_name(Weighting w);

// Deterministic: same neighbor list and config -> same Prediction.
//
// Vote ties (weights equal within 1e-9 relative) are broken by, in order:
// the group holding the highest-scoring neighbor, the longer label path,
// the group whose first neighbor ranks earliest.
Prediction classify(const std::vector<Neighbor>& neighbors, const ClassifierConfig& cfg,
                    const std::string& query_id = "");

inline Prediction classify(const QueryResult& qr, const ClassifierConfig& cfg) {
    return classify(qr.neighbors, cfg, qr.query_id);
}

}  // namespace labelsearch
