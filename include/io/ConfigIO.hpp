#pragma once
#include "classify/VotingClassifier.hpp"
#include "emb/HashingEncoder.hpp"
#include "eval/Evaluator.hpp"
#include "index/HnswIndex.hpp"
#include "recall/RecallEngine.hpp"
#include "train/ContrastiveTrainer.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace labelsearch {

struct AppConfig {
    HashingEncoderConfig encoder;
    TrainConfig train;
    HnswConfig index;
    RecallConfig recall;
    ClassifierConfig classify;
    EvalConfig eval;
};

// Every section and field is optional and falls back to the struct default.
// A field of the wrong type throws std::runtime_error naming it.
AppConfig config_from_json(const nlohmann::json& j);

// Throws std::runtime_error on a missing or unparsable file.
AppConfig load_config(const std::string& path);

nlohmann::json config_to_json(const AppConfig& cfg);

}  // namespace labelsearch
