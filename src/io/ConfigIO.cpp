#include "io/ConfigIO.hpp"
#include "index/Distance.hpp"

#include <fstream>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace labelsearch {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static const json* section(const json& root, const char* key) {
    if (!root.contains(key)) return nullptr;
    const json& s = root.at(key);
    require_object(s, std::string("root.") + key);
    return &s;
}

template <typename T>
static void read_number(const json& j, const char* key, const std::string& where, T& out) {
    if (!j.contains(key)) return;
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + key + " must be a number");
    }
    if (std::is_unsigned<T>::value && (v.is_number_float() || v.get<double>() < 0)) {
        throw std::runtime_error(where + "." + key + " must be a non-negative integer");
    }
    out = v.get<T>();
}

static void read_bool(const json& j, const char* key, const std::string& where, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + key + " must be a boolean");
    }
    out = j.at(key).get<bool>();
}

static bool read_string(const json& j, const char* key, const std::string& where, std::string& out) {
    if (!j.contains(key)) return false;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + key + " must be a string");
    }
    out = j.at(key).get<std::string>();
    return true;
}

// enum parsers throw std::invalid_argument; report them against the field
template <typename Fn>
static void read_enum(const json& j, const char* key, const std::string& where, Fn assign) {
    std::string s;
    if (!read_string(j, key, where, s)) return;
    try {
        assign(s);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(where + "." + key + ": " + e.what());
    }
}

AppConfig config_from_json(const json& j) {
    require_object(j, "root");
    AppConfig cfg;

    if (const json* s = section(j, "encoder")) {
        const std::string w = "root.encoder";
        read_number(*s, "dim", w, cfg.encoder.dim);
        read_number(*s, "num_buckets", w, cfg.encoder.num_buckets);
        read_bool(*s, "use_bigrams", w, cfg.encoder.use_bigrams);
        read_number(*s, "seed", w, cfg.encoder.seed);
    }

    if (const json* s = section(j, "train")) {
        const std::string w = "root.train";
        read_number(*s, "margin", w, cfg.train.loss.margin);
        read_number(*s, "scale", w, cfg.train.loss.scale);
        read_bool(*s, "symmetric", w, cfg.train.loss.symmetric);
        read_number(*s, "learning_rate", w, cfg.train.learning_rate);
        read_number(*s, "batch_size", w, cfg.train.batch_size);
        read_number(*s, "epochs", w, cfg.train.epochs);
        read_number(*s, "seed", w, cfg.train.seed);
        read_number(*s, "max_nonfinite_steps", w, cfg.train.max_nonfinite_steps);
    }

    if (const json* s = section(j, "index")) {
        const std::string w = "root.index";
        read_number(*s, "M", w, cfg.index.M);
        read_number(*s, "ef_construction", w, cfg.index.ef_construction);
        read_enum(*s, "metric", w, [&](const std::string& v) { cfg.index.metric = parse_metric(v); });
        read_number(*s, "seed", w, cfg.index.seed);
    }

    if (const json* s = section(j, "recall")) {
        const std::string w = "root.recall";
        read_number(*s, "k", w, cfg.recall.k);
        read_number(*s, "ef_search", w, cfg.recall.ef_search);
        read_number(*s, "timeout_ms", w, cfg.recall.timeout_ms);
    }

    if (const json* s = section(j, "classify")) {
        const std::string w = "root.classify";
        read_enum(*s, "strategy", w, [&](const std::string& v) { cfg.classify.strategy = parse_strategy(v); });
        read_enum(*s, "weighting", w, [&](const std::string& v) { cfg.classify.weighting = parse_weighting(v); });
        read_number(*s, "comparison_depth", w, cfg.classify.comparison_depth);
        if (s->contains("min_confidence") && !s->at("min_confidence").is_null()) {
            double v = 0.0;
            read_number(*s, "min_confidence", w, v);
            cfg.classify.min_confidence = v;
        }
    }

    if (const json* s = section(j, "eval")) {
        const std::string w = "root.eval";
        read_number(*s, "recall_k", w, cfg.eval.recall_k);
        read_number(*s, "num_threads", w, cfg.eval.num_threads);
        read_number(*s, "encode_batch", w, cfg.eval.encode_batch);
    }

    return cfg;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return config_from_json(j);
}

json config_to_json(const AppConfig& cfg) {
    json j;
    j["encoder"] = {
        {"dim", cfg.encoder.dim},
        {"num_buckets", cfg.encoder.num_buckets},
        {"use_bigrams", cfg.encoder.use_bigrams},
        {"seed", cfg.encoder.seed},
    };
    j["train"] = {
        {"margin", cfg.train.loss.margin},
        {"scale", cfg.train.loss.scale},
        {"symmetric", cfg.train.loss.symmetric},
        {"learning_rate", cfg.train.learning_rate},
        {"batch_size", cfg.train.batch_size},
        {"epochs", cfg.train.epochs},
        {"seed", cfg.train.seed},
        {"max_nonfinite_steps", cfg.train.max_nonfinite_steps},
    };
    j["index"] = {
        {"M", cfg.index.M},
        {"ef_construction", cfg.index.ef_construction},
        {"metric", metric_name(cfg.index.metric)},
        {"seed", cfg.index.seed},
    };
    j["recall"] = {
        {"k", cfg.recall.k},
        {"ef_search", cfg.recall.ef_search},
        {"timeout_ms", cfg.recall.timeout_ms},
    };
    j["classify"] = {
        {"strategy", strategy_name(cfg.classify.strategy)},
        {"weighting", weighting_name(cfg.classify.weighting)},
        {"comparison_depth", cfg.classify.comparison_depth},
    };
    j["classify"]["min_confidence"] = cfg.classify.min_confidence ? json(*cfg.classify.min_confidence) : json(nullptr);
    j["eval"] = {
        {"recall_k", cfg.eval.recall_k},
        {"num_threads", cfg.eval.num_threads},
        {"encode_batch", cfg.eval.encode_batch},
    };
    return j;
}

}  // namespace labelsearch
