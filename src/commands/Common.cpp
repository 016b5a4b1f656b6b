#include "commands/Common.hpp"
#include "corpus/CorpusEmbedder.hpp"
#include "corpus/CorpusStore.hpp"
#include "emb/HashingEncoder.hpp"
#include "index/ActiveIndex.hpp"
#include "index/Distance.hpp"
#include "io/DataFiles.hpp"

#ifdef LABELSEARCH_HAVE_ONNX
#include "emb/OnnxEncoder.hpp"
#endif

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <stdexcept>

namespace labelsearch::cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

std::string require_arg(int argc, char** argv, const std::string& key) {
    std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) throw std::runtime_error("missing required " + key);
    return v;
}

static std::runtime_error bad_number(const std::string& key, const std::string& s, const char* what) {
    return std::runtime_error(key + " expects " + what + ", got '" + s + "'");
}

size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    if (s[0] == '-' || s[0] == '+') throw bad_number(key, s, "a non-negative integer");
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(s, &pos);
        if (pos != s.size()) throw bad_number(key, s, "a non-negative integer");
        return (size_t)v;
    } catch (const std::logic_error&) {
        throw bad_number(key, s, "a non-negative integer");
    }
}

int64_t get_arg_int(int argc, char** argv, const std::string& key, int64_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) throw bad_number(key, s, "an integer");
        return (int64_t)v;
    } catch (const std::logic_error&) {
        throw bad_number(key, s, "an integer");
    }
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) throw bad_number(key, s, "a number");
        return v;
    } catch (const std::logic_error&) {
        throw bad_number(key, s, "a number");
    }
}

AppConfig load_app_config(int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--config", "");
    AppConfig cfg = path.empty() ? AppConfig{} : load_config(path);

    // encoder
    cfg.encoder.dim = get_arg_size(argc, argv, "--dim", cfg.encoder.dim);
    cfg.encoder.num_buckets = get_arg_size(argc, argv, "--buckets", cfg.encoder.num_buckets);
    if (has_flag(argc, argv, "--no_bigrams")) cfg.encoder.use_bigrams = false;

    // train
    cfg.train.loss.margin = (float)get_arg_double(argc, argv, "--margin", cfg.train.loss.margin);
    cfg.train.loss.scale = (float)get_arg_double(argc, argv, "--scale", cfg.train.loss.scale);
    if (has_flag(argc, argv, "--symmetric")) cfg.train.loss.symmetric = true;
    cfg.train.learning_rate = (float)get_arg_double(argc, argv, "--lr", cfg.train.learning_rate);
    cfg.train.batch_size = get_arg_size(argc, argv, "--batch_size", cfg.train.batch_size);
    cfg.train.epochs = get_arg_size(argc, argv, "--epochs", cfg.train.epochs);
    cfg.train.seed = get_arg_size(argc, argv, "--train_seed", cfg.train.seed);

    // index
    cfg.index.M = get_arg_size(argc, argv, "--M", cfg.index.M);
    cfg.index.ef_construction = get_arg_size(argc, argv, "--ef_construction", cfg.index.ef_construction);
    const std::string metric = get_arg(argc, argv, "--metric", "");
    if (!metric.empty()) cfg.index.metric = parse_metric(metric);
    cfg.index.seed = get_arg_size(argc, argv, "--index_seed", cfg.index.seed);

    // recall
    cfg.recall.k = get_arg_size(argc, argv, "--k", cfg.recall.k);
    cfg.recall.ef_search = get_arg_size(argc, argv, "--ef_search", cfg.recall.ef_search);
    cfg.recall.timeout_ms = get_arg_int(argc, argv, "--timeout_ms", cfg.recall.timeout_ms);

    // classify
    const std::string strategy = get_arg(argc, argv, "--strategy", "");
    if (!strategy.empty()) cfg.classify.strategy = parse_strategy(strategy);
    const std::string weighting = get_arg(argc, argv, "--weighting", "");
    if (!weighting.empty()) cfg.classify.weighting = parse_weighting(weighting);
    cfg.classify.comparison_depth = get_arg_size(argc, argv, "--depth", cfg.classify.comparison_depth);
    if (!get_arg(argc, argv, "--min_confidence", "").empty()) {
        cfg.classify.min_confidence = get_arg_double(argc, argv, "--min_confidence", 0.0);
    }

    // eval
    // --k alone also sets the evaluation K
    const size_t eval_k = has_flag(argc, argv, "--k") ? cfg.recall.k : cfg.eval.recall_k;
    cfg.eval.recall_k = get_arg_size(argc, argv, "--recall_k", eval_k);
    cfg.eval.num_threads = get_arg_size(argc, argv, "--threads", cfg.eval.num_threads);
    cfg.eval.encode_batch = get_arg_size(argc, argv, "--encode_batch", cfg.eval.encode_batch);

    return cfg;
}

std::unique_ptr<Encoder> open_encoder(int argc, char** argv, const AppConfig& cfg) {
    const std::string kind = get_arg(argc, argv, "--encoder", "hashing");

    if (kind == "hashing") {
        auto enc = std::make_unique<HashingEncoder>(cfg.encoder);
        const std::string weights = get_arg(argc, argv, "--weights", "");
        if (!weights.empty() && !enc->load(weights)) {
            throw std::runtime_error("failed to load encoder weights: " + weights);
        }
        std::cout << "ENCODER: hashing " << (weights.empty() ? "(untrained)" : weights)
                  << " dim=" << enc->dim() << "\n";
        return enc;
    }

    if (kind == "onnx") {
#ifdef LABELSEARCH_HAVE_ONNX
        const std::string model = get_arg(argc, argv, "--model", "models/emb/model.onnx");
        const std::string vocab = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");
        const size_t max_len = get_arg_size(argc, argv, "--max_len", 128);

        auto enc = std::make_unique<OnnxEncoder>();
        if (!enc->init(model, vocab, max_len)) {
            throw std::runtime_error("failed to init OnnxEncoder from " + model);
        }
        std::cout << "ENCODER: onnx " << model << " dim=" << enc->dim() << "\n";
        return enc;
#else
        throw std::runtime_error("--encoder onnx: built without onnxruntime");
#endif
    }

    throw std::runtime_error("unknown --encoder '" + kind + "' (expected hashing or onnx)");
}

std::shared_ptr<const HnswIndex> install_corpus_index(const std::string& corpus_emb, const HnswConfig& cfg) {
    CorpusStore store;
    if (!store.load(corpus_emb)) {
        throw std::runtime_error("failed to load corpus embeddings: " + corpus_emb);
    }
    if (store.size() == 0) {
        throw std::runtime_error("no usable corpus entries in " + corpus_emb);
    }

    auto idx = HnswIndex::build(store.take(), cfg);
    ActiveIndex::process().install(idx);

    std::cout << "INDEX: hnsw n=" << idx->size() << " dim=" << idx->dim() << " M=" << cfg.M
              << " ef_construction=" << cfg.ef_construction << " metric=" << metric_name(cfg.metric) << "\n";
    return idx;
}

void add_label_entries(const std::string& label_file, const Encoder& encoder, const HnswConfig& cfg) {
    auto loaded = load_label_file(label_file);
    print_issues(loaded, std::cerr);
    if (loaded.records.empty()) {
        std::cerr << "warning: no labels in " << label_file << "\n";
        return;
    }

    const auto cur = ActiveIndex::process().snapshot();
    auto extra = embed_corpus(encoder, loaded.records, 64, cur ? cur->size() : 0);
    auto idx = ActiveIndex::process().rebuild(std::move(extra), cfg);
    std::cout << "LABELS_ADDED: " << loaded.records.size() << " (index n=" << idx->size() << ")\n";
}

void check_encoder_dim(const Encoder& encoder, size_t index_dim) {
    if (encoder.dim() != index_dim) {
        throw std::runtime_error("encoder dim " + std::to_string(encoder.dim()) +
                                 " does not match corpus dim " + std::to_string(index_dim));
    }
}

Matrix encode_in_batches(const Encoder& encoder, const std::vector<std::string>& texts, size_t batch) {
    batch = std::max<size_t>(batch, 1);

    Matrix out;
    out.reserve(texts.size());
    for (size_t start = 0; start < texts.size(); start += batch) {
        const size_t end = std::min(texts.size(), start + batch);
        std::vector<std::string> chunk(texts.begin() + (std::ptrdiff_t)start, texts.begin() + (std::ptrdiff_t)end);
        Matrix vecs = encoder.encode_batch(chunk);
        if (vecs.size() != chunk.size()) {
            throw std::invalid_argument("encoder returned " + std::to_string(vecs.size()) +
                                        " vectors for " + std::to_string(chunk.size()) + " texts");
        }
        for (auto& v : vecs) out.push_back(std::move(v));
    }
    return out;
}

}  // namespace labelsearch::cli
