#include "commands/classify.hpp"
#include "commands/embed.hpp"
#include "commands/evaluate.hpp"
#include "commands/recall.hpp"
#include "commands/train.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  label-search train [args]\n"
        << "  label-search embed [args]\n"
        << "  label-search classify [args]\n"
        << "  label-search recall [args]\n"
        << "  label-search evaluate [args]\n"
        << "  label-search help\n"
        << "\n"
        << "  label-search <command> --help   options of one command\n";
    return 1;
}

static void print_config_help() {
    std::cerr
        << "config:\n"
        << "  --config <path>              JSON with sections encoder/train/index/recall/classify/eval;\n"
        << "                               flags below override it\n";
}

static void print_encoder_help() {
    std::cerr
        << "encoder:\n"
        << "  --encoder <hashing|onnx>     default: hashing\n"
        << "  --weights <path>             hashing weights from `train` (default: untrained, seeded)\n"
        << "  --dim <n>                    default: 128 (ignored when --weights is given)\n"
        << "  --buckets <n>                default: 32768\n"
        << "  --no_bigrams                 unigram features only\n"
        << "  --model <path>               onnx only, default: models/emb/model.onnx\n"
        << "  --vocab <path>               onnx only, default: models/emb/vocab.txt\n"
        << "  --max_len <n>                onnx only, default: 128\n";
}

static void print_index_help() {
    std::cerr
        << "index:\n"
        << "  --M <n>                      default: 16\n"
        << "  --ef_construction <n>        default: 200\n"
        << "  --metric <cosine|l2|dot>     default: cosine\n"
        << "  --index_seed <n>             default: 42\n"
        << "  --k <n>                      neighbors per query, default: 10\n"
        << "  --ef_search <n>              default: 64\n"
        << "  --timeout_ms <n>             per query, default: 0 (none)\n"
        << "  --encode_batch <n>           default: 64\n";
}

static void print_vote_help() {
    std::cerr
        << "voting:\n"
        << "  --strategy <vote|best_match> default: vote\n"
        << "  --weighting <score|count|inverse_rank>\n"
        << "                               default: score\n"
        << "  --depth <n>                  label levels compared, default: 0 (full path)\n"
        << "  --min_confidence <f>         below this -> unclassified, default: none\n";
}

static int print_train_help() {
    std::cerr
        << "usage:\n"
        << "  label-search train --pairs <file> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --pairs <path>               (required) query<TAB>positive lines\n"
        << "  --out <path>                 default: out/encoder.bin\n"
        << "  --init <path>                continue from saved weights\n"
        << "\n"
        << "training:\n"
        << "  --margin <f>                 default: 0.2\n"
        << "  --scale <f>                  default: 20\n"
        << "  --symmetric                  also apply the column-wise loss\n"
        << "  --lr <f>                     default: 0.5\n"
        << "  --batch_size <n>             default: 32\n"
        << "  --epochs <n>                 default: 3\n"
        << "  --train_seed <n>             default: 13\n"
        << "  --dim <n>                    default: 128\n"
        << "  --buckets <n>                default: 32768\n"
        << "  --no_bigrams                 unigram features only\n"
        << "\n";
    print_config_help();
    return 0;
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  label-search embed (--corpus <file> | --labels <file>) [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --corpus <path>              text<TAB>label##path lines\n"
        << "  --labels <path>              one label##path per line\n"
        << "  --out <path>                 default: out/corpus.bin\n"
        << "  --encode_batch <n>           default: 64\n"
        << "\n";
    print_encoder_help();
    std::cerr << "\n";
    print_config_help();
    return 0;
}

static int print_classify_help() {
    std::cerr
        << "usage:\n"
        << "  label-search classify --corpus_emb <bin> --input <file> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --corpus_emb <path>          (required) output of `embed`\n"
        << "  --input <path>               (required) one text per line\n"
        << "  --out <path>                 default: out/predictions.jsonl\n"
        << "  --summary <path>             default: out/classify_summary.json\n"
        << "  --add_labels <path>          label file added to the index before classifying\n"
        << "\n";
    print_encoder_help();
    std::cerr << "\n";
    print_index_help();
    std::cerr << "\n";
    print_vote_help();
    std::cerr << "\n";
    print_config_help();
    return 0;
}

static int print_recall_help() {
    std::cerr
        << "usage:\n"
        << "  label-search recall --corpus_emb <bin> --input <file> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --corpus_emb <path>          (required) output of `embed`\n"
        << "  --input <path>               (required) one text per line\n"
        << "  --out <path>                 default: out/recall.jsonl\n"
        << "  --summary <path>             default: out/recall_summary.json\n"
        << "\n";
    print_encoder_help();
    std::cerr << "\n";
    print_index_help();
    std::cerr << "\n";
    print_config_help();
    return 0;
}

static int print_evaluate_help() {
    std::cerr
        << "usage:\n"
        << "  label-search evaluate --corpus_emb <bin> --eval <file> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --corpus_emb <path>          (required) output of `embed`\n"
        << "  --eval <path>                (required) text<TAB>gold##label lines\n"
        << "  --report <path>              optional JSON report\n"
        << "  --records                    include per-example records in the report\n"
        << "  --recall_k <n>               K for recall@K and voting, default: --k if given, else 10\n"
        << "  --threads <n>                query workers, default: 1\n"
        << "\n";
    print_encoder_help();
    std::cerr << "\n";
    print_index_help();
    std::cerr << "\n";
    print_vote_help();
    std::cerr << "\n";
    print_config_help();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "train"    && help) return print_train_help();
    if (cmd == "embed"    && help) return print_embed_help();
    if (cmd == "classify" && help) return print_classify_help();
    if (cmd == "recall"   && help) return print_recall_help();
    if (cmd == "evaluate" && help) return print_evaluate_help();

    if (cmd == "train")    return cmd_train(argc - 1, argv + 1);
    if (cmd == "embed")    return cmd_embed(argc - 1, argv + 1);
    if (cmd == "classify") return cmd_classify(argc - 1, argv + 1);
    if (cmd == "recall")   return cmd_recall(argc - 1, argv + 1);
    if (cmd == "evaluate") return cmd_evaluate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
