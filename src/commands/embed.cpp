#include "commands/embed.hpp"
#include "commands/Common.hpp"
#include "corpus/CorpusEmbedder.hpp"
#include "corpus/CorpusStore.hpp"
#include "io/DataFiles.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace labelsearch;

int cmd_embed(int argc, char** argv) {
    try {
        const std::string corpus_path = cli::get_arg(argc, argv, "--corpus", "");
        const std::string labels_path = cli::get_arg(argc, argv, "--labels", "");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "out/corpus.bin");

        if (corpus_path.empty() && labels_path.empty()) {
            throw std::runtime_error("need --corpus and/or --labels");
        }

        AppConfig cfg = cli::load_app_config(argc, argv);
        auto encoder = cli::open_encoder(argc, argv, cfg);

        std::vector<Example> examples;
        size_t skipped = 0;

        if (!corpus_path.empty()) {
            auto loaded = load_corpus_file(corpus_path);
            print_issues(loaded, std::cerr);
            skipped += loaded.issues.size();
            std::cout << "CORPUS: " << corpus_path << " (" << loaded.records.size() << " entries)\n";
            for (auto& ex : loaded.records) examples.push_back(std::move(ex));
        }
        if (!labels_path.empty()) {
            auto loaded = load_label_file(labels_path);
            print_issues(loaded, std::cerr);
            skipped += loaded.issues.size();
            std::cout << "LABELS: " << labels_path << " (" << loaded.records.size() << " entries)\n";
            for (auto& ex : loaded.records) examples.push_back(std::move(ex));
        }

        if (examples.empty()) {
            throw std::runtime_error("no usable corpus entries");
        }

        CorpusStore store;
        store.set(embed_corpus(*encoder, examples, cfg.eval.encode_batch));

        std::filesystem::path p(out_path);
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
        if (!store.save(out_path)) {
            throw std::runtime_error("failed to save corpus embeddings to " + out_path);
        }

        std::cout << "SKIPPED: " << skipped << "\n";
        std::cout << "saved: " << out_path << " (n=" << store.size() << ", dim=" << store.dim() << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "embed failed: " << e.what() << "\n";
        return 1;
    }
}
