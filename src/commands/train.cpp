#include "commands/train.hpp"
#include "commands/Common.hpp"
#include "emb/HashingEncoder.hpp"
#include "io/DataFiles.hpp"
#include "train/ContrastiveTrainer.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

using namespace labelsearch;

static std::atomic<bool> g_cancel{false};

extern "C" void on_sigint(int) { g_cancel.store(true); }

int cmd_train(int argc, char** argv) {
    try {
        const std::string pairs_path = cli::require_arg(argc, argv, "--pairs");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "out/encoder.bin");
        const std::string init_path = cli::get_arg(argc, argv, "--init", "");

        AppConfig cfg = cli::load_app_config(argc, argv);

        auto loaded = load_train_pairs_file(pairs_path);
        print_issues(loaded, std::cerr);
        if (loaded.records.size() < 2) {
            throw std::runtime_error("need at least 2 usable training pairs in " + pairs_path +
                                     " (got " + std::to_string(loaded.records.size()) + ")");
        }

        HashingEncoder enc(cfg.encoder);
        if (!init_path.empty() && !enc.load(init_path)) {
            throw std::runtime_error("failed to load encoder weights: " + init_path);
        }

        std::cout << "PAIRS: " << loaded.records.size() << " (skipped " << loaded.issues.size() << ")\n";
        std::cout << "DIM: " << enc.dim() << "\n";
        std::cout << "BATCH: " << cfg.train.batch_size << "\n";
        std::cout << "EPOCHS: " << cfg.train.epochs << "\n";
        std::cout << "MARGIN: " << cfg.train.loss.margin << " SCALE: " << cfg.train.loss.scale
                  << (cfg.train.loss.symmetric ? " (symmetric)" : "") << "\n";

        ContrastiveTrainer trainer(enc, cfg.train);

        g_cancel.store(false);
        auto prev = std::signal(SIGINT, on_sigint);
        TrainReport rep = trainer.fit(loaded.records, &g_cancel);
        std::signal(SIGINT, prev);

        std::cout << "STEPS: " << rep.steps << "\n";
        std::cout << "SKIPPED_SMALL: " << rep.skipped_small << "\n";
        std::cout << "SKIPPED_NONFINITE: " << rep.skipped_nonfinite << "\n";
        if (!rep.epoch_loss.empty()) std::cout << "FINAL_LOSS: " << rep.epoch_loss.back() << "\n";
        if (rep.cancelled) std::cout << "CANCELLED: weights saved as of the last finished step\n";
        if (rep.degraded) std::cerr << "warning: training degraded (repeated non-finite steps)\n";

        std::filesystem::path p(out_path);
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
        if (!enc.save(out_path)) {
            throw std::runtime_error("failed to save encoder weights to " + out_path);
        }
        std::cout << "OUT_WEIGHTS: " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "train failed: " << e.what() << "\n";
        return 1;
    }
}
