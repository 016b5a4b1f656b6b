#include "commands/evaluate.hpp"
#include "commands/Common.hpp"
#include "eval/Evaluator.hpp"
#include "index/ActiveIndex.hpp"
#include "io/DataFiles.hpp"
#include "io/ResultWriter.hpp"
#include "recall/RecallEngine.hpp"

#include <iomanip>
#include <iostream>
#include <string>

using namespace labelsearch;

int cmd_evaluate(int argc, char** argv) {
    try {
        const std::string corpus_emb = cli::require_arg(argc, argv, "--corpus_emb");
        const std::string eval_path = cli::require_arg(argc, argv, "--eval");
        const std::string report_path = cli::get_arg(argc, argv, "--report", "");
        const bool with_records = cli::has_flag(argc, argv, "--records");

        AppConfig cfg = cli::load_app_config(argc, argv);
        auto encoder = cli::open_encoder(argc, argv, cfg);

        auto idx = cli::install_corpus_index(corpus_emb, cfg.index);
        cli::check_encoder_dim(*encoder, idx->dim());

        auto loaded = load_eval_file(eval_path);
        print_issues(loaded, std::cerr);
        if (loaded.records.empty()) {
            throw std::runtime_error("no usable evaluation pairs in " + eval_path);
        }

        RecallEngine engine(ActiveIndex::process(), cfg.recall);
        EvalReport rep = evaluate(loaded.records, *encoder, engine, cfg.classify, cfg.eval);

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "EVAL: " << eval_path << " (n=" << rep.total << ", skipped " << loaded.issues.size() << ")\n";
        std::cout << "RECALL@" << cfg.eval.recall_k << ": " << rep.recall_at_k << "\n";
        std::cout << "ACCURACY: " << rep.accuracy << "\n";
        for (size_t d = 0; d < rep.accuracy_by_depth.size(); ++d) {
            std::cout << "ACCURACY@DEPTH" << (d + 1) << ": " << rep.accuracy_by_depth[d] << "\n";
        }
        std::cout << "UNCLASSIFIED: " << rep.unclassified << "\n";
        if (rep.timed_out) std::cout << "TIMED_OUT: " << rep.timed_out << "\n";

        if (!report_path.empty()) {
            write_json_file(report_path, eval_report_to_json(rep, cfg.eval.recall_k, with_records));
            std::cout << "OUT_REPORT: " << report_path << "\n";
        }

        ActiveIndex::process().teardown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "evaluate failed: " << e.what() << "\n";
        return 1;
    }
}
