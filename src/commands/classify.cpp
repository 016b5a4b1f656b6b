#include "commands/classify.hpp"
#include "commands/Common.hpp"
#include "classify/VotingClassifier.hpp"
#include "index/ActiveIndex.hpp"
#include "io/DataFiles.hpp"
#include "io/ResultWriter.hpp"
#include "recall/RecallEngine.hpp"

#include <iostream>
#include <string>

using namespace labelsearch;

int cmd_classify(int argc, char** argv) {
    try {
        const std::string corpus_emb = cli::require_arg(argc, argv, "--corpus_emb");
        const std::string input_path = cli::require_arg(argc, argv, "--input");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "out/predictions.jsonl");
        const std::string summary_path = cli::get_arg(argc, argv, "--summary", "out/classify_summary.json");
        const std::string extra_labels = cli::get_arg(argc, argv, "--add_labels", "");

        AppConfig cfg = cli::load_app_config(argc, argv);
        auto encoder = cli::open_encoder(argc, argv, cfg);

        auto idx = cli::install_corpus_index(corpus_emb, cfg.index);
        cli::check_encoder_dim(*encoder, idx->dim());
        if (!extra_labels.empty()) cli::add_label_entries(extra_labels, *encoder, cfg.index);

        auto loaded = load_text_file(input_path);
        print_issues(loaded, std::cerr);

        std::vector<std::string> texts;
        texts.reserve(loaded.records.size());
        for (const auto& t : loaded.records) texts.push_back(t.text);
        Matrix queries = cli::encode_in_batches(*encoder, texts, cfg.eval.encode_batch);

        RecallEngine engine(ActiveIndex::process(), cfg.recall);
        JsonlWriter out(out_path);

        BatchSummary summary;
        summary.command = "classify";
        summary.input_path = input_path;
        summary.output_path = out_path;
        summary.skipped = loaded.issues.size();

        for (size_t i = 0; i < loaded.records.size(); ++i) {
            const auto& rec = loaded.records[i];
            QueryResult qr = engine.recall(queries[i], std::to_string(rec.line));
            Prediction pred = classify(qr, cfg.classify);

            out.write(prediction_to_json(rec.line, rec.text, pred));
            ++summary.processed;
            if (!pred.classified) ++summary.unclassified;
            if (qr.timed_out) ++summary.timed_out;
        }
        out.close();
        summary.write_to(summary_path);

        std::cout << "STRATEGY: " << strategy_name(cfg.classify.strategy)
                  << " weighting=" << weighting_name(cfg.classify.weighting)
                  << " k=" << cfg.recall.k << " depth=" << cfg.classify.comparison_depth << "\n";
        std::cout << "PROCESSED: " << summary.processed << "\n";
        std::cout << "SKIPPED: " << summary.skipped << "\n";
        std::cout << "UNCLASSIFIED: " << summary.unclassified << "\n";
        if (summary.timed_out) std::cout << "TIMED_OUT: " << summary.timed_out << "\n";
        std::cout << "OUT_PREDICTIONS: " << out_path << "\n";
        std::cout << "OUT_SUMMARY: " << summary_path << "\n";

        ActiveIndex::process().teardown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "classify failed: " << e.what() << "\n";
        return 1;
    }
}
