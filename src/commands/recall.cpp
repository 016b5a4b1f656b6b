#include "commands/recall.hpp"
#include "commands/Common.hpp"
#include "index/ActiveIndex.hpp"
#include "io/DataFiles.hpp"
#include "io/ResultWriter.hpp"
#include "recall/RecallEngine.hpp"

#include <iostream>
#include <string>

using namespace labelsearch;

int cmd_recall(int argc, char** argv) {
    try {
        const std::string corpus_emb = cli::require_arg(argc, argv, "--corpus_emb");
        const std::string input_path = cli::require_arg(argc, argv, "--input");
        const std::string out_path = cli::get_arg(argc, argv, "--out", "out/recall.jsonl");
        const std::string summary_path = cli::get_arg(argc, argv, "--summary", "out/recall_summary.json");

        AppConfig cfg = cli::load_app_config(argc, argv);
        auto encoder = cli::open_encoder(argc, argv, cfg);

        auto idx = cli::install_corpus_index(corpus_emb, cfg.index);
        cli::check_encoder_dim(*encoder, idx->dim());

        auto loaded = load_text_file(input_path);
        print_issues(loaded, std::cerr);

        std::vector<std::string> texts;
        texts.reserve(loaded.records.size());
        for (const auto& t : loaded.records) texts.push_back(t.text);
        Matrix queries = cli::encode_in_batches(*encoder, texts, cfg.eval.encode_batch);

        RecallEngine engine(ActiveIndex::process(), cfg.recall);
        JsonlWriter out(out_path);

        BatchSummary summary;
        summary.command = "recall";
        summary.input_path = input_path;
        summary.output_path = out_path;
        summary.skipped = loaded.issues.size();

        for (size_t i = 0; i < loaded.records.size(); ++i) {
            const auto& rec = loaded.records[i];
            QueryResult qr = engine.recall(queries[i], std::to_string(rec.line));
            out.write(recall_to_json(rec.line, rec.text, qr));
            ++summary.processed;
            if (qr.timed_out) ++summary.timed_out;
        }
        out.close();
        summary.write_to(summary_path);

        std::cout << "K: " << cfg.recall.k << " EF_SEARCH: " << cfg.recall.ef_search << "\n";
        std::cout << "PROCESSED: " << summary.processed << "\n";
        std::cout << "SKIPPED: " << summary.skipped << "\n";
        if (summary.timed_out) std::cout << "TIMED_OUT: " << summary.timed_out << "\n";
        std::cout << "OUT_RECALL: " << out_path << "\n";

        ActiveIndex::process().teardown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "recall failed: " << e.what() << "\n";
        return 1;
    }
}
