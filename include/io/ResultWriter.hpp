#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "nlohmann/json.hpp"
#include "core/Types.hpp"
#include "eval/Evaluator.hpp"

namespace labelsearch {

// {line, text, classified, label_path, label, confidence, vote_share}
nlohmann::json prediction_to_json(size_t line, const std::string& text, const Prediction& p);

// {line, text, timed_out, neighbors:[{rank, label, score}]}
nlohmann::json recall_to_json(size_t line, const std::string& text, const QueryResult& qr);

nlohmann::json eval_report_to_json(const EvalReport& r, size_t recall_k, bool with_records);

// One JSON object per line. Creates parent directories; throws
// std::runtime_error when the file cannot be opened or written.
class JsonlWriter {
public:
    explicit JsonlWriter(const std::filesystem::path& path);

    void write(const nlohmann::json& j);
    void close();

    size_t count() const { return m_count; }

private:
    std::filesystem::path m_path;
    std::ofstream m_out;
    size_t m_count = 0;
};

struct BatchSummary {
    std::string command;
    std::string input_path;
    std::string output_path;

    size_t processed = 0;
    size_t skipped = 0;  // malformed input lines
    size_t unclassified = 0;
    size_t timed_out = 0;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// Pretty-printed JSON document.
void write_json_file(const std::filesystem::path& out_path, const nlohmann::json& j);

}  // namespace labelsearch
