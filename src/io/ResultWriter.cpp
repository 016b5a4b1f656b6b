#include "io/ResultWriter.hpp"
#include "core/LabelPath.hpp"

#include <stdexcept>

namespace labelsearch {

static void ensure_parent(const std::filesystem::path& p) {
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
}

nlohmann::json prediction_to_json(size_t line, const std::string& text, const Prediction& p) {
    nlohmann::json j;
    j["line"] = line;
    j["text"] = text;
    j["classified"] = p.classified;
    j["label_path"] = p.label_path;
    j["label"] = p.classified ? labels::join(p.label_path) : std::string();
    j["confidence"] = p.confidence;
    j["vote_share"] = p.vote_share;
    return j;
}

nlohmann::json recall_to_json(size_t line, const std::string& text, const QueryResult& qr) {
    nlohmann::json j;
    j["line"] = line;
    j["text"] = text;
    j["timed_out"] = qr.timed_out;

    nlohmann::json arr = nlohmann::json::array();
    for (size_t r = 0; r < qr.neighbors.size(); ++r) {
        const auto& n = qr.neighbors[r];
        arr.push_back({
            {"rank", r + 1},
            {"label", labels::join(n.label_path)},
            {"score", n.score},
        });
    }
    j["neighbors"] = arr;
    return j;
}

nlohmann::json eval_report_to_json(const EvalReport& r, size_t recall_k, bool with_records) {
    nlohmann::json j;
    j["total"] = r.total;
    j["recall_k"] = recall_k;
    j["hits_at_k"] = r.hits_at_k;
    j["recall_at_k"] = r.recall_at_k;
    j["correct"] = r.correct;
    j["accuracy"] = r.accuracy;
    j["unclassified"] = r.unclassified;
    j["timed_out"] = r.timed_out;

    nlohmann::json by_depth = nlohmann::json::array();
    for (size_t d = 0; d < r.accuracy_by_depth.size(); ++d) {
        by_depth.push_back({{"depth", d + 1}, {"accuracy", r.accuracy_by_depth[d]}});
    }
    j["accuracy_by_depth"] = by_depth;

    if (with_records) {
        nlohmann::json recs = nlohmann::json::array();
        for (const auto& rec : r.records) {
            recs.push_back({
                {"text", rec.text},
                {"gold", labels::join(rec.gold)},
                {"predicted", rec.prediction.classified ? labels::join(rec.prediction.label_path) : std::string()},
                {"classified", rec.prediction.classified},
                {"confidence", rec.prediction.confidence},
                {"hit_at_k", rec.hit_at_k},
            });
        }
        j["records"] = recs;
    }
    return j;
}

JsonlWriter::JsonlWriter(const std::filesystem::path& path) : m_path(path) {
    ensure_parent(path);
    m_out.open(path, std::ios::out | std::ios::trunc);
    if (!m_out) throw std::runtime_error("Failed to open output file: " + path.string());
}

void JsonlWriter::write(const nlohmann::json& j) {
    m_out << j.dump() << "\n";
    if (!m_out) throw std::runtime_error("Failed to write output file: " + m_path.string());
    ++m_count;
}

void JsonlWriter::close() {
    m_out.close();
    if (m_out.fail()) throw std::runtime_error("Failed to close output file: " + m_path.string());
}

nlohmann::json BatchSummary::to_json() const {
    nlohmann::json j;
    j["command"] = command;
    j["input"] = input_path;
    j["output"] = output_path;
    j["processed"] = processed;
    j["skipped"] = skipped;
    j["unclassified"] = unclassified;
    j["timed_out"] = timed_out;
    return j;
}

void BatchSummary::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

void write_json_file(const std::filesystem::path& out_path, const nlohmann::json& j) {
    ensure_parent(out_path);

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
    if (!out) throw std::runtime_error("Failed to write output file: " + out_path.string());
}

}  // namespace labelsearch
