// =============================================================================
// Prediction / recall JSON Lines and summary documents
// =============================================================================

#include <gtest/gtest.h>
#include "io/ResultWriter.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace labelsearch;
using json = nlohmann::json;

TEST(ResultWriterTest, PredictionRecordFields) {
    Prediction p;
    p.classified = true;
    p.label_path = {"体育", "篮球"};
    p.confidence = 0.9;
    p.vote_share = 0.75;

    json j = prediction_to_json(3, "湖人夺冠", p);
    EXPECT_EQ(j["line"], 3);
    EXPECT_EQ(j["text"], "湖人夺冠");
    EXPECT_EQ(j["classified"], true);
    EXPECT_EQ(j["label"], "体育##篮球");
    EXPECT_EQ(j["label_path"].size(), 2u);
    EXPECT_DOUBLE_EQ(j["confidence"].get<double>(), 0.9);
    EXPECT_DOUBLE_EQ(j["vote_share"].get<double>(), 0.75);
}

TEST(ResultWriterTest, UnclassifiedHasEmptyLabel) {
    json j = prediction_to_json(1, "x", Prediction::unclassified("1"));
    EXPECT_EQ(j["classified"], false);
    EXPECT_EQ(j["label"], "");
    EXPECT_TRUE(j["label_path"].empty());
}

TEST(ResultWriterTest, RecallRecordRanks) {
    QueryResult qr;
    Neighbor a, b;
    a.label_path = {"a"};
    a.score = 0.9f;
    b.label_path = {"b", "c"};
    b.score = 0.5f;
    qr.neighbors = {a, b};

    json j = recall_to_json(2, "q", qr);
    ASSERT_EQ(j["neighbors"].size(), 2u);
    EXPECT_EQ(j["neighbors"][0]["rank"], 1);
    EXPECT_EQ(j["neighbors"][1]["rank"], 2);
    EXPECT_EQ(j["neighbors"][1]["label"], "b##c");
    EXPECT_EQ(j["timed_out"], false);
}

TEST(ResultWriterTest, JsonlOneObjectPerLine) {
    const std::filesystem::path dir = std::filesystem::path(::testing::TempDir()) / "labelsearch_writer";
    const std::filesystem::path path = dir / "nested" / "out.jsonl";
    std::filesystem::remove_all(dir);

    {
        JsonlWriter w(path);
        w.write({{"line", 1}});
        w.write({{"line", 2}});
        EXPECT_EQ(w.count(), 2u);
        w.close();
    }

    std::ifstream in(path);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        ++n;
        EXPECT_EQ(json::parse(line)["line"], n);
    }
    EXPECT_EQ(n, 2u);

    BatchSummary s;
    s.command = "classify";
    s.processed = 2;
    s.skipped = 1;
    s.write_to(dir / "summary.json");

    std::ifstream sin(dir / "summary.json");
    json sj = json::parse(sin);
    EXPECT_EQ(sj["processed"], 2);
    EXPECT_EQ(sj["skipped"], 1);
    EXPECT_EQ(sj["command"], "classify");

    std::filesystem::remove_all(dir);
}

TEST(ResultWriterTest, EvalReportDepths) {
    EvalReport r;
    r.total = 4;
    r.accuracy = 0.5;
    r.recall_at_k = 0.75;
    r.accuracy_by_depth = {1.0, 0.5};
    r.records.resize(4);

    json j = eval_report_to_json(r, 10, false);
    EXPECT_EQ(j["recall_k"], 10);
    ASSERT_EQ(j["accuracy_by_depth"].size(), 2u);
    EXPECT_EQ(j["accuracy_by_depth"][0]["depth"], 1);
    EXPECT_FALSE(j.contains("records"));

    json withRecords = eval_report_to_json(r, 10, true);
    EXPECT_EQ(withRecords["records"].size(), 4u);
}
