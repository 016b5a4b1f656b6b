// =============================================================================
// Voting classifier: strategies, weighting, ties, depth, threshold
// =============================================================================

#include <gtest/gtest.h>
#include "classify/VotingClassifier.hpp"

#include <stdexcept>

using namespace labelsearch;

class VotingClassifierTest : public ::testing::Test {
protected:
    static Neighbor nb(LabelPath path, float score) {
        Neighbor n;
        n.label_path = std::move(path);
        n.score = score;
        n.distance = 1.0f - score;
        return n;
    }

    ClassifierConfig cfg;
};

TEST_F(VotingClassifierTest, EmptyNeighborsUnclassified) {
    Prediction p = classify(std::vector<Neighbor>{}, cfg, "q0");
    EXPECT_FALSE(p.classified);
    EXPECT_TRUE(p.label_path.empty());
    EXPECT_EQ(p.query_id, "q0");
}

TEST_F(VotingClassifierTest, BestMatchTakesTopNeighbor) {
    cfg.strategy = Strategy::BestMatch;
    std::vector<Neighbor> ns = {nb({"a", "b"}, 0.9f), nb({"c"}, 0.8f), nb({"c"}, 0.7f)};
    Prediction p = classify(ns, cfg);
    ASSERT_TRUE(p.classified);
    EXPECT_EQ(p.label_path, (LabelPath{"a", "b"}));
    EXPECT_NEAR(p.confidence, 0.9, 1e-6);
}

TEST_F(VotingClassifierTest, ScoreVoteSumsGroups) {
    std::vector<Neighbor> ns = {nb({"a"}, 0.9f), nb({"c"}, 0.8f), nb({"c"}, 0.7f)};
    Prediction p = classify(ns, cfg);
    ASSERT_TRUE(p.classified);
    EXPECT_EQ(p.label_path, (LabelPath{"c"}));
    EXPECT_NEAR(p.confidence, 1.5, 1e-6);
    EXPECT_NEAR(p.vote_share, 1.5 / 2.4, 1e-6);
}

TEST_F(VotingClassifierTest, CountAndInverseRankWeighting) {
    std::vector<Neighbor> ns = {nb({"a"}, 0.9f), nb({"b"}, 0.5f), nb({"b"}, 0.4f), nb({"a"}, 0.3f), nb({"b"}, 0.2f)};

    cfg.weighting = Weighting::Count;
    Prediction byCount = classify(ns, cfg);
    EXPECT_EQ(byCount.label_path, (LabelPath{"b"}));
    EXPECT_NEAR(byCount.confidence, 3.0, 1e-9);
    EXPECT_NEAR(byCount.vote_share, 0.6, 1e-9);

    // a: 1 + 1/4 = 1.25, b: 1/2 + 1/3 + 1/5 = 1.0333
    cfg.weighting = Weighting::InverseRank;
    Prediction byRank = classify(ns, cfg);
    EXPECT_EQ(byRank.label_path, (LabelPath{"a"}));
    EXPECT_NEAR(byRank.confidence, 1.25, 1e-9);
}

TEST_F(VotingClassifierTest, TieBrokenByBestScore) {
    cfg.weighting = Weighting::Count;
    std::vector<Neighbor> ns = {nb({"a"}, 0.6f), nb({"b"}, 0.9f), nb({"a"}, 0.5f), nb({"b"}, 0.1f)};
    EXPECT_EQ(classify(ns, cfg).label_path, (LabelPath{"b"}));
}

TEST_F(VotingClassifierTest, TieBrokenByLongerPathThenRank) {
    cfg.weighting = Weighting::Count;
    std::vector<Neighbor> deeper = {nb({"a"}, 0.5f), nb({"a", "x"}, 0.5f)};
    EXPECT_EQ(classify(deeper, cfg).label_path, (LabelPath{"a", "x"}));

    std::vector<Neighbor> same = {nb({"q"}, 0.5f), nb({"p"}, 0.5f)};
    EXPECT_EQ(classify(same, cfg).label_path, (LabelPath{"q"}));
}

TEST_F(VotingClassifierTest, DepthGroupsByPrefix) {
    std::vector<Neighbor> ns = {nb({"体育", "足球"}, 0.9f), nb({"体育", "篮球"}, 0.8f), nb({"教育"}, 0.95f)};

    Prediction full = classify(ns, cfg);
    EXPECT_EQ(full.label_path, (LabelPath{"教育"}));

    cfg.comparison_depth = 1;
    Prediction coarse = classify(ns, cfg);
    EXPECT_EQ(coarse.label_path, (LabelPath{"体育"}));
    EXPECT_NEAR(coarse.confidence, 1.7, 1e-6);
}

TEST_F(VotingClassifierTest, ThresholdGivesUnclassified) {
    std::vector<Neighbor> ns = {nb({"a"}, 0.4f)};
    cfg.min_confidence = 0.5;
    Prediction p = classify(ns, cfg, "q");
    EXPECT_FALSE(p.classified);
    EXPECT_TRUE(p.label_path.empty());
    EXPECT_NEAR(p.confidence, 0.4, 1e-6);

    cfg.min_confidence = 0.4;
    EXPECT_TRUE(classify(ns, cfg).classified);
}

TEST_F(VotingClassifierTest, Deterministic) {
    std::vector<Neighbor> ns;
    for (int i = 0; i < 20; ++i) ns.push_back(nb({"l" + std::to_string(i % 4)}, 1.0f - 0.01f * (float)i));
    Prediction first = classify(ns, cfg, "q");
    for (int r = 0; r < 10; ++r) {
        Prediction again = classify(ns, cfg, "q");
        EXPECT_EQ(again.label_path, first.label_path);
        EXPECT_EQ(again.confidence, first.confidence);
        EXPECT_EQ(again.vote_share, first.vote_share);
    }
}

TEST_F(VotingClassifierTest, QueryResultOverloadKeepsId) {
    QueryResult qr;
    qr.query_id = "line-7";
    qr.neighbors = {nb({"a"}, 0.9f)};
    Prediction p = classify(qr, cfg);
    EXPECT_EQ(p.query_id, "line-7");
    EXPECT_EQ(p.label_path, (LabelPath{"a"}));
}

TEST(VotingNamesTest, ParseRoundTrip) {
    EXPECT_EQ(parse_strategy("best_match"), Strategy::BestMatch);
    EXPECT_EQ(parse_weighting(weighting_name(Weighting::InverseRank)), Weighting::InverseRank);
    EXPECT_THROW(parse_strategy("majority"), std::invalid_argument);
    EXPECT_THROW(parse_weighting(""), std::invalid_argument);
}
