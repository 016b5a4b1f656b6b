// =============================================================================
// ActiveIndex lifecycle and RecallEngine
// =============================================================================

#include <gtest/gtest.h>
#include "index/ActiveIndex.hpp"
#include "index/FlatIndex.hpp"
#include "recall/RecallEngine.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace labelsearch;

namespace {

CorpusEntry entry(std::vector<float> v, LabelPath label) {
    CorpusEntry e;
    e.embedding.vector = std::move(v);
    e.label_path = std::move(label);
    return e;
}

std::vector<CorpusEntry> axis_entries() {
    return {
        entry({1.0f, 0.0f, 0.0f}, {"x"}),
        entry({0.0f, 1.0f, 0.0f}, {"y"}),
    };
}

}  // namespace

TEST(ActiveIndexTest, InstallSnapshotTeardown) {
    ActiveIndex active;
    EXPECT_FALSE(active.active());
    EXPECT_EQ(active.snapshot(), nullptr);

    active.install(HnswIndex::build(axis_entries(), HnswConfig{}));
    EXPECT_TRUE(active.active());
    EXPECT_EQ(active.generation(), 1u);

    auto snap = active.snapshot();
    active.teardown();
    EXPECT_FALSE(active.active());

    // a held snapshot outlives teardown
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->size(), 2u);
}

TEST(ActiveIndexTest, RebuildAddsLabelsWithoutTouchingOldSnapshot) {
    ActiveIndex active;
    active.install(HnswIndex::build(axis_entries(), HnswConfig{}));
    auto old = active.snapshot();

    auto fresh = active.rebuild({entry({0.0f, 0.0f, 1.0f}, {"z"})}, HnswConfig{});
    EXPECT_EQ(fresh->size(), 3u);
    EXPECT_EQ(old->size(), 2u);
    EXPECT_EQ(active.snapshot()->size(), 3u);
    EXPECT_EQ(active.generation(), 2u);

    RecallConfig rc;
    rc.k = 1;
    RecallEngine engine(active, rc);
    auto qr = engine.recall({0.0f, 0.1f, 1.0f}, "q");
    ASSERT_EQ(qr.neighbors.size(), 1u);
    EXPECT_EQ(qr.neighbors[0].label_path, (LabelPath{"z"}));
}

TEST(ActiveIndexTest, FailedRebuildKeepsCurrentIndex) {
    ActiveIndex active;
    active.install(HnswIndex::build(axis_entries(), HnswConfig{}));

    EXPECT_THROW(active.rebuild({entry({1.0f, 2.0f}, {"bad"})}, HnswConfig{}), std::invalid_argument);
    EXPECT_EQ(active.snapshot()->size(), 2u);
    EXPECT_EQ(active.generation(), 1u);
}

TEST(ActiveIndexTest, RebuildFromEmpty) {
    ActiveIndex active;
    auto idx = active.rebuild(axis_entries(), HnswConfig{});
    EXPECT_EQ(idx->size(), 2u);
    EXPECT_TRUE(active.active());
}

TEST(ActiveIndexTest, ReadersSeeWholeIndexesDuringRebuilds) {
    ActiveIndex active;
    active.install(HnswIndex::build(axis_entries(), HnswConfig{}));

    std::atomic<bool> stop{false};
    std::atomic<size_t> bad{0};
    std::thread reader([&]() {
        while (!stop.load()) {
            auto snap = active.snapshot();
            // every installed index holds the two axis entries plus whole batches
            if (!snap || snap->size() < 2 || (snap->size() - 2) % 3 != 0) ++bad;
        }
    });

    for (int round = 0; round < 5; ++round) {
        std::vector<CorpusEntry> extra;
        for (int i = 0; i < 3; ++i) extra.push_back(entry({0.5f, 0.5f, (float)(round * 3 + i)}, {"n"}));
        active.rebuild(std::move(extra), HnswConfig{});
    }
    stop.store(true);
    reader.join();

    EXPECT_EQ(bad.load(), 0u);
    EXPECT_EQ(active.snapshot()->size(), 17u);
}

TEST(RecallEngineTest, NoIndexGivesEmptyResult) {
    ActiveIndex active;
    RecallEngine engine(active, RecallConfig{});
    auto qr = engine.recall({1.0f, 0.0f}, "q1");
    EXPECT_EQ(qr.query_id, "q1");
    EXPECT_TRUE(qr.neighbors.empty());
}

TEST(RecallEngineTest, ScoresFollowMetric) {
    auto flat = FlatIndex::build(axis_entries(), Metric::Cosine);
    RecallConfig rc;
    rc.k = 2;
    auto qr = RecallEngine::recall_on(*flat, {1.0f, 0.0f, 0.0f}, rc, "q");

    ASSERT_EQ(qr.neighbors.size(), 2u);
    EXPECT_EQ(qr.neighbors[0].label_path, (LabelPath{"x"}));
    EXPECT_NEAR(qr.neighbors[0].score, 1.0f, 1e-6f);
    EXPECT_NEAR(qr.neighbors[1].score, 0.0f, 1e-6f);
    EXPECT_NEAR(qr.neighbors[0].distance, 0.0f, 1e-6f);

    auto l2 = FlatIndex::build(axis_entries(), Metric::L2);
    auto qr2 = RecallEngine::recall_on(*l2, {1.0f, 0.0f, 0.0f}, rc, "q");
    EXPECT_NEAR(qr2.neighbors[0].score, 1.0f, 1e-6f);
    EXPECT_NEAR(qr2.neighbors[1].score, 1.0f / 3.0f, 1e-6f);
}
