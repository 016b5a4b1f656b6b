// =============================================================================
// Corpus embedding and the on-disk corpus store
// =============================================================================

#include <gtest/gtest.h>
#include "corpus/CorpusEmbedder.hpp"
#include "corpus/CorpusStore.hpp"
#include "emb/HashingEncoder.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace labelsearch;

namespace {

// Returns vectors of the wrong width after the first call.
class DriftingEncoder final : public Encoder {
public:
    size_t dim() const override { return 4; }
    std::vector<float> encode(const std::string&) const override {
        return std::vector<float>(calls++ == 0 ? 4 : 5, 1.0f);
    }

private:
    mutable size_t calls = 0;
};

}  // namespace

class CorpusStoreTest : public ::testing::Test {
protected:
    void SetUp() override { path = ::testing::TempDir() + "labelsearch_corpus.bin"; }
    void TearDown() override { std::remove(path.c_str()); }

    std::string path;
};

TEST_F(CorpusStoreTest, EmbedAssignsIdsAndLabels) {
    HashingEncoder enc;
    std::vector<Example> ex = {{"湖人夺冠", {"体育", "篮球"}}, {"高考", {"教育"}}, {"降息", {"财经"}}};
    auto entries = embed_corpus(enc, ex, 2);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].embedding.owner_id, "c0");
    EXPECT_EQ(entries[2].embedding.owner_id, "c2");
    EXPECT_EQ(entries[0].label_path, (LabelPath{"体育", "篮球"}));
    EXPECT_EQ(entries[1].text, "高考");
    EXPECT_EQ(entries[1].embedding.vector, enc.encode("高考"));

    std::vector<Example> more = {{"股票", {"财经", "股票"}}};
    auto appended = embed_corpus(enc, more, 64, entries.size());
    ASSERT_EQ(appended.size(), 1u);
    EXPECT_EQ(appended[0].embedding.owner_id, "c3");
}

TEST_F(CorpusStoreTest, EmbedRejectsInconsistentDim) {
    DriftingEncoder enc;
    std::vector<Example> ex = {{"a", {"x"}}, {"b", {"y"}}};
    EXPECT_THROW(embed_corpus(enc, ex), std::invalid_argument);
}

TEST_F(CorpusStoreTest, SaveLoadKeepsEntries) {
    HashingEncoderConfig cfg;
    cfg.dim = 8;
    HashingEncoder enc(cfg);
    std::vector<Example> ex = {{"湖人夺冠", {"体育", "篮球"}}, {"高考", {"教育"}}};

    CorpusStore store;
    store.set(embed_corpus(enc, ex));
    ASSERT_TRUE(store.save(path));

    CorpusStore loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.dim(), 8u);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded.entries()[0].label_path, (LabelPath{"体育", "篮球"}));
    EXPECT_EQ(loaded.entries()[0].text, "湖人夺冠");
    EXPECT_EQ(loaded.entries()[1].embedding.vector, store.entries()[1].embedding.vector);
    EXPECT_EQ(loaded.entries()[1].embedding.owner_id, "c1");
}

TEST_F(CorpusStoreTest, RejectsForeignFile) {
    {
        std::ofstream out(path, std::ios::binary);
        out << "not a corpus file";
    }
    CorpusStore store;
    EXPECT_FALSE(store.load(path));
    EXPECT_FALSE(store.load(path + ".missing"));
}

TEST_F(CorpusStoreTest, SetRejectsMixedDims) {
    CorpusEntry a, b;
    a.embedding.vector = {1.0f, 2.0f};
    b.embedding.vector = {1.0f};
    CorpusStore store;
    EXPECT_THROW(store.set({a, b}), std::invalid_argument);
}
