// =============================================================================
// Label path parsing and comparison
// =============================================================================

#include <gtest/gtest.h>
#include "core/LabelPath.hpp"

#include <stdexcept>

using namespace labelsearch;

TEST(LabelPathTest, ParseSplitsOnSeparator) {
    LabelPath p = labels::parse("体育##篮球##NBA");
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0], "体育");
    EXPECT_EQ(p[1], "篮球");
    EXPECT_EQ(p[2], "NBA");
}

TEST(LabelPathTest, SingleLevel) {
    LabelPath p = labels::parse("教育");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0], "教育");
}

TEST(LabelPathTest, SingleHashIsPartOfLevel) {
    LabelPath p = labels::parse("c#");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0], "c#");
}

TEST(LabelPathTest, EmptyInputsThrow) {
    EXPECT_THROW(labels::parse(""), std::invalid_argument);
    EXPECT_THROW(labels::parse("##a"), std::invalid_argument);
    EXPECT_THROW(labels::parse("a##"), std::invalid_argument);
    EXPECT_THROW(labels::parse("a####b"), std::invalid_argument);
}

TEST(LabelPathTest, JoinInvertsParse) {
    const std::string s = "体育##篮球";
    EXPECT_EQ(labels::join(labels::parse(s)), s);
}

TEST(LabelPathTest, RenderTextUsesSpaces) {
    EXPECT_EQ(labels::render_text({"体育", "篮球"}), "体育 篮球");
    EXPECT_EQ(labels::render_text({"a"}), "a");
}

TEST(LabelPathTest, TruncateZeroKeepsFullPath) {
    LabelPath p = {"a", "b", "c"};
    EXPECT_EQ(labels::truncate(p, 0), p);
    EXPECT_EQ(labels::truncate(p, 5), p);
    EXPECT_EQ(labels::truncate(p, 1), (LabelPath{"a"}));
    EXPECT_EQ(labels::truncate(p, 2), (LabelPath{"a", "b"}));
}

TEST(LabelPathTest, EqualAtDepth) {
    LabelPath ab = {"a", "b"};
    LabelPath ac = {"a", "c"};
    LabelPath a = {"a"};

    EXPECT_TRUE(labels::equal_at_depth(ab, ac, 1));
    EXPECT_FALSE(labels::equal_at_depth(ab, ac, 2));
    EXPECT_FALSE(labels::equal_at_depth(ab, ac, 0));

    // a shorter path only matches on the levels it has
    EXPECT_TRUE(labels::equal_at_depth(a, ab, 1));
    EXPECT_FALSE(labels::equal_at_depth(a, ab, 2));
    EXPECT_FALSE(labels::equal_at_depth(a, ab, 0));
}
