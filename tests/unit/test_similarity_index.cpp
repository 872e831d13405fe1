#include <gtest/gtest.h>
#include "similarity/similarity_index.hpp"
#include "core/errors.hpp"

using namespace sem;

class SimilarityIndexTest : public ::testing::Test {
protected:
    BruteForceSimilarityIndex index;

    void SetUp() override {
        index.add("a", {1.0f, 0.0f, 0.0f});
        index.add("b", {0.99f, 0.05f, 0.0f});
        index.add("c", {0.95f, 0.2f, 0.0f});
        index.add("d", {0.92f, 0.3f, 0.1f});
        index.add("e", {0.9f, 0.35f, 0.2f});
        index.add("f", {0.0f, 1.0f, 0.0f});
        index.add("g", {-1.0f, 0.0f, 0.0f});
    }
};

// ==========================================
// Ranking Tests
// ==========================================

TEST_F(SimilarityIndexTest, LimitAndThreshold) {
    auto hits = index.top_similar({1.0f, 0.0f, 0.0f}, 3, 0.9);

    ASSERT_LE(hits.size(), 3);
    ASSERT_FALSE(hits.empty());
    for (const auto& hit : hits) {
        EXPECT_GE(hit.similarity, 0.9);
    }
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_GE(hits[i - 1].similarity, hits[i].similarity);
    }
    EXPECT_EQ(hits[0].id, "a");
}

TEST_F(SimilarityIndexTest, NeverPads) {
    auto hits = index.top_similar({0.0f, 1.0f, 0.0f}, 10, 0.99);
    ASSERT_EQ(hits.size(), 1);
    EXPECT_EQ(hits[0].id, "f");
}

TEST_F(SimilarityIndexTest, ExcludeId) {
    auto hits = index.top_similar({1.0f, 0.0f, 0.0f}, 5, 0.0, "a");
    for (const auto& hit : hits) {
        EXPECT_NE(hit.id, "a");
    }
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].id, "b");
}

TEST_F(SimilarityIndexTest, ZeroLimit) {
    EXPECT_TRUE(index.top_similar({1.0f, 0.0f, 0.0f}, 0, 0.0).empty());
}

TEST(SimilarityTieTest, TiesBrokenById) {
    BruteForceSimilarityIndex index;
    index.add("zeta", {1.0f, 1.0f});
    index.add("alpha", {1.0f, 1.0f});
    index.add("mid", {1.0f, 1.0f});

    auto hits = index.top_similar({1.0f, 1.0f}, 3, 0.5);
    ASSERT_EQ(hits.size(), 3);
    EXPECT_EQ(hits[0].id, "alpha");
    EXPECT_EQ(hits[1].id, "mid");
    EXPECT_EQ(hits[2].id, "zeta");
}

// ==========================================
// Dimension Tests
// ==========================================

TEST_F(SimilarityIndexTest, DimensionIsFixedByFirstVector) {
    EXPECT_EQ(index.dimension(), 3);
    EXPECT_EQ(index.size(), 7);
    EXPECT_THROW(index.add("bad", {1.0f, 0.0f}), DimensionMismatchError);
    EXPECT_THROW(index.top_similar({1.0f, 0.0f}, 3, 0.0), DimensionMismatchError);
}

TEST_F(SimilarityIndexTest, AddOverwrites) {
    index.add("a", {0.0f, 1.0f, 0.0f});
    EXPECT_EQ(index.size(), 7);
    const auto* vec = index.get("a");
    ASSERT_NE(vec, nullptr);
    EXPECT_FLOAT_EQ((*vec)[1], 1.0f);
    EXPECT_EQ(index.get("missing"), nullptr);
}

// ==========================================
// Free Function Tests
// ==========================================

TEST(TopSimilarFunctionTest, MatchesIndexBehavior) {
    std::map<std::string, std::vector<float>> corpus = {
        {"doc1", {1.0f, 0.0f}},
        {"doc2", {0.9f, 0.1f}},
        {"doc3", {0.0f, 1.0f}},
        {"doc4", {-1.0f, 0.0f}}
    };

    auto hits = top_similar({1.0f, 0.0f}, corpus, 3, 0.9);
    ASSERT_EQ(hits.size(), 2);
    EXPECT_EQ(hits[0].id, "doc1");
    EXPECT_EQ(hits[1].id, "doc2");
    EXPECT_NEAR(hits[1].similarity, 0.9939, 1e-3);
}
