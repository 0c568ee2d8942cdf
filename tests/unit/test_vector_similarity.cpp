#include <gtest/gtest.h>
#include "text/vector_similarity.hpp"
#include <cmath>
#include <limits>

using namespace nugget;

// ==========================================
// Cosine Similarity Tests
// ==========================================

TEST(VectorSimilarityTest, IdenticalVectors) {
    std::vector<float> v = {1.0f, 2.0f, 3.0f};
    EXPECT_NEAR(cosine_similarity(v, v), 1.0, 1e-9);
}

TEST(VectorSimilarityTest, OrthogonalAndOpposite) {
    EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0, 1e-9);
    EXPECT_NEAR(cosine_similarity({1.0f, 2.0f}, {-1.0f, -2.0f}), -1.0, 1e-9);
}

TEST(VectorSimilarityTest, ScaleInvariant) {
    EXPECT_NEAR(cosine_similarity({1.0f, 2.0f, 2.0f}, {2.0f, 4.0f, 4.0f}), 1.0, 1e-9);
}

TEST(VectorSimilarityTest, ZeroMagnitudeGivesZero) {
    EXPECT_DOUBLE_EQ(cosine_similarity({0.0f, 0.0f}, {1.0f, 1.0f}), 0.0);
}

TEST(VectorSimilarityTest, DimensionMismatchThrows) {
    try {
        cosine_similarity({1.0f, 2.0f}, {1.0f, 2.0f, 3.0f});
        FAIL() << "Expected VectorSimilarityError";
    } catch (const VectorSimilarityError& e) {
        EXPECT_EQ(e.kind(), VectorSimilarityError::Kind::DimensionMismatch);
    }
}

TEST(VectorSimilarityTest, EmptyVectorThrows) {
    EXPECT_THROW(cosine_similarity({}, {}), VectorSimilarityError);
}

TEST(VectorSimilarityTest, NonFiniteComponentReportsIndex) {
    float nan = std::numeric_limits<float>::quiet_NaN();
    try {
        cosine_similarity({1.0f, 2.0f, 3.0f}, {1.0f, nan, 3.0f});
        FAIL() << "Expected VectorSimilarityError";
    } catch (const VectorSimilarityError& e) {
        EXPECT_EQ(e.kind(), VectorSimilarityError::Kind::InvalidComponent);
        EXPECT_EQ(e.component_index(), 1u);
    }
}

TEST(VectorSimilarityTest, NormalizeVector) {
    auto n = normalize_vector({3.0f, 4.0f});
    ASSERT_EQ(n.size(), 2u);
    EXPECT_NEAR(n[0], 0.6f, 1e-6);
    EXPECT_NEAR(n[1], 0.8f, 1e-6);

    auto zero = normalize_vector({0.0f, 0.0f, 0.0f});
    EXPECT_EQ(zero, std::vector<float>(3, 0.0f));
}

// ==========================================
// Batch and Search Tests
// ==========================================

TEST(VectorSimilarityTest, BatchComputesEachPair) {
    auto results = batch_cosine_similarity(
        {{1.0f, 0.0f}, {1.0f, 1.0f}},
        {{1.0f, 0.0f}, {-1.0f, -1.0f}}
    );
    ASSERT_EQ(results.size(), 2u);
    EXPECT_NEAR(results[0], 1.0, 1e-9);
    EXPECT_NEAR(results[1], -1.0, 1e-9);
}

TEST(VectorSimilarityTest, BatchSizeMismatchThrows) {
    try {
        batch_cosine_similarity({{1.0f}}, {});
        FAIL() << "Expected VectorSimilarityError";
    } catch (const VectorSimilarityError& e) {
        EXPECT_EQ(e.kind(), VectorSimilarityError::Kind::BatchSizeMismatch);
    }
}

TEST(VectorSimilarityTest, BatchErrorNamesPair) {
    try {
        batch_cosine_similarity({{1.0f, 0.0f}, {1.0f}}, {{1.0f, 0.0f}, {1.0f, 2.0f}});
        FAIL() << "Expected VectorSimilarityError";
    } catch (const VectorSimilarityError& e) {
        ASSERT_TRUE(e.pair_index().has_value());
        EXPECT_EQ(*e.pair_index(), 1u);
        EXPECT_EQ(e.kind(), VectorSimilarityError::Kind::DimensionMismatch);
    }
}

TEST(VectorSimilarityTest, FindMostSimilarSkipsMalformedCandidates) {
    std::vector<std::vector<float>> candidates = {
        {0.0f, 1.0f},
        {1.0f, 2.0f, 3.0f},     // wrong dimension
        {1.0f, 0.1f},
        {}
    };

    auto match = find_most_similar({1.0f, 0.0f}, candidates);
    EXPECT_TRUE(match.found);
    EXPECT_EQ(match.index, 2);
    EXPECT_EQ(match.skipped, 2u);
    EXPECT_GT(match.similarity, 0.99);
}

TEST(VectorSimilarityTest, FindMostSimilarRespectsThreshold) {
    auto match = find_most_similar({1.0f, 0.0f}, {{0.0f, 1.0f}, {1.0f, 1.0f}}, 0.9);
    EXPECT_FALSE(match.found);
    EXPECT_EQ(match.index, -1);
}

TEST(VectorSimilarityTest, FindMostSimilarEmptyCandidates) {
    auto match = find_most_similar({1.0f}, {});
    EXPECT_FALSE(match.found);
    EXPECT_EQ(match.skipped, 0u);
}

// ==========================================
// Grouping Tests
// ==========================================

TEST(VectorSimilarityTest, GroupBySimilarity) {
    std::vector<std::vector<float>> vectors = {
        {1.0f, 0.0f},
        {0.0f, 1.0f},
        {0.99f, 0.05f},
        {0.02f, 1.0f}
    };

    auto groups = group_by_similarity(vectors, 0.9);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (std::vector<size_t>{0, 2}));
    EXPECT_EQ(groups[1], (std::vector<size_t>{1, 3}));
}

TEST(VectorSimilarityTest, GroupCohesion) {
    EXPECT_DOUBLE_EQ(group_cohesion({{1.0f, 0.0f}}), 1.0);
    EXPECT_NEAR(group_cohesion({{1.0f, 0.0f}, {2.0f, 0.0f}, {3.0f, 0.0f}}), 1.0, 1e-9);
    EXPECT_NEAR(group_cohesion({{1.0f, 0.0f}, {0.0f, 1.0f}}), 0.0, 1e-9);
}

TEST(VectorSimilarityTest, GroupCohesionWithNoComparablePairs) {
    EXPECT_DOUBLE_EQ(group_cohesion({{1.0f}, {1.0f, 2.0f}}), 0.0);
}
