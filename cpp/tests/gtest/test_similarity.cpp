// =============================================================================
// Similarity Engine Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polarity/similarity.hpp"
#include "polarity/classifier.hpp"
#include "engine_fixtures.hpp"

using namespace polarity;
using polarity::test::make_batch;
using polarity::test::unit;

class SimilarityTest : public ::testing::Test {
protected:
    EngineState state;

    int64_t sim(TokenId a, TokenId b, bool include_context = false) const {
        return SimilarityEngine(state.vocabulary, state.cooccurrence).similarity(a, b, include_context);
    }
};

// Two tokens in the same category and domain, classified together once
TEST_F(SimilarityTest, CategoryDomainAndCooccurrenceBonuses) {
    state.vocabulary.set_vocabulary(make_batch({
        {0, "unused"},
        {1, "fast", 0, 2, 1, 1},
        {2, "reliable", 0, 2, 1, 1},
    }));
    EXPECT_EQ(sim(1, 2), 150 + 100);

    Classifier(state).classify("alice", {1, 2}, 100);
    EXPECT_EQ(sim(1, 2), 150 + 100 + 5);
    EXPECT_EQ(sim(2, 1), 150 + 100 + 5);
}

TEST_F(SimilarityTest, SecondaryCategoryMatchEitherDirection) {
    state.vocabulary.set_vocabulary(make_batch({
        {0, "a", 0, 1, 1, 0, 3},
        {1, "b", 0, 3, 1, 0, 5},
        {2, "c", 0, 4, 1, 0, 1},
    }));
    // a.secondary == b.category
    EXPECT_EQ(sim(0, 1), 75);
    // c.secondary == a.category
    EXPECT_EQ(sim(0, 2), 75);
    // no relation between b and c
    EXPECT_EQ(sim(1, 2), 0);
}

TEST_F(SimilarityTest, GeneralDomainEarnsNoDomainBonus) {
    state.vocabulary.set_vocabulary(make_batch({
        {0, "a", 0, 1},
        {1, "b", 0, 2},
    }));
    EXPECT_EQ(sim(0, 1), 0);
}

TEST_F(SimilarityTest, PolarityAgreementAndConflict) {
    state.vocabulary.set_vocabulary(make_batch({
        {0, "happy", 3, 1},
        {1, "glad", 1, 2},
        {2, "sad", -2, 3},
        {3, "plain", 0, 4},
    }));
    EXPECT_EQ(sim(0, 1), 50);
    EXPECT_EQ(sim(0, 2), -30);
    EXPECT_EQ(sim(0, 3), 0);
}

TEST_F(SimilarityTest, SemanticDotProductIsScaled) {
    state.vocabulary.set_vocabulary(make_batch({{0, "a", 0, 1}, {1, "b", 0, 2}}));
    state.vocabulary.set_embedding(0, unit<SemanticVector>(4, 2000), ContextVector::Zero());
    state.vocabulary.set_embedding(1, unit<SemanticVector>(4, 1500), ContextVector::Zero());
    EXPECT_EQ(sim(0, 1), 3000);
}

TEST_F(SimilarityTest, ContextContributesHalfWhenRequested) {
    state.vocabulary.set_vocabulary(make_batch({{0, "a", 0, 1}, {1, "b", 0, 2}}));
    state.vocabulary.set_embedding(0, SemanticVector::Zero(), unit<ContextVector>(2, 1000));
    state.vocabulary.set_embedding(1, SemanticVector::Zero(), unit<ContextVector>(2, 301));

    EXPECT_EQ(sim(0, 1, false), 0);
    // 301 / 2 truncates
    EXPECT_EQ(sim(0, 1, true), 150);
}

TEST_F(SimilarityTest, PerTermTruncation) {
    state.vocabulary.set_vocabulary(make_batch({{0, "a", 0, 1}, {1, "b", 0, 2}}));
    SemanticVector a = SemanticVector::Zero();
    SemanticVector b = SemanticVector::Zero();
    a(0) = 999; b(0) = 1;
    a(1) = 999; b(1) = 1;
    state.vocabulary.set_embedding(0, a, ContextVector::Zero());
    state.vocabulary.set_embedding(1, b, ContextVector::Zero());

    // Each 999/1000 term truncates to zero on its own
    EXPECT_EQ(sim(0, 1), 0);
}

TEST_F(SimilarityTest, UnknownTokensScoreZero) {
    state.vocabulary.set_vocabulary(make_batch({{0, "a", 5, 1}, {1, "b", 5, 1}}));
    EXPECT_EQ(sim(0, 7), 0);
    EXPECT_EQ(sim(constants::VOCAB_CAP, 0), 0);
}

TEST_F(SimilarityTest, SelfSimilarityIncludesAllBonuses) {
    state.vocabulary.set_vocabulary(make_batch({{0, "a", 2, 1, 1, 4}}));
    state.vocabulary.set_embedding(0, unit<SemanticVector>(0, 1000), ContextVector::Zero());
    EXPECT_EQ(sim(0, 0), 1000 + 150 + 100 + 50);
}
