// =============================================================================
// Domain Detection & Modifier Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polarity/domain_model.hpp"
#include "polarity/vocabulary.hpp"
#include "polarity/error.hpp"
#include "engine_fixtures.hpp"

using namespace polarity;
using polarity::test::TokenRow;
using polarity::test::make_batch;

class DomainModelTest : public ::testing::Test {
protected:
    VocabularyStore vocab;
    DomainModel domains;

    static TokenRow token(TokenId id, uint32_t domain, uint32_t strength) {
        TokenRow t{id};
        t.domain = domain;
        t.strength = strength;
        return t;
    }

    void SetUp() override {
        vocab.set_vocabulary(make_batch({
            token(0, 0, 0),
            token(1, 2, 40),    // finance
            token(2, 2, 30),    // finance
            token(3, 3, 60),    // health
            token(4, 1, 0),     // technology, no strength
        }));
    }
};

TEST_F(DomainModelTest, NoStrengthMeansGeneral) {
    EXPECT_EQ(DomainModel::detect({0, 4}, vocab), 0);
}

TEST_F(DomainModelTest, StrongestDomainWins) {
    EXPECT_EQ(DomainModel::detect({1}, vocab), 2);
    EXPECT_EQ(DomainModel::detect({1, 3}, vocab), 3);
    EXPECT_EQ(DomainModel::detect({1, 2, 3}, vocab), 2);
}

TEST_F(DomainModelTest, TiesKeepLowerIndex) {
    vocab.set_vocabulary(make_batch({token(5, 7, 50), token(6, 5, 50)}));
    EXPECT_EQ(DomainModel::detect({5, 6}, vocab), 5);
    EXPECT_EQ(DomainModel::detect({6, 5}, vocab), 5);
}

TEST_F(DomainModelTest, NeutralByDefault) {
    ClassScores scores{10, 20, 30, 40, 50, 60, 70};
    const ClassScores before = scores;
    for (int d = 0; d < constants::NUM_DOMAINS; ++d) {
        domains.apply(d, scores);
    }
    EXPECT_EQ(scores, before);
    EXPECT_EQ(domains.modifier(4).intensity, 1u);
}

TEST_F(DomainModelTest, ApplyAddsScaledBias) {
    DomainModifier m;
    m.bias = {-5, 0, 0, 0, 0, 2, 3};
    m.intensity = 4;
    domains.set_modifier(2, m);

    ClassScores scores{};
    domains.apply(2, scores);
    EXPECT_EQ(scores[0], -200);
    EXPECT_EQ(scores[3], 0);
    EXPECT_EQ(scores[5], 80);
    EXPECT_EQ(scores[6], 120);
}

TEST_F(DomainModelTest, GeneralAndZeroIntensityNeverModify) {
    DomainModifier m;
    m.bias = {9, 9, 9, 9, 9, 9, 9};
    m.intensity = 10;
    domains.set_modifier(0, m);

    ClassScores scores{};
    domains.apply(0, scores);
    EXPECT_EQ(scores, ClassScores{});

    m.intensity = 0;
    domains.set_modifier(8, m);
    domains.apply(8, scores);
    EXPECT_EQ(scores, ClassScores{});
}

TEST_F(DomainModelTest, SetModifierValidates) {
    DomainModifier m;
    EXPECT_THROW(domains.set_modifier(constants::NUM_DOMAINS, m), ValidationError);
    EXPECT_THROW(domains.set_modifier(-1, m), ValidationError);

    m.intensity = 101;
    EXPECT_THROW(domains.set_modifier(1, m), ValidationError);
    EXPECT_EQ(domains.modifier(1).intensity, 1u);

    m.intensity = 100;
    EXPECT_NO_THROW(domains.set_modifier(1, m));
    EXPECT_EQ(domains.modifier(1).intensity, 100u);
}
