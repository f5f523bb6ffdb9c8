// =============================================================================
// User Context Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polarity/user_context.hpp"

using namespace polarity;

class UserContextTest : public ::testing::Test {
protected:
    UserContext ctx;
};

TEST_F(UserContextTest, FreshContextIsZero) {
    EXPECT_FALSE(ctx.has_history());
    EXPECT_FALSE(ctx.is_recent(0));
    EXPECT_EQ(ctx.topic_buffer[0], 0u);
    EXPECT_EQ(ctx.sentiment_bias, 0);
}

TEST_F(UserContextTest, FreshContextLeavesScoresAlone) {
    ClassScores scores{1, 2, 3, 4, 5, 6, 7};
    const ClassScores before = scores;
    ctx.apply_adaptation(scores);
    EXPECT_EQ(scores, before);
}

TEST_F(UserContextTest, SentimentBiasShiftsPolarClasses) {
    ctx.sentiment_bias = 3;
    ClassScores scores{};
    ctx.apply_adaptation(scores);

    EXPECT_EQ(scores[0], -60);
    EXPECT_EQ(scores[2], -60);
    EXPECT_EQ(scores[3], 0);
    EXPECT_EQ(scores[4], 60);
    EXPECT_EQ(scores[6], 60);
}

TEST_F(UserContextTest, HistoryReinforcesPastClasses) {
    ctx.record(5, 4, 0, 100);
    ctx.record(5, 4, 0, 200);
    ctx.record(5, 1, 0, 300);

    ClassScores scores{};
    ctx.apply_adaptation(scores);
    EXPECT_EQ(scores[4], 10);
    EXPECT_EQ(scores[1], 5);
    EXPECT_EQ(scores[0], 0);
}

TEST_F(UserContextTest, RecordUpdatesFields) {
    ctx.record(12, 5, 3, 1000);

    EXPECT_EQ(ctx.last_interaction, 1000);
    EXPECT_EQ(ctx.last_input_token, 12u);
    EXPECT_EQ(ctx.primary_domain, 3);
    EXPECT_EQ(ctx.class_history[5], 1);
    EXPECT_EQ(ctx.total_interactions, 1);

    // A general-domain call keeps the previous primary domain
    ctx.record(13, 5, 0, 1010);
    EXPECT_EQ(ctx.primary_domain, 3);
}

TEST_F(UserContextTest, TopicBufferShiftsNewestFirst) {
    ctx.record(2, 3, 0, 1);
    ctx.record(3, 3, 0, 2);
    ctx.record(4, 3, 0, 3);
    EXPECT_EQ(ctx.topic_buffer[0], 4u);
    EXPECT_EQ(ctx.topic_buffer[1], 3u);
    EXPECT_EQ(ctx.topic_buffer[2], 2u);

    ctx.record(9, 3, 0, 4);
    EXPECT_EQ(ctx.topic_buffer[0], 9u);
    EXPECT_EQ(ctx.topic_buffer[1], 4u);
    EXPECT_EQ(ctx.topic_buffer[2], 3u);
}

TEST_F(UserContextTest, RecencyWindow) {
    ctx.record(1, 3, 0, 10000);
    EXPECT_TRUE(ctx.is_recent(10000));
    EXPECT_TRUE(ctx.is_recent(10000 + constants::RECENCY_WINDOW - 1));
    EXPECT_FALSE(ctx.is_recent(10000 + constants::RECENCY_WINDOW));
}

TEST_F(UserContextTest, TokenZeroIsNoPriorToken) {
    ctx.record(0, 3, 0, 10000);
    EXPECT_TRUE(ctx.has_history());
    EXPECT_FALSE(ctx.is_recent(10001));

    ctx.record(5, 3, 0, 10002);
    EXPECT_TRUE(ctx.is_recent(10003));
}

TEST_F(UserContextTest, CountersSaturate) {
    ctx.class_history[2] = constants::CLASS_HISTORY_MAX;
    ctx.total_interactions = constants::INTERACTIONS_MAX;

    ctx.record(1, 2, 0, 5);
    EXPECT_EQ(ctx.class_history[2], constants::CLASS_HISTORY_MAX);
    EXPECT_EQ(ctx.total_interactions, constants::INTERACTIONS_MAX);
}

TEST(UserContextStoreTest, GetDoesNotInsert) {
    UserContextStore store;
    const UserContext& ctx = store.get("nobody");
    EXPECT_FALSE(ctx.has_history());
    EXPECT_FALSE(store.contains("nobody"));
    EXPECT_EQ(store.size(), 0u);

    store.get_or_create("alice").sentiment_bias = 2;
    EXPECT_TRUE(store.contains("alice"));
    EXPECT_EQ(store.get("alice").sentiment_bias, 2);
    EXPECT_EQ(store.size(), 1u);
}
