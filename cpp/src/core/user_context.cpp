#include "polarity/user_context.hpp"

namespace polarity {

void UserContext::apply_adaptation(ClassScores& scores) const {
    if (sentiment_bias != 0) {
        const int64_t shift = static_cast<int64_t>(sentiment_bias) * 20;
        for (int c = constants::NEUTRAL_CLASS + 1; c < constants::NUM_CLASSES; ++c) {
            scores[c] += shift;
        }
        for (int c = 0; c < constants::NEUTRAL_CLASS; ++c) {
            scores[c] -= shift;
        }
    }

    if (has_history()) {
        for (int c = 0; c < constants::NUM_CLASSES; ++c) {
            scores[c] += 5 * static_cast<int64_t>(class_history[c]);
        }
    }
}

void UserContext::record(TokenId first_token, int winning_class, int domain, Timestamp now) {
    last_interaction = now;
    last_input_token = first_token;

    if (domain != 0) {
        primary_domain = static_cast<uint8_t>(domain);
    }

    for (int slot = constants::TOPIC_SLOTS - 1; slot > 0; --slot) {
        topic_buffer[slot] = topic_buffer[slot - 1];
    }
    topic_buffer[0] = first_token;

    saturating_increment(class_history[winning_class], constants::CLASS_HISTORY_MAX);
    saturating_increment(total_interactions, constants::INTERACTIONS_MAX);
}

const UserContext& UserContextStore::get(const CallerId& caller) const {
    static const UserContext empty{};
    auto it = contexts_.find(caller);
    return it != contexts_.end() ? it->second : empty;
}

} // namespace polarity
