#pragma once

#include "polarity/types.hpp"

#include <array>
#include <map>

namespace polarity {

/**
 * Per-caller adaptive state. All fields start at zero.
 * topic_buffer[0] is the most recent first-input token.
 */
struct UserContext {
    Timestamp last_interaction = 0;
    TokenId last_input_token = 0;
    std::array<TokenId, constants::TOPIC_SLOTS> topic_buffer{};
    std::array<uint8_t, constants::NUM_CLASSES> class_history{};
    uint16_t total_interactions = 0;
    int32_t sentiment_bias = 0;
    uint8_t primary_domain = 0;

    bool has_history() const noexcept { return total_interactions > 0; }

    // A prior input token exists and arrived less than RECENCY_WINDOW seconds before now.
    // Token 0 means none, as in the topic buffer.
    bool is_recent(Timestamp now) const noexcept {
        return has_history() && last_input_token != 0 &&
               now - last_interaction < constants::RECENCY_WINDOW;
    }

    /**
     * Bias classes 4..6 up and 0..2 down by sentiment_bias * 20, then
     * reinforce every class by 5 * class_history[c] once any history exists.
     */
    void apply_adaptation(ClassScores& scores) const;

    // Commit one finished classification into this context
    void record(TokenId first_token, int winning_class, int domain, Timestamp now);
};

/**
 * User Context Store
 *
 * Caller id -> context, created lazily. Ordered map so iteration (and thus
 * persistence) is deterministic.
 */
class UserContextStore {
public:
    // Context for caller, or the zero context if none exists yet (not inserted)
    const UserContext& get(const CallerId& caller) const;

    UserContext& get_or_create(const CallerId& caller) { return contexts_[caller]; }

    bool contains(const CallerId& caller) const { return contexts_.count(caller) != 0; }
    size_t size() const noexcept { return contexts_.size(); }

    const std::map<CallerId, UserContext>& all() const noexcept { return contexts_; }

private:
    std::map<CallerId, UserContext> contexts_;
};

} // namespace polarity
