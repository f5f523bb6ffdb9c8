#pragma once

#include "polarity/types.hpp"
#include "polarity/engine_state.hpp"

#include <utility>
#include <vector>

namespace polarity {

/**
 * Intermediate values of one scoring pass. Exposed so callers can inspect
 * how a decision was reached; scoring itself never mutates state.
 */
struct ScoringTrace {
    int domain = 0;
    SemanticAccum semantic = SemanticAccum::Zero();
    ContextAccum context = ContextAccum::Zero();
    int64_t total_sentiment = 0;
    int64_t total_weight = 0;
    int64_t recency_bonus = 0;
    int64_t topic_bonus = 0;
    ClassScores base_scores{};   // before domain and user modulation
    ClassScores scores{};        // final scores used for the decision
    int winner = constants::NEUTRAL_CLASS;
    int64_t confidence = 0;
};

/**
 * Classification Orchestrator
 *
 * validate -> pre-update -> detect domain -> aggregate -> score -> modulate
 * -> decide -> commit. Validation failures throw before any mutation; every
 * later stage is infallible for valid input.
 */
class Classifier {
public:
    static constexpr int64_t SENTIMENT_MULTIPLIER = 15;
    static constexpr int64_t RECENCY_DIVISOR = 10;
    static constexpr int64_t TOPIC_DIVISOR = 20;
    static constexpr int64_t CONFIDENCE_BASE = 1000;

    explicit Classifier(EngineState& state) noexcept : state_(state) {}

    /**
     * Full classification call for one caller. Throws ValidationError on
     * empty or oversized input, empty vocabulary, or an unknown token id.
     */
    ClassificationResult classify(const CallerId& caller,
                                  const std::vector<TokenId>& tokens,
                                  Timestamp now);

    static void validate(const std::vector<TokenId>& tokens, const VocabularyStore& vocab);

    // Steps 3-7 as a pure function of state, caller context and input
    static ScoringTrace score(const EngineState& state,
                              const UserContext& context,
                              const std::vector<TokenId>& tokens,
                              Timestamp now);

    // First strict maximum and its shift-and-normalise confidence
    static std::pair<int, int64_t> decide(const ClassScores& scores) noexcept;

private:
    EngineState& state_;
};

} // namespace polarity
