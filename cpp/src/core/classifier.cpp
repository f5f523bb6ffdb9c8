#include "polarity/classifier.hpp"
#include "polarity/similarity.hpp"
#include "polarity/fixed_point.hpp"
#include "polarity/error.hpp"
#include "polarity/logging.hpp"

#include <tuple>

namespace polarity {

void Classifier::validate(const std::vector<TokenId>& tokens, const VocabularyStore& vocab) {
    if (tokens.size() < constants::MIN_INPUT_TOKENS) {
        throw ValidationError(ErrorCode::EMPTY_INPUT, "Input contains no tokens", "classify",
                              "Supply between 1 and 16 token ids");
    }
    if (tokens.size() > constants::MAX_INPUT_TOKENS) {
        throw ValidationError(ErrorCode::INPUT_TOO_LONG,
                              "Input has " + std::to_string(tokens.size()) + " tokens, limit is 16",
                              "classify", "Supply between 1 and 16 token ids");
    }
    if (vocab.empty()) {
        throw ValidationError(ErrorCode::VOCABULARY_EMPTY, "Vocabulary is not initialised", "classify",
                              "Upload a vocabulary before classifying");
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!vocab.contains(tokens[i])) {
            throw ValidationError(ErrorCode::TOKEN_OUT_OF_RANGE,
                                  "tokens[" + std::to_string(i) + "] = " + std::to_string(tokens[i]) +
                                  " is not below vocabulary size " + std::to_string(vocab.size()),
                                  "classify");
        }
    }
}

ScoringTrace Classifier::score(const EngineState& state,
                               const UserContext& context,
                               const std::vector<TokenId>& tokens,
                               Timestamp now) {
    const VocabularyStore& vocab = state.vocabulary;
    const SimilarityEngine sim(vocab, state.cooccurrence);
    ScoringTrace trace;

    trace.domain = DomainModel::detect(tokens, vocab);

    // Aggregate weight-scaled embeddings and sentiment
    for (TokenId id : tokens) {
        const TokenMetadata& meta = vocab.metadata(id);
        int64_t weight = meta.weight;
        if (meta.context_influence != 0) {
            weight *= meta.context_influence;
        }
        trace.semantic += vocab.semantic(id).cast<int64_t>() * weight;
        trace.context += vocab.context(id).cast<int64_t>() * weight;
        trace.total_sentiment += static_cast<int64_t>(meta.sentiment) * weight;
        trace.total_weight += weight;
    }
    if (trace.total_weight > 0) {
        fixed::divide_guarded(trace.semantic, trace.total_weight);
        fixed::divide_guarded(trace.context, trace.total_weight);
        trace.total_sentiment /= trace.total_weight;
    }

    // Contributions shared by every class
    if (context.is_recent(now)) {
        trace.recency_bonus = sim.similarity(tokens.front(), context.last_input_token, true) / RECENCY_DIVISOR;
    }
    for (TokenId topic : context.topic_buffer) {
        if (topic == 0) continue;
        for (TokenId id : tokens) {
            trace.topic_bonus += sim.similarity(id, topic, false) / TOPIC_DIVISOR;
        }
    }

    for (int c = 0; c < constants::NUM_CLASSES; ++c) {
        int64_t s = fixed::scaled_dot(trace.semantic, vocab.class_semantic(c));
        s += fixed::scaled_dot(trace.context, vocab.class_context(c));
        s += trace.total_sentiment * SENTIMENT_MULTIPLIER;
        s += trace.recency_bonus;
        s += trace.topic_bonus;
        trace.base_scores[c] = s;
    }

    trace.scores = trace.base_scores;
    state.domains.apply(trace.domain, trace.scores);
    context.apply_adaptation(trace.scores);

    std::tie(trace.winner, trace.confidence) = decide(trace.scores);
    return trace;
}

std::pair<int, int64_t> Classifier::decide(const ClassScores& scores) noexcept {
    int winner = 0;
    int64_t max_score = scores[0];
    for (int c = 1; c < constants::NUM_CLASSES; ++c) {
        if (scores[c] > max_score) {
            max_score = scores[c];
            winner = c;
        }
    }

    // Shift so the winner lands on exactly CONFIDENCE_BASE. Losers far below
    // the max go negative and can push the sum below 1000; that is not clamped.
    const int64_t offset = CONFIDENCE_BASE - max_score;
    int64_t sum = 0;
    for (int64_t s : scores) {
        sum += s + offset;
    }
    const int64_t confidence = sum > 0 ? (scores[winner] + offset) * CONFIDENCE_BASE / sum : 0;
    return {winner, confidence};
}

ClassificationResult Classifier::classify(const CallerId& caller,
                                          const std::vector<TokenId>& tokens,
                                          Timestamp now) {
    validate(tokens, state_.vocabulary);

    // Everything that can allocate happens before the first mutation
    ClassificationResult result;
    result.input_text = state_.vocabulary.reconstruct_text(tokens);
    UserContext& context = state_.users.get_or_create(caller);

    for (TokenId id : tokens) {
        state_.vocabulary.record_usage(id);
    }
    state_.cooccurrence.record(tokens, state_.vocabulary);

    const ScoringTrace trace = score(state_, context, tokens, now);

    context.record(tokens.front(), trace.winner, trace.domain, now);
    state_.statistics.record(trace.winner);

    result.sentiment_class = trace.winner;
    result.confidence = trace.confidence;
    result.domain = trace.domain;

    LOG_DEBUG("caller=", caller, " class=", trace.winner, " confidence=", trace.confidence,
              " domain=", trace.domain, " weight=", trace.total_weight,
              " sentiment=", trace.total_sentiment);
    return result;
}

} // namespace polarity
