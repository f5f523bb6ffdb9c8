#pragma once

#include "polarity/types.hpp"

namespace polarity {

class VocabularyStore;
class CooccurrenceMatrix;

/**
 * Similarity Engine
 *
 * Token-to-token score built from fixed-point embedding dot products plus
 * categorical, domain, co-occurrence and polarity bonuses. Read-only over
 * the stores it is constructed with.
 */
class SimilarityEngine {
public:
    static constexpr int64_t SAME_CATEGORY_BONUS = 150;
    static constexpr int64_t SECONDARY_CATEGORY_BONUS = 75;
    static constexpr int64_t SAME_DOMAIN_BONUS = 100;
    static constexpr int64_t COOCCURRENCE_BONUS = 5;
    static constexpr int64_t SAME_POLARITY_BONUS = 50;
    static constexpr int64_t OPPOSITE_POLARITY_PENALTY = -30;

    SimilarityEngine(const VocabularyStore& vocab, const CooccurrenceMatrix& cooccurrence) noexcept
        : vocab_(vocab), cooccurrence_(cooccurrence) {}

    // 0 when either id is outside the current vocabulary
    int64_t similarity(TokenId a, TokenId b, bool include_context) const;

private:
    const VocabularyStore& vocab_;
    const CooccurrenceMatrix& cooccurrence_;
};

} // namespace polarity
