#include "polarity/similarity.hpp"
#include "polarity/vocabulary.hpp"
#include "polarity/cooccurrence.hpp"
#include "polarity/fixed_point.hpp"

namespace polarity {

int64_t SimilarityEngine::similarity(TokenId a, TokenId b, bool include_context) const {
    if (!vocab_.contains(a) || !vocab_.contains(b)) return 0;

    int64_t score = fixed::scaled_dot(vocab_.semantic(a), vocab_.semantic(b));

    if (include_context) {
        score += fixed::scaled_dot(vocab_.context(a), vocab_.context(b)) / 2;
    }

    const TokenMetadata& ma = vocab_.metadata(a);
    const TokenMetadata& mb = vocab_.metadata(b);

    if (ma.category == mb.category) {
        score += SAME_CATEGORY_BONUS;
    } else if (ma.secondary_category == mb.category || mb.secondary_category == ma.category) {
        score += SECONDARY_CATEGORY_BONUS;
    }

    if (ma.domain_relevance != 0 && ma.domain_relevance == mb.domain_relevance) {
        score += SAME_DOMAIN_BONUS;
    }

    score += COOCCURRENCE_BONUS * cooccurrence_.count(a, b);

    if (ma.sentiment != 0 && mb.sentiment != 0) {
        score += (fixed::sign(ma.sentiment) == fixed::sign(mb.sentiment))
            ? SAME_POLARITY_BONUS : OPPOSITE_POLARITY_PENALTY;
    }

    return score;
}

} // namespace polarity
