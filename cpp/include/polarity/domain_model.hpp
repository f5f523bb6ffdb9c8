#pragma once

#include "polarity/types.hpp"

#include <array>
#include <vector>

namespace polarity {

class VocabularyStore;

struct DomainModifier {
    std::array<int32_t, constants::NUM_CLASSES> bias{};
    uint32_t intensity = 1;
};

/**
 * Domain Model
 *
 * Per-domain class bias and intensity. Domain 0 ("general") never modifies
 * scores. Every domain starts neutral: zero bias, intensity 1.
 */
class DomainModel {
public:
    DomainModel();

    void set_modifier(int domain, const DomainModifier& modifier);
    const DomainModifier& modifier(int domain) const { return modifiers_.at(domain); }

    /**
     * Sum each token's domain strength into its domain-relevance bucket and
     * return the bucket with the strictly highest score. Domain 0 holds the
     * baseline; ties keep the lower index.
     */
    static int detect(const std::vector<TokenId>& tokens, const VocabularyStore& vocab);

    // score[c] += bias[c] * intensity * 10 unless domain is general or intensity is 0
    void apply(int domain, ClassScores& scores) const;

private:
    std::array<DomainModifier, constants::NUM_DOMAINS> modifiers_;
};

} // namespace polarity
