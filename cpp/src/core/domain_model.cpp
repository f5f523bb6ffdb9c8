#include "polarity/domain_model.hpp"
#include "polarity/vocabulary.hpp"
#include "polarity/error.hpp"

namespace polarity {

DomainModel::DomainModel() {
    for (auto& m : modifiers_) {
        m.bias.fill(0);
        m.intensity = 1;
    }
}

void DomainModel::set_modifier(int domain, const DomainModifier& modifier) {
    if (domain < 0 || domain >= constants::NUM_DOMAINS) {
        throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                              "Domain " + std::to_string(domain) + " is outside [0, 10)",
                              "set_domain_modifier");
    }
    POLARITY_CHECK_ARGUMENT(modifier.intensity <= constants::MAX_DOMAIN_INTENSITY,
                            "Intensity " + std::to_string(modifier.intensity) + " exceeds 100");
    modifiers_[domain] = modifier;
}

int DomainModel::detect(const std::vector<TokenId>& tokens, const VocabularyStore& vocab) {
    std::array<int64_t, constants::NUM_DOMAINS> scores{};

    for (TokenId id : tokens) {
        const TokenMetadata& meta = vocab.metadata(id);
        if (meta.domain_strength != 0 && meta.domain_relevance < constants::NUM_DOMAINS) {
            scores[meta.domain_relevance] += meta.domain_strength;
        }
    }

    int best = 0;
    int64_t best_score = scores[0];
    for (int d = 1; d < constants::NUM_DOMAINS; ++d) {
        if (scores[d] > best_score) {
            best_score = scores[d];
            best = d;
        }
    }
    return best;
}

void DomainModel::apply(int domain, ClassScores& scores) const {
    if (domain <= 0 || domain >= constants::NUM_DOMAINS) return;

    const DomainModifier& m = modifiers_[domain];
    if (m.intensity == 0) return;

    for (int c = 0; c < constants::NUM_CLASSES; ++c) {
        scores[c] += static_cast<int64_t>(m.bias[c]) * m.intensity * 10;
    }
}

} // namespace polarity
