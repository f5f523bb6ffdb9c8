#include "polarity/cooccurrence.hpp"
#include "polarity/vocabulary.hpp"

#include <algorithm>

namespace polarity {

CooccurrenceMatrix::CooccurrenceMatrix()
    : counts_(static_cast<size_t>(constants::VOCAB_CAP) * constants::VOCAB_CAP, 0) {}

uint16_t CooccurrenceMatrix::count(TokenId a, TokenId b) const noexcept {
    if (a >= constants::VOCAB_CAP || b >= constants::VOCAB_CAP) return 0;
    return counts_[index(a, b)];
}

void CooccurrenceMatrix::increment(TokenId a, TokenId b) noexcept {
    saturating_increment(counts_[index(a, b)], constants::COOCCURRENCE_MAX);
    saturating_increment(counts_[index(b, a)], constants::COOCCURRENCE_MAX);
}

void CooccurrenceMatrix::record(const std::vector<TokenId>& tokens, VocabularyStore& vocab) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        for (size_t j = i + 1; j < tokens.size(); ++j) {
            if (tokens[i] == tokens[j]) continue;
            increment(tokens[i], tokens[j]);
            vocab.record_cooccurrence(tokens[i]);
            vocab.record_cooccurrence(tokens[j]);
        }
    }
}

void CooccurrenceMatrix::set(TokenId a, TokenId b, uint16_t value) noexcept {
    if (a >= constants::VOCAB_CAP || b >= constants::VOCAB_CAP) return;
    counts_[index(a, b)] = value;
}

size_t CooccurrenceMatrix::nonzero() const noexcept {
    return static_cast<size_t>(std::count_if(counts_.begin(), counts_.end(),
                                              [](uint16_t c) { return c != 0; }));
}

} // namespace polarity
