#pragma once

#include "polarity/types.hpp"

#include <vector>

namespace polarity {

class VocabularyStore;

/**
 * Co-occurrence Tracker
 *
 * Dense VOCAB_CAP x VOCAB_CAP matrix of saturating 16-bit counters.
 * Counts are symmetric and never decrease.
 */
class CooccurrenceMatrix {
public:
    CooccurrenceMatrix();

    // Raw counter for (a, b); 0 when either id is outside the cap
    uint16_t count(TokenId a, TokenId b) const noexcept;

    /**
     * Record one classification input: every pair of positions i < j with
     * differing ids bumps (a,b) and (b,a). The vocabulary's per-token
     * co-occurrence summary is bumped once per directed increment.
     */
    void record(const std::vector<TokenId>& tokens, VocabularyStore& vocab);

    // Single symmetric increment (saturating)
    void increment(TokenId a, TokenId b) noexcept;

    // Restore path for the durable-state repository
    void set(TokenId a, TokenId b, uint16_t value) noexcept;

    // Number of nonzero directed cells
    size_t nonzero() const noexcept;

    template<typename Func>
    void for_each_nonzero(Func&& func) const {
        for (TokenId a = 0; a < constants::VOCAB_CAP; ++a) {
            for (TokenId b = 0; b < constants::VOCAB_CAP; ++b) {
                uint16_t c = counts_[index(a, b)];
                if (c != 0) func(a, b, c);
            }
        }
    }

private:
    static size_t index(TokenId a, TokenId b) noexcept {
        return static_cast<size_t>(a) * constants::VOCAB_CAP + b;
    }

    std::vector<uint16_t> counts_;
};

} // namespace polarity
