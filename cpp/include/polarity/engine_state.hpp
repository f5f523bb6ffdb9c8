// =============================================================================
// engine_state.hpp - The single owned store of all engine state
// =============================================================================
// Everything a replica must agree on lives here. Copying an EngineState gives
// an independent snapshot; the classifier and the durable-state repository
// take it by reference.
// =============================================================================

#pragma once

#include "polarity/types.hpp"
#include "polarity/vocabulary.hpp"
#include "polarity/cooccurrence.hpp"
#include "polarity/domain_model.hpp"
#include "polarity/user_context.hpp"

#include <array>

namespace polarity {

struct GlobalStatistics {
    uint64_t total_classifications = 0;
    // Reserved for a feedback path; nothing in the engine increments it
    uint64_t correct_predictions = 0;
    std::array<uint64_t, constants::NUM_CLASSES> class_distribution{};

    void record(int winning_class) noexcept {
        ++total_classifications;
        ++class_distribution[winning_class];
    }
};

struct EngineState {
    VocabularyStore vocabulary;
    CooccurrenceMatrix cooccurrence;
    DomainModel domains;
    UserContextStore users;
    GlobalStatistics statistics;
};

} // namespace polarity
