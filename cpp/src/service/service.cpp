#include "polarity/service.hpp"
#include "polarity/classifier.hpp"
#include "polarity/similarity.hpp"
#include "polarity/error.hpp"
#include "polarity/logging.hpp"

#include <utility>

namespace polarity {

SentimentService::SentimentService(AccessControl& access, EventSink& events, const Clock& clock,
                                   EngineState state)
    : access_(access), events_(events), clock_(clock), state_(std::move(state)) {}

void SentimentService::require_trainer(const CallerId& caller, const char* operation) const {
    if (!access_.is_trainer(caller)) {
        LOG_WARN("Rejected ", operation, " from ", caller, ": trainer role required");
        throw PermissionError("Trainer role required", std::string(operation) + " by " + caller);
    }
}

void SentimentService::require_running(const char* operation) const {
    if (access_.paused()) {
        throw SuspendedError(operation);
    }
}

// =============================================================================
// Classification
// =============================================================================

ClassificationResult SentimentService::classify_sentiment(const CallerId& caller,
                                                          const std::vector<TokenId>& tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_running("classify_sentiment");

    ClassificationResult result;
    try {
        result = Classifier(state_).classify(caller, tokens, clock_.now());
    } catch (const ValidationError& e) {
        LOG_WARN("Classification rejected for ", caller, ": ", e.what());
        throw;
    }

    events_.on_classification(ClassificationEvent{
        caller, result.sentiment_class, result.confidence, result.input_text, result.domain});
    return result;
}

// =============================================================================
// Trainer Mutations
// =============================================================================

void SentimentService::set_vocabulary(const CallerId& caller, const VocabularyBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_trainer(caller, "set_vocabulary");
    require_running("set_vocabulary");
    try {
        state_.vocabulary.set_vocabulary(batch);
    } catch (const ValidationError& e) {
        LOG_WARN("Vocabulary batch from ", caller, " rejected: ", e.what());
        throw;
    }

    events_.on_vocabulary_updated(VocabularyUpdateEvent{batch.size(), caller});
}

void SentimentService::set_embedding(const CallerId& caller, TokenId id,
                                     const SemanticVector& semantic, const ContextVector& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_trainer(caller, "set_embedding");
    require_running("set_embedding");
    state_.vocabulary.set_embedding(id, semantic, context);
}

void SentimentService::set_class_weights(const CallerId& caller, int cls,
                                         const SemanticVector& semantic, const ContextVector& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_trainer(caller, "set_class_weights");
    require_running("set_class_weights");
    state_.vocabulary.set_class_weights(cls, semantic, context);
}

void SentimentService::set_domain_modifier(const CallerId& caller, int domain, const DomainModifier& modifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_trainer(caller, "set_domain_modifier");
    require_running("set_domain_modifier");
    state_.domains.set_modifier(domain, modifier);
}

void SentimentService::add_phrase(const CallerId& caller, const std::string& phrase,
                                  const std::vector<TokenId>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_trainer(caller, "add_phrase");
    require_running("add_phrase");
    state_.vocabulary.add_phrase(phrase, ids);
}

// =============================================================================
// Pause / Resume
// =============================================================================

void SentimentService::pause(const CallerId& caller) {
    if (!access_.is_pauser(caller)) {
        throw PermissionError("Pauser role required", "pause by " + caller);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    access_.set_paused(true);
    LOG_INFO("Engine paused by ", caller);
}

void SentimentService::unpause(const CallerId& caller) {
    if (!access_.is_pauser(caller)) {
        throw PermissionError("Pauser role required", "unpause by " + caller);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    access_.set_paused(false);
    LOG_INFO("Engine resumed by ", caller);
}

bool SentimentService::paused() const {
    return access_.paused();
}

// =============================================================================
// Accessors
// =============================================================================

std::string SentimentService::word(TokenId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.vocabulary.word(id);
}

std::optional<TokenId> SentimentService::token_id(const std::string& word) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.vocabulary.find(word);
}

TokenMetadata SentimentService::token_metadata(TokenId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id >= constants::VOCAB_CAP) {
        throw ValidationError(ErrorCode::TOKEN_OUT_OF_RANGE,
                              "Token id " + std::to_string(id) + " is outside the vocabulary cap",
                              "token_metadata");
    }
    return state_.vocabulary.metadata(id);
}

uint32_t SentimentService::vocabulary_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.vocabulary.size();
}

uint64_t SentimentService::total_classifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.statistics.total_classifications;
}

uint64_t SentimentService::correct_predictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.statistics.correct_predictions;
}

uint64_t SentimentService::class_distribution(int cls) const {
    if (cls < 0 || cls >= constants::NUM_CLASSES) {
        throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                              "Class " + std::to_string(cls) + " is outside [0, 7)",
                              "class_distribution");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.statistics.class_distribution[cls];
}

size_t SentimentService::phrase_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.vocabulary.phrase_count();
}

UserContext SentimentService::user_context(const CallerId& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.users.get(caller);
}

int64_t SentimentService::similarity(TokenId a, TokenId b, bool include_context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SimilarityEngine(state_.vocabulary, state_.cooccurrence).similarity(a, b, include_context);
}

EngineState SentimentService::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SentimentService::restore(EngineState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(state);
}

} // namespace polarity
