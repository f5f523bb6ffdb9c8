#pragma once

#include "polarity/types.hpp"
#include "polarity/engine_state.hpp"
#include "polarity/collaborators.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace polarity {

/**
 * Sentiment Service
 *
 * Public entry points over one EngineState. Every call, read or write, runs
 * under a single mutex so calls are serialised exactly as in the replicated
 * log. Permission and pause checks are delegated to the AccessControl
 * collaborator and happen before any engine code runs.
 */
class SentimentService {
public:
    SentimentService(AccessControl& access, EventSink& events, const Clock& clock,
                     EngineState state = EngineState{});

    SentimentService(const SentimentService&) = delete;
    SentimentService& operator=(const SentimentService&) = delete;

    // Open to any caller; requires the engine not to be paused
    ClassificationResult classify_sentiment(const CallerId& caller, const std::vector<TokenId>& tokens);

    // Trainer-level mutations
    void set_vocabulary(const CallerId& caller, const VocabularyBatch& batch);
    void set_embedding(const CallerId& caller, TokenId id,
                       const SemanticVector& semantic, const ContextVector& context);
    void set_class_weights(const CallerId& caller, int cls,
                           const SemanticVector& semantic, const ContextVector& context);
    void set_domain_modifier(const CallerId& caller, int domain, const DomainModifier& modifier);
    void add_phrase(const CallerId& caller, const std::string& phrase, const std::vector<TokenId>& ids);

    // Kill switch
    void pause(const CallerId& caller);
    void unpause(const CallerId& caller);
    bool paused() const;

    // Read-only accessors
    std::string word(TokenId id) const;
    std::optional<TokenId> token_id(const std::string& word) const;
    TokenMetadata token_metadata(TokenId id) const;
    uint32_t vocabulary_size() const;
    uint64_t total_classifications() const;
    uint64_t correct_predictions() const;
    uint64_t class_distribution(int cls) const;
    size_t phrase_count() const;
    UserContext user_context(const CallerId& caller) const;
    int64_t similarity(TokenId a, TokenId b, bool include_context) const;

    // Consistent copy of the whole state, for persistence
    EngineState snapshot() const;
    void restore(EngineState state);

private:
    void require_trainer(const CallerId& caller, const char* operation) const;
    void require_running(const char* operation) const;

    AccessControl& access_;
    EventSink& events_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    EngineState state_;
};

} // namespace polarity
