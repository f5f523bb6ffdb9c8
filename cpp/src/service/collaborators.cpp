#include "polarity/collaborators.hpp"
#include "polarity/error.hpp"
#include "polarity/logging.hpp"

#include <chrono>
#include <utility>

namespace polarity {

RoleRegistry::RoleRegistry(CallerId owner) : owner_(std::move(owner)) {}

bool RoleRegistry::is_trainer(const CallerId& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caller == owner_ || trainers_.count(caller) != 0;
}

bool RoleRegistry::is_pauser(const CallerId& caller) const {
    return caller == owner_;
}

bool RoleRegistry::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

void RoleRegistry::set_paused(bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = paused;
}

void RoleRegistry::grant_trainer(const CallerId& granter, const CallerId& trainer) {
    if (granter != owner_) {
        throw PermissionError("Only the owner may grant the trainer role", granter);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    trainers_.insert(trainer);
}

void RoleRegistry::revoke_trainer(const CallerId& granter, const CallerId& trainer) {
    if (granter != owner_) {
        throw PermissionError("Only the owner may revoke the trainer role", granter);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    trainers_.erase(trainer);
}

void LoggingEventSink::on_classification(const ClassificationEvent& event) {
    LOG_INFO("SentimentClassified caller=", event.caller,
             " class=", event.sentiment_class, " (", class_name(event.sentiment_class), ")",
             " confidence=", event.confidence,
             " domain=", domain_name(event.domain),
             " input=\"", event.input_text, "\"");
}

void LoggingEventSink::on_vocabulary_updated(const VocabularyUpdateEvent& event) {
    LOG_INFO("VocabularyUpdated count=", event.count, " trainer=", event.trainer);
}

Timestamp SystemClock::now() const {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

} // namespace polarity
