// =============================================================================
// collaborators.hpp - Interfaces the engine consumes but does not own
// =============================================================================
// Access control, the pause switch, notifications and time all come from
// outside the core. Default in-process implementations are provided for
// embedding the engine in a single process and for tests.
// =============================================================================

#pragma once

#include "polarity/types.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace polarity {

// =============================================================================
// Access Control
// =============================================================================

class AccessControl {
public:
    virtual ~AccessControl() = default;

    virtual bool is_trainer(const CallerId& caller) const = 0;
    virtual bool is_pauser(const CallerId& caller) const = 0;
    virtual bool paused() const = 0;
    virtual void set_paused(bool paused) = 0;
};

/**
 * Owner-rooted role table. The owner holds every role and may grant or
 * revoke the trainer role.
 */
class RoleRegistry : public AccessControl {
public:
    explicit RoleRegistry(CallerId owner);

    bool is_trainer(const CallerId& caller) const override;
    bool is_pauser(const CallerId& caller) const override;
    bool paused() const override;
    void set_paused(bool paused) override;

    void grant_trainer(const CallerId& granter, const CallerId& trainer);
    void revoke_trainer(const CallerId& granter, const CallerId& trainer);

    const CallerId& owner() const noexcept { return owner_; }

private:
    CallerId owner_;
    std::set<CallerId> trainers_;
    bool paused_ = false;
    mutable std::mutex mutex_;
};

// =============================================================================
// Notifications
// =============================================================================

struct ClassificationEvent {
    CallerId caller;
    int sentiment_class = 0;
    int64_t confidence = 0;
    std::string input_text;
    int domain = 0;
};

struct VocabularyUpdateEvent {
    size_t count = 0;
    CallerId trainer;
};

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_classification(const ClassificationEvent& event) = 0;
    virtual void on_vocabulary_updated(const VocabularyUpdateEvent& event) = 0;
};

// Writes every event through the logger at INFO
class LoggingEventSink : public EventSink {
public:
    void on_classification(const ClassificationEvent& event) override;
    void on_vocabulary_updated(const VocabularyUpdateEvent& event) override;
};

// Keeps events in memory, in emission order
class RecordingEventSink : public EventSink {
public:
    void on_classification(const ClassificationEvent& event) override {
        classifications.push_back(event);
    }
    void on_vocabulary_updated(const VocabularyUpdateEvent& event) override {
        vocabulary_updates.push_back(event);
    }

    std::vector<ClassificationEvent> classifications;
    std::vector<VocabularyUpdateEvent> vocabulary_updates;
};

// =============================================================================
// Time
// =============================================================================

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Externally driven time, e.g. the timestamp of the log entry being replayed
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(Timestamp t) noexcept { now_ = t; }
    void advance(Timestamp seconds) noexcept { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace polarity
