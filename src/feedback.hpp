#pragma once

#include <vector>


enum class FeedbackEvent { Pickup, Snap, Completion };

class FeedbackSink {
public:
    virtual ~FeedbackSink() = default;
    virtual void notify(FeedbackEvent event) = 0;

    static const char* to_string(FeedbackEvent event);
};

class NullFeedback : public FeedbackSink {
public:
    void notify(FeedbackEvent) override {}
};

class ConsoleFeedback : public FeedbackSink {
public:
    explicit ConsoleFeedback(bool enabled = true) : enabled(enabled) {}

    void notify(FeedbackEvent event) override;

    void enable() { enabled = true; }
    void disable() { enabled = false; }
    bool toggle() { enabled = !enabled; return enabled; }
    bool is_enabled() const { return enabled; }

private:
    bool enabled;
};

// Keeps every event, for tests and replays
class RecordingFeedback : public FeedbackSink {
public:
    void notify(FeedbackEvent event) override { events.push_back(event); }

    int count(FeedbackEvent event) const;

    std::vector<FeedbackEvent> events;
};
