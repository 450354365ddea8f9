#include "feedback.hpp"

#include <iostream>
#include <algorithm>


const char* FeedbackSink::to_string(FeedbackEvent event) {
    switch (event) {
        case FeedbackEvent::Pickup:     return "pickup";
        case FeedbackEvent::Snap:       return "snap";
        case FeedbackEvent::Completion: return "completion";
    }
    return "unknown";
}

void ConsoleFeedback::notify(FeedbackEvent event) {
    if (!enabled) {
        return;
    }

    if (event == FeedbackEvent::Completion) {
        std::cout << "\a";
    }
    std::cout << "[" << to_string(event) << "]" << std::endl;
}

int RecordingFeedback::count(FeedbackEvent event) const {
    return static_cast<int>(std::count(events.begin(), events.end(), event));
}
